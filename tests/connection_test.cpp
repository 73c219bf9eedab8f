#include "test_support.hpp"
#include "upecho/net/async_connection.hpp"
#include "upecho/net/connection.hpp"
#include <boost/asio/spawn.hpp>
#include <gtest/gtest.h>
#include <thread>

namespace {

using namespace upecho;
using namespace upecho::test;

// A connected loopback socket pair: `peer` plays the remote end.
struct LoopbackPair {
  net::io_context ioc;
  tcp::socket peer{ioc};
  tcp::socket local{ioc};

  LoopbackPair() {
    tcp::acceptor acceptor(ioc, {net::ip::address_v4::loopback(), 0});
    peer.connect(acceptor.local_endpoint());
    acceptor.accept(local);
  }
};

TEST(ConnectionTest, IdleConnectionHasNoIncomingData) {
  LoopbackPair pair;
  Connection conn(std::move(pair.local));
  EXPECT_FALSE(conn.IsClosed());
  EXPECT_FALSE(conn.HasIncomingData());
  EXPECT_FALSE(conn.WaitReadable(20));
}

TEST(ConnectionTest, ReceivesFrameOncePeerSends) {
  LoopbackPair pair;
  Connection conn(std::move(pair.local));
  ASSERT_TRUE(wire::WriteFrame(pair.peer, "ping"));
  EXPECT_TRUE(conn.WaitReadable(kTimeoutMs));
  EXPECT_TRUE(conn.HasIncomingData());
  auto msg = conn.Receive();
  ASSERT_TRUE(msg) << msg.error().message();
  EXPECT_EQ(*msg, "ping");
  EXPECT_FALSE(conn.HasIncomingData());
}

TEST(ConnectionTest, SendWritesOneFrame) {
  LoopbackPair pair;
  Connection conn(std::move(pair.local));
  ASSERT_TRUE(conn.Send("pong"));
  auto msg = wire::Decode(pair.peer);
  ASSERT_TRUE(msg);
  EXPECT_EQ(*msg, "pong");
}

TEST(ConnectionTest, ReceiveWaitsForRestOfPartialFrame) {
  LoopbackPair pair;
  Connection conn(std::move(pair.local));
  const std::string frame = *wire::Encode("split frame");
  net::write(pair.peer, net::buffer(frame.data(), 5));
  ASSERT_TRUE(conn.WaitReadable(kTimeoutMs));
  std::jthread late([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    net::write(pair.peer, net::buffer(frame.data() + 5, frame.size() - 5));
  });
  auto msg = conn.Receive();
  ASSERT_TRUE(msg) << msg.error().message();
  EXPECT_EQ(*msg, "split frame");
}

TEST(ConnectionTest, PeerHangupIsVisibleAndReportsEof) {
  LoopbackPair pair;
  Connection conn(std::move(pair.local));
  pair.peer.close();
  EXPECT_TRUE(conn.WaitReadable(kTimeoutMs));
  EXPECT_TRUE(conn.HasIncomingData());
  auto msg = conn.Receive();
  ASSERT_FALSE(msg);
  EXPECT_EQ(msg.error(), net::error::eof);
}

TEST(ConnectionTest, CloseIsIdempotentAndStopsIo) {
  LoopbackPair pair;
  Connection conn(std::move(pair.local));
  conn.Close();
  conn.Close();
  EXPECT_TRUE(conn.IsClosed());
  EXPECT_FALSE(conn.HasIncomingData());
  auto sent = conn.Send("late");
  ASSERT_FALSE(sent);
  EXPECT_EQ(sent.error(), net::error::not_connected);
  auto got = conn.Receive();
  ASSERT_FALSE(got);
  EXPECT_EQ(got.error(), net::error::not_connected);
  // the peer sees the close
  EXPECT_EQ(wire::Decode(pair.peer).error(), net::error::eof);
}

TEST(ConnectionTest, ReportsRemoteEndpoint) {
  LoopbackPair pair;
  Connection conn(std::move(pair.local));
  EXPECT_EQ(conn.RemoteEndpoint().rfind("127.0.0.1:", 0), 0u);
}

TEST(AsyncConnectionTest, ReceivesAndRepliesInCoroutine) {
  LoopbackPair pair;
  AsyncConnection conn(std::move(pair.local));
  ASSERT_TRUE(wire::WriteFrame(pair.peer, "hi"));
  std::string seen;
  net::spawn(pair.ioc, [&](net::yield_context yield) {
    auto msg = conn.AsyncReceive(yield);
    ASSERT_TRUE(msg);
    seen = *msg;
    ASSERT_TRUE(conn.AsyncSend("HI", yield));
  });
  pair.ioc.run();
  EXPECT_EQ(seen, "hi");
  EXPECT_EQ(wire::Decode(pair.peer).value(), "HI");
}

TEST(AsyncConnectionTest, CloseCancelsPendingReceive) {
  LoopbackPair pair;
  AsyncConnection conn(std::move(pair.local));
  error_code result;
  net::spawn(pair.ioc, [&](net::yield_context yield) {
    auto msg = conn.AsyncReceive(yield);
    ASSERT_FALSE(msg);
    result = msg.error();
  });
  net::post(pair.ioc, [&] { conn.Close(); });
  pair.ioc.run();
  EXPECT_EQ(result, net::error::operation_aborted);
  EXPECT_TRUE(conn.IsClosed());
  EXPECT_FALSE(conn.HasIncomingData());
}

} // namespace
