#include "test_support.hpp"
#include "upecho/client/console.hpp"
#include "upecho/core/runner.hpp"
#include <gtest/gtest.h>
#include <cstdlib>
#include <tuple>

namespace {

using namespace upecho;
using namespace upecho::test;

// One console client session through RunClient, typed line by line.
class ConsoleSession {
public:
  explicit ConsoleSession(const ClientOptions &opt)
      : console_(out_.write_fd, err_.write_fd) {
    thread_ = std::jthread(
        [this, opt] { exit_code_ = RunClient(opt, in_.read_fd, console_); });
  }
  ~ConsoleSession() {
    in_.CloseWrite();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void Type(std::string_view s) { in_.Write(s); }
  std::string OutputUntil(std::string_view needle) {
    return ReadUntil(out_.read_fd, needle);
  }
  std::string ErrorsUntil(std::string_view needle) {
    return ReadUntil(err_.read_fd, needle);
  }
  int Wait() {
    thread_.join();
    return exit_code_;
  }

private:
  Pipe in_;
  Pipe out_;
  Pipe err_;
  Console console_;
  int exit_code_ = -1;
  std::jthread thread_;
};

using ModePair = std::tuple<RunMode, RunMode>; // server, client

class EndToEndTest : public ::testing::TestWithParam<ModePair> {
protected:
  ClientOptions ClientFor(const ServerHarness &server) const {
    ClientOptions opt;
    opt.host = "127.0.0.1";
    opt.port = server.Port();
    opt.mode = std::get<1>(GetParam());
    return opt;
  }
};

TEST_P(EndToEndTest, HelloExitThenSecondClient) {
  ServerHarness server(std::get<0>(GetParam()));
  {
    ConsoleSession first(ClientFor(server));
    first.Type("hello\n");
    const std::string out = first.OutputUntil("HELLO");
    EXPECT_NE(out.find("HELLO"), std::string::npos) << out;
    first.Type("Exit\n");
    EXPECT_EQ(first.Wait(), 0);
    const std::string tail = first.OutputUntil("Connection closed.");
    EXPECT_NE(tail.find("Connection closed."), std::string::npos) << tail;
  }
  EXPECT_TRUE(
      WaitFor([&] { return server.Server().ActiveConnections() == 0; }));

  ConsoleSession second(ClientFor(server));
  second.Type("abc\n");
  const std::string out = second.OutputUntil("ABC");
  EXPECT_NE(out.find("ABC"), std::string::npos) << out;
  second.Type("exit\n");
  EXPECT_EQ(second.Wait(), 0);
}

TEST_P(EndToEndTest, ServerShutdownEndsClientWithFailure) {
  ServerHarness server(std::get<0>(GetParam()));
  ConsoleSession session(ClientFor(server));
  session.Type("ping\n");
  EXPECT_NE(session.OutputUntil("PING").find("PING"), std::string::npos);
  server.StopAndJoin();
  EXPECT_EQ(session.Wait(), 2);
  EXPECT_NE(session.ErrorsUntil("communication error")
                .find("communication error"),
            std::string::npos);
}

std::string ModePairName(const testing::TestParamInfo<ModePair> &info) {
  auto name = [](RunMode m) { return m == RunMode::sync ? "Sync" : "Async"; };
  return std::string(name(std::get<0>(info.param))) + "Server" +
         name(std::get<1>(info.param)) + "Client";
}

INSTANTIATE_TEST_SUITE_P(
    Modes, EndToEndTest,
    ::testing::Combine(::testing::Values(RunMode::sync, RunMode::async),
                       ::testing::Values(RunMode::sync, RunMode::async)),
    ModePairName);

TEST(RunClientTest, NoServerMeansExitCodeOne) {
  unsigned short port = 0;
  {
    net::io_context ioc;
    tcp::acceptor probe(ioc, {net::ip::address_v4::loopback(), 0});
    port = probe.local_endpoint().port();
  }
  ClientOptions opt;
  opt.host = "127.0.0.1";
  opt.port = port;
  Pipe in;
  Pipe out;
  Pipe err;
  Console console(out.write_fd, err.write_fd);
  EXPECT_EQ(RunClient(opt, in.read_fd, console), 1);
  const std::string msg = ReadUntil(err.read_fd, "Is it running?");
  EXPECT_NE(msg.find("Failed to connect"), std::string::npos) << msg;
}

TEST(RunClientTest, FileInputFallsBackToPollLoop) {
  ServerHarness server(RunMode::async);
  char path[] = "/tmp/upecho_script_XXXXXX";
  int fd = ::mkstemp(path);
  ASSERT_NE(fd, -1);
  const std::string script = "abc\n";
  ASSERT_TRUE(io::WriteAll(fd, script.data(), script.size()));
  ::lseek(fd, 0, SEEK_SET);

  ClientOptions opt;
  opt.host = "127.0.0.1";
  opt.port = server.Port();
  opt.mode = RunMode::async;
  Pipe out;
  Pipe err;
  Console console(out.write_fd, err.write_fd);
  // end of the script sends the sentinel on the user's behalf
  EXPECT_EQ(RunClient(opt, fd, console), 0);
  ::close(fd);
  ::unlink(path);
}

} // namespace
