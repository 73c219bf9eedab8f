#pragma once

#include "upecho/core/admission.hpp"
#include "upecho/core/isession.hpp"
#include "upecho/core/protocol.hpp"
#include "upecho/logging/logger.hpp"
#include "upecho/net/async_connection.hpp"
#include "upecho/sessions/session_log.hpp"
#include "upecho/util/branch.hpp"
#include "upecho/util/text.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <memory>
#include <optional>

namespace upecho {

// AsyncSession
// Threading model:
// - Executes as a Boost.Asio coroutine (spawn) on its own strand of the
//   Reactor's io_context, i.e., no dedicated OS thread per session
// - The strand serializes the coroutine and Stop(), so the connection is only
//   ever touched by one handler at a time even with several reactor threads
// - Lifetime is shared by the coroutine and the server's registry; the
//   session is freed when the coroutine returns and the registry lets go
class AsyncSession : public ISession,
                     public std::enable_shared_from_this<AsyncSession> {
public:
  using Strand = net::strand<net::io_context::executor_type>;

  AsyncSession(std::uint64_t id, Strand strand, tcp::socket socket,
               AdmissionControl::Ticket ticket, logging::StatusLogger &log)
      : id_(id), strand_(std::move(strand)), conn_(std::move(socket)),
        ticket_(std::move(ticket)), log_(log) {}

  void Start() override {
    net::spawn(strand_, [self = shared_from_this()](net::yield_context yield) {
      self->Run(yield);
    });
  }

  void Stop() override {
    net::post(strand_, [self = shared_from_this()] {
      self->stopping_ = true;
      self->conn_.Close();
    });
  }

  bool Finished() const override {
    return finished_.load(std::memory_order_acquire);
  }
  std::uint64_t Id() const override { return id_; }

private:
  void Run(net::yield_context yield) {
    log_.Info("[session ", id_, "] accepted connection from ",
              conn_.RemoteEndpoint());
    for (;;) {
      auto msg = conn_.AsyncReceive(yield);
      if (UPECHO_UNLIKELY(!msg)) {
        if (!stopping_) {
          sessions::LogSessionError(log_, id_, "receive", msg.error());
        }
        break;
      }
      if (protocol::IsServerSentinel(*msg)) {
        break;
      }
      auto st = conn_.AsyncSend(text::ToUpper(*msg), yield);
      if (UPECHO_UNLIKELY(!st)) {
        if (!stopping_) {
          sessions::LogSessionError(log_, id_, "send", st.error());
        }
        break;
      }
    }
    conn_.Close();
    log_.Info("[session ", id_, "] connection closed: ",
              conn_.RemoteEndpoint());
    // admission slot goes with the socket, not with the reaped session object
    ticket_.reset();
    finished_.store(true, std::memory_order_release);
  }

  std::uint64_t id_;
  Strand strand_;
  AsyncConnection conn_;
  std::optional<AdmissionControl::Ticket> ticket_;
  logging::StatusLogger &log_;
  bool stopping_ = false;
  std::atomic<bool> finished_{false};
};

} // namespace upecho
