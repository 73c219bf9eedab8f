#pragma once

#include "upecho/core/admission.hpp"
#include "upecho/core/failure.hpp"
#include "upecho/core/iserver.hpp"
#include "upecho/core/options.hpp"
#include "upecho/logging/logger.hpp"
#include "upecho/net/backoff.hpp"
#include "upecho/net/tcp_ops.hpp"
#include "upecho/sessions/sync_session.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <sys/socket.h>
#include <vector>

namespace upecho {

// SyncServer
// Threading model:
// - Run() is the accept loop: it blocks in accept() on the calling thread and
//   does no per-connection work beyond handing the socket to a new SyncSession
//   (one std::jthread each)
// - Only the accept thread touches sessions_; finished sessions are reaped on
//   the next accept and all remaining ones are stopped when Run() exits
// - Stop() shuts the listening socket down, which makes a blocked accept()
//   return on Linux
class SyncServer : public IServer {
public:
  SyncServer(ServerOptions opt, logging::StatusLogger &log)
      : opt_(std::move(opt)), log_(log), admission_(opt_.max_connections),
        acceptor_(ioc_) {}

  ~SyncServer() override {
    Stop();
    for (auto &s : sessions_) {
      s->Stop();
    }
    sessions_.clear();
  }

  Status Bind() override {
    auto st = tcpops::OpenAcceptor(acceptor_, opt_.bind_address, opt_.port);
    if (!st) {
      log_.Error(ToString(FailureKind::bind), " on ", opt_.bind_address, ":",
                 opt_.port, ": ", st.error().message(),
                 " (is the port already taken?)");
      SetState(ServerState::stopped);
      return st;
    }
    error_code ec;
    port_ = acceptor_.local_endpoint(ec).port();
    log_.Info("listening on ", opt_.bind_address, ":", port_,
              " (sync, thread per connection, limit ",
              admission_.Limit() == 0 ? std::string("none")
                                      : std::to_string(admission_.Limit()),
              ")");
    SetState(ServerState::listening);
    return {};
  }

  void Run() override {
    if (State() != ServerState::listening) {
      return;
    }
    retry::AcceptBackoff backoff;
    while (!stop_requested_.load(std::memory_order_acquire)) {
      tcp::socket socket(ioc_);
      error_code ec;
      acceptor_.accept(socket, ec);
      if (ec) {
        if (stop_requested_.load(std::memory_order_acquire)) {
          break;
        }
        // a signal landed on this thread; not an accept failure
        if (ec == net::error::interrupted) {
          continue;
        }
        log_.Warn(ToString(FailureKind::accept), ": ", ec.message());
        retry::SleepFor(backoff.Next());
        continue;
      }
      backoff.Reset();
      ReapFinished();
      Dispatch(std::move(socket));
    }
    Shutdown();
  }

  void Stop() override {
    stop_requested_.store(true, std::memory_order_release);
    std::lock_guard<std::mutex> lock(acceptor_mu_);
    if (acceptor_.is_open()) {
      ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
    }
  }

  ServerState State() const override {
    return state_.load(std::memory_order_acquire);
  }
  unsigned short LocalPort() const override { return port_; }
  std::size_t ActiveConnections() const override {
    return admission_.Active();
  }

private:
  void SetState(ServerState s) {
    state_.store(s, std::memory_order_release);
    state_.notify_all();
  }

  void Dispatch(tcp::socket socket) {
    auto ticket = admission_.TryAdmit();
    if (!ticket) {
      log_.Warn("rejected connection from ", tcpops::FormatEndpoint(socket),
                ": ", admission_.Limit(), " connections in use");
      error_code ec;
      socket.shutdown(tcp::socket::shutdown_both, ec);
      socket.close(ec);
      return;
    }
    tcpops::SetTcpNoDelay(socket);
    auto session = std::make_unique<SyncSession>(
        next_id_++, std::move(socket), std::move(*ticket), log_);
    session->Start();
    sessions_.push_back(std::move(session));
  }

  void ReapFinished() {
    std::erase_if(sessions_, [](const std::unique_ptr<SyncSession> &s) {
      return s->Finished();
    });
  }

  void Shutdown() {
    {
      std::lock_guard<std::mutex> lock(acceptor_mu_);
      error_code ec;
      acceptor_.close(ec);
    }
    for (auto &s : sessions_) {
      s->Stop();
    }
    // joins every worker
    sessions_.clear();
    log_.Info("server stopped");
    SetState(ServerState::stopped);
  }

  ServerOptions opt_;
  logging::StatusLogger &log_;
  AdmissionControl admission_;
  net::io_context ioc_;
  tcp::acceptor acceptor_;
  std::mutex acceptor_mu_;
  unsigned short port_ = 0;
  std::uint64_t next_id_ = 1;
  std::atomic<bool> stop_requested_{false};
  std::atomic<ServerState> state_{ServerState::binding};
  std::vector<std::unique_ptr<SyncSession>> sessions_;
};

} // namespace upecho
