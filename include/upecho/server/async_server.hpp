#pragma once

#include "upecho/core/admission.hpp"
#include "upecho/core/failure.hpp"
#include "upecho/core/iserver.hpp"
#include "upecho/core/options.hpp"
#include "upecho/core/reactor.hpp"
#include "upecho/logging/logger.hpp"
#include "upecho/net/backoff.hpp"
#include "upecho/net/tcp_ops.hpp"
#include "upecho/sessions/async_session.hpp"
#include <algorithm>
#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <memory>
#include <thread>
#include <vector>

namespace upecho {

// AsyncServer
// Threading model:
// - Reactor: one io_context run by a fixed pool of worker threads
// - The accept loop is a coroutine on its own strand; each accepted socket is
//   created on a fresh strand that the session coroutine then runs on
// - sessions_ (weak references, for shutdown) is only touched from the accept
//   strand
// - Run() blocks the calling thread until the accept loop has stopped and the
//   reactor has drained every session
class AsyncServer : public IServer {
public:
  AsyncServer(ServerOptions opt, logging::StatusLogger &log)
      : opt_(std::move(opt)), log_(log), admission_(opt_.max_connections),
        acceptor_(reactor_.GetIoContext()),
        accept_strand_(net::make_strand(reactor_.GetIoContext())) {}

  ~AsyncServer() override { reactor_.Stop(); }

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
    log_.Info("listening on ", opt_.bind_address, ":", port_, " (async, ",
              WorkerCount(), " reactor threads, limit ",
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
    net::spawn(accept_strand_,
               [this](net::yield_context yield) { this->AcceptLoop(yield); });
    reactor_.Start(WorkerCount());
    state_.wait(ServerState::listening, std::memory_order_acquire);
    reactor_.Join();
    log_.Info("server stopped");
  }

  void Stop() override {
    net::post(accept_strand_, [this] {
      stop_requested_ = true;
      error_code ec;
      acceptor_.close(ec);
    });
  }

  ServerState State() const override {
    return state_.load(std::memory_order_acquire);
  }
  unsigned short LocalPort() const override { return port_; }
  std::size_t ActiveConnections() const override {
    return admission_.Active();
  }

private:
  using Strand = AsyncSession::Strand;

  int WorkerCount() const {
    if (opt_.workers > 0) {
      return opt_.workers;
    }
    return std::max(1u, std::thread::hardware_concurrency());
  }

  void SetState(ServerState s) {
    state_.store(s, std::memory_order_release);
    state_.notify_all();
  }

  void AcceptLoop(net::yield_context yield) {
    retry::AcceptBackoff backoff;
    for (;;) {
      Strand strand = net::make_strand(reactor_.GetIoContext());
      error_code ec;
      tcp::socket accepted(strand);
      acceptor_.async_accept(accepted, yield[ec]);
      if (ec) {
        if (stop_requested_) {
          break;
        }
        log_.Warn(ToString(FailureKind::accept), ": ", ec.message());
        retry::AsyncSleepFor(accept_strand_, yield, backoff.Next());
        continue;
      }
      backoff.Reset();
      Dispatch(std::move(strand), std::move(accepted));
    }
    for (auto &weak : sessions_) {
      if (auto s = weak.lock()) {
        s->Stop();
      }
    }
    sessions_.clear();
    SetState(ServerState::stopped);
  }

  void Dispatch(Strand strand, tcp::socket socket) {
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
    std::erase_if(sessions_, [](const std::weak_ptr<AsyncSession> &w) {
      return w.expired();
    });
    auto session =
        std::make_shared<AsyncSession>(next_id_++, std::move(strand),
                                       std::move(socket), std::move(*ticket),
                                       log_);
    sessions_.push_back(session);
    session->Start();
  }

  ServerOptions opt_;
  logging::StatusLogger &log_;
  AdmissionControl admission_;
  Reactor reactor_;
  tcp::acceptor acceptor_;
  Strand accept_strand_;
  unsigned short port_ = 0;
  std::uint64_t next_id_ = 1;
  bool stop_requested_ = false;
  std::atomic<ServerState> state_{ServerState::binding};
  std::vector<std::weak_ptr<AsyncSession>> sessions_;
};

} // namespace upecho
