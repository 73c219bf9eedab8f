#pragma once

#include "upecho/core/admission.hpp"
#include "upecho/core/isession.hpp"
#include "upecho/core/protocol.hpp"
#include "upecho/logging/logger.hpp"
#include "upecho/net/connection.hpp"
#include "upecho/sessions/session_log.hpp"
#include "upecho/util/branch.hpp"
#include "upecho/util/text.hpp"
#include <atomic>
#include <boost/asio/ip/tcp.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <sys/socket.h>
#include <thread>

namespace upecho {

// SyncSession: handler loop for one accepted connection.
// Threading model:
// - Each SyncSession owns a dedicated std::jthread and performs blocking I/O
//   on its Connection; nothing else reads or writes that Connection
// - Between frames the worker waits on socket readiness with a short timeout
//   so the stop token is observed regularly
// - Stop() may be called from the accept thread: it requests stop and shuts
//   the socket down so a read blocked inside a partial frame returns
class SyncSession : public ISession {
public:
  static constexpr int kPollIntervalMs = 200;

  SyncSession(std::uint64_t id, tcp::socket socket,
              AdmissionControl::Ticket ticket, logging::StatusLogger &log)
      : id_(id), native_fd_(socket.native_handle()), conn_(std::move(socket)),
        ticket_(std::move(ticket)), log_(log) {}

  ~SyncSession() override {
    if (worker_.joinable()) {
      Stop();
      worker_.join();
    }
  }

  void Start() override {
    worker_ = std::jthread([this](std::stop_token st) { this->Run(st); });
  }

  void Stop() override {
    worker_.request_stop();
    std::lock_guard<std::mutex> lock(close_mu_);
    if (!conn_.IsClosed()) {
      ::shutdown(native_fd_, SHUT_RDWR);
    }
  }

  bool Finished() const override {
    return finished_.load(std::memory_order_acquire);
  }
  std::uint64_t Id() const override { return id_; }

private:
  void Run(std::stop_token st) {
    log_.Info("[session ", id_, "] accepted connection from ",
              conn_.RemoteEndpoint());
    while (!st.stop_requested()) {
      if (!conn_.HasIncomingData()) {
        (void)conn_.WaitReadable(kPollIntervalMs);
        continue;
      }
      if (!HandleOne(st)) {
        break;
      }
    }
    CloseConnection();
    log_.Info("[session ", id_, "] connection closed: ",
              conn_.RemoteEndpoint());
    // admission slot goes with the socket, not with the reaped session object
    ticket_.reset();
    finished_.store(true, std::memory_order_release);
  }

  // Receive → sentinel check → uppercase → reply. Returns false when the
  // session is over.
  bool HandleOne(const std::stop_token &st) {
    auto msg = conn_.Receive();
    if (UPECHO_UNLIKELY(!msg)) {
      // a shutdown from Stop() surfaces here as eof; not worth a warning
      if (!st.stop_requested()) {
        sessions::LogSessionError(log_, id_, "receive", msg.error());
      }
      return false;
    }
    if (protocol::IsServerSentinel(*msg)) {
      return false;
    }
    auto sent = conn_.Send(text::ToUpper(*msg));
    if (UPECHO_UNLIKELY(!sent)) {
      sessions::LogSessionError(log_, id_, "send", sent.error());
      return false;
    }
    return true;
  }

  void CloseConnection() {
    std::lock_guard<std::mutex> lock(close_mu_);
    conn_.Close();
  }

  std::uint64_t id_;
  int native_fd_;
  Connection conn_;
  std::optional<AdmissionControl::Ticket> ticket_;
  logging::StatusLogger &log_;
  std::mutex close_mu_;
  std::atomic<bool> finished_{false};
  std::jthread worker_;
};

} // namespace upecho
