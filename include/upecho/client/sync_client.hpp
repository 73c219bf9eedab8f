#pragma once

#include "upecho/client/console.hpp"
#include "upecho/client/line_reader.hpp"
#include "upecho/client/outcome.hpp"
#include "upecho/core/protocol.hpp"
#include "upecho/net/connection.hpp"
#include <optional>
#include <poll.h>

namespace upecho {

// SyncClient: single-threaded interactive loop over two sources, the console
// and the connection.
// - Each iteration handles pending console input first, then at most one
//   inbound frame; there is no fairness beyond that order
// - Between iterations it sleeps in poll() on both descriptors with a short
//   timeout rather than re-checking in a tight loop
// - The Connection and LineReader are borrowed; the loop closes the
//   connection when the session ends
class SyncClient {
public:
  static constexpr int kPollIntervalMs = 100;

  SyncClient(Connection &conn, LineReader &input, Console &console)
      : conn_(conn), input_(input), console_(console) {}

  ClientOutcome Run() {
    console_.ShowPrompt();
    for (;;) {
      if (auto done = HandleInput()) {
        return *done;
      }
      if (auto done = HandleInbound()) {
        return *done;
      }
      WaitEither();
    }
  }

private:
  std::optional<ClientOutcome> HandleInput() {
    auto line = input_.TryReadLine();
    if (!line) {
      if (input_.Eof()) {
        return EndSession(ClientOutcome::input_closed);
      }
      return std::nullopt;
    }
    if (protocol::IsClientSentinel(*line)) {
      return EndSession(ClientOutcome::closed_by_user);
    }
    auto st = conn_.Send(*line);
    if (!st) {
      if (IsRejectedInput(st.error())) {
        console_.ReportRejectedInput(st.error());
        return std::nullopt;
      }
      return Fail(st.error());
    }
    return std::nullopt;
  }

  std::optional<ClientOutcome> HandleInbound() {
    if (!conn_.HasIncomingData()) {
      return std::nullopt;
    }
    auto msg = conn_.Receive();
    if (!msg) {
      return Fail(msg.error());
    }
    console_.PrintReply(*msg);
    return std::nullopt;
  }

  // Sends the literal sentinel whatever the user typed, then closes.
  ClientOutcome EndSession(ClientOutcome outcome) {
    auto st = conn_.Send(protocol::kExitSentinel);
    if (!st) {
      return Fail(st.error());
    }
    conn_.Close();
    return outcome;
  }

  ClientOutcome Fail(const error_code &ec) {
    console_.ReportCommunicationFailure(ec);
    conn_.Close();
    return ClientOutcome::connection_failed;
  }

  void WaitEither() {
    if (input_.HasBufferedLine()) {
      return;
    }
    pollfd fds[2] = {
        {.fd = conn_.NativeHandle(), .events = POLLIN, .revents = 0},
        // a negative fd is ignored by poll(); an exhausted input would
        // otherwise report readable forever
        {.fd = input_.Eof() ? -1 : input_.NativeHandle(),
         .events = POLLIN,
         .revents = 0},
    };
    (void)::poll(fds, 2, kPollIntervalMs);
  }

  Connection &conn_;
  LineReader &input_;
  Console &console_;
};

} // namespace upecho
