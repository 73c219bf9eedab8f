#pragma once

#include "upecho/client/console.hpp"
#include "upecho/client/line_reader.hpp"
#include "upecho/client/outcome.hpp"
#include "upecho/core/protocol.hpp"
#include "upecho/net/async_connection.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/spawn.hpp>
#include <cerrno>
#include <optional>
#include <string>
#include <unistd.h>

namespace upecho {

// AsyncClient
// Threading model:
// - Two cooperating coroutines on one io_context run by the calling thread:
//   InputTask reads console lines and sends them, InboundTask receives frames
//   and prints them
// - Neither source is polled; each task is resumed when its descriptor is
//   ready
// - Whichever task ends the session closes both the connection and the
//   console descriptor, which cancels the other task's pending read
// - The console descriptor is a dup() of input_fd so closing it leaves the
//   caller's descriptor open
class AsyncClient {
public:
  AsyncClient(net::io_context &ioc, tcp::socket socket, int input_fd,
              Console &console)
      : ioc_(ioc), conn_(std::move(socket)), input_fd_(input_fd),
        input_(ioc), console_(console) {}

  ClientOutcome Run() {
    error_code ec;
    int fd = ::dup(input_fd_);
    if (fd == -1) {
      ec = error_code(errno, boost::system::system_category());
    } else {
      input_.assign(fd, ec);
      if (ec) {
        ::close(fd);
      }
    }
    if (ec) {
      console_.ReportFailure("Cannot watch console input.", ec);
      conn_.Close();
      return ClientOutcome::input_closed;
    }

    console_.ShowPrompt();
    net::spawn(ioc_, [this](net::yield_context yield) { InputTask(yield); });
    net::spawn(ioc_, [this](net::yield_context yield) { InboundTask(yield); });
    ioc_.run();
    return outcome_.value_or(ClientOutcome::connection_failed);
  }

private:
  void InputTask(net::yield_context yield) {
    std::string buf;
    for (;;) {
      error_code ec;
      std::size_t n =
          net::async_read_until(input_, net::dynamic_buffer(buf), '\n',
                                yield[ec]);
      if (done_) {
        return;
      }
      if (ec) {
        // end of input: a last line without newline still counts
        if (!buf.empty()) {
          std::string line = std::move(buf);
          buf.clear();
          StripCarriageReturn(line);
          if (!HandleLine(line, yield)) {
            return;
          }
        }
        EndSession(ClientOutcome::input_closed, yield);
        return;
      }
      std::string line = buf.substr(0, n - 1);
      buf.erase(0, n);
      StripCarriageReturn(line);
      if (!HandleLine(line, yield)) {
        return;
      }
    }
  }

  // Returns false once the session is over.
  bool HandleLine(const std::string &line, net::yield_context yield) {
    if (protocol::IsClientSentinel(line)) {
      EndSession(ClientOutcome::closed_by_user, yield);
      return false;
    }
    auto st = conn_.AsyncSend(line, yield);
    if (done_) {
      return false;
    }
    if (!st) {
      if (IsRejectedInput(st.error())) {
        console_.ReportRejectedInput(st.error());
        return true;
      }
      Fail(st.error());
      return false;
    }
    return true;
  }

  void InboundTask(net::yield_context yield) {
    for (;;) {
      auto msg = conn_.AsyncReceive(yield);
      if (done_) {
        return;
      }
      if (!msg) {
        // the server may close before our own sentinel write has resumed
        if (ending_) {
          Finish(*ending_);
        } else {
          Fail(msg.error());
        }
        return;
      }
      console_.PrintReply(*msg);
    }
  }

  void EndSession(ClientOutcome outcome, net::yield_context yield) {
    ending_ = outcome;
    auto st = conn_.AsyncSend(protocol::kExitSentinel, yield);
    if (done_) {
      return;
    }
    if (!st) {
      Fail(st.error());
      return;
    }
    Finish(outcome);
  }

  void Fail(const error_code &ec) {
    if (done_) {
      return;
    }
    console_.ReportCommunicationFailure(ec);
    Finish(ClientOutcome::connection_failed);
  }

  void Finish(ClientOutcome outcome) {
    if (done_) {
      return;
    }
    done_ = true;
    outcome_ = outcome;
    conn_.Close();
    error_code ec;
    input_.close(ec);
  }

  net::io_context &ioc_;
  AsyncConnection conn_;
  int input_fd_;
  net::posix::stream_descriptor input_;
  Console &console_;
  std::optional<ClientOutcome> ending_;
  std::optional<ClientOutcome> outcome_;
  bool done_ = false;
};

} // namespace upecho
