#pragma once

#include "upecho/core/protocol.hpp"
#include "upecho/core/status.hpp"
#include "upecho/io/file_writer.hpp"
#include <string>
#include <string_view>
#include <unistd.h>

namespace upecho {

// Console: user-facing output of the client: replies, prompt, notices and
// failures. Writes go straight to the descriptors, unbuffered, so a prompt is
// visible before the loop waits for input again.
class Console {
public:
  explicit Console(int out_fd = STDOUT_FILENO, int err_fd = STDERR_FILENO)
      : out_fd_(out_fd), err_fd_(err_fd) {}

  void ShowPrompt() { Write(out_fd_, protocol::kPrompt); }

  void PrintReply(std::string_view text) {
    std::string line;
    line.reserve(text.size() + 1 + protocol::kPrompt.size());
    line.append(text);
    line += '\n';
    line.append(protocol::kPrompt);
    Write(out_fd_, line);
  }

  void Notice(std::string_view text) {
    std::string line(text);
    line += '\n';
    Write(out_fd_, line);
  }

  // Input the codec refused; the session carries on.
  void ReportRejectedInput(const error_code &ec) {
    Write(err_fd_, "Message not sent: " + ec.message() + "\n");
    ShowPrompt();
  }

  void ReportFailure(std::string_view what, const error_code &ec) {
    std::string line(what);
    line += " (";
    line += ec.message();
    line += ")\n";
    Write(err_fd_, line);
  }

  void ReportCommunicationFailure(const error_code &ec) {
    ReportFailure("\nA communication error occurred with the server.", ec);
  }

private:
  static void Write(int fd, std::string_view s) {
    (void)io::WriteAll(fd, s.data(), s.size());
  }

  int out_fd_;
  int err_fd_;
};

} // namespace upecho
