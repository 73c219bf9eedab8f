#include "upecho/client/console.hpp"
#include "upecho/core/options.hpp"
#include "upecho/core/runner.hpp"
#include <csignal>
#include <iostream>
#include <unistd.h>

int main(int argc, char **argv) {
  auto opt = upecho::ParseClientArgs(argc, argv);
  if (!opt) {
    std::cerr << opt.error() << "\n" << upecho::kClientUsage;
    return 1;
  }
  if (opt->help) {
    std::cout << upecho::kClientUsage;
    return 0;
  }
  std::signal(SIGPIPE, SIG_IGN);
  upecho::Console console(STDOUT_FILENO, STDERR_FILENO);
  return upecho::RunClient(*opt, STDIN_FILENO, console);
}
