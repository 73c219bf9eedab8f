#include "upecho/core/options.hpp"
#include "upecho/core/runner.hpp"
#include <csignal>
#include <iostream>

int main(int argc, char **argv) {
  auto opt = upecho::ParseServerArgs(argc, argv);
  if (!opt) {
    std::cerr << opt.error() << "\n" << upecho::kServerUsage;
    return 1;
  }
  if (opt->help) {
    std::cout << upecho::kServerUsage;
    return 0;
  }
  std::signal(SIGPIPE, SIG_IGN);
  return upecho::RunServer(*opt);
}
