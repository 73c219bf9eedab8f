#pragma once

#include "upecho/client/async_client.hpp"
#include "upecho/client/console.hpp"
#include "upecho/client/line_reader.hpp"
#include "upecho/client/outcome.hpp"
#include "upecho/client/sync_client.hpp"
#include "upecho/core/iserver.hpp"
#include "upecho/core/options.hpp"
#include "upecho/logging/logger.hpp"
#include "upecho/net/connection.hpp"
#include "upecho/net/tcp_ops.hpp"
#include "upecho/server/async_server.hpp"
#include "upecho/server/sync_server.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

// Runner composition/threading overview:
// - Server: StatusLogger worker thread; the accept loop on the main thread
//   (sync: plus one jthread per session; async: plus the reactor pool);
//   a signal thread turns SIGINT/SIGTERM into IServer::Stop()
// - Client: everything on the main thread (sync poll loop or one io_context
//   with two coroutines)
namespace upecho {

inline std::unique_ptr<IServer> MakeServer(const ServerOptions &opt,
                                           logging::StatusLogger &log) {
  if (opt.mode == RunMode::sync) {
    return std::make_unique<SyncServer>(opt, log);
  }
  return std::make_unique<AsyncServer>(opt, log);
}

// Exit codes: 0 after a clean stop, 1 when the server could not start.
inline int RunServer(const ServerOptions &opt) {
  logging::StatusLogger logger;
  if (!opt.log_file.empty()) {
    if (auto st = logger.OpenFile(opt.log_file); !st) {
      std::cerr << "cannot open log file '" << opt.log_file
                << "': " << st.error().message() << "\n";
      return 1;
    }
  }
  logger.Start();

  auto server = MakeServer(opt, logger);
  if (!server->Bind()) {
    return 1;
  }

  net::io_context signal_ioc;
  net::signal_set signals(signal_ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const error_code &ec, int signo) {
    if (!ec) {
      logger.Info("received signal ", signo, ", shutting down");
      server->Stop();
    }
  });
  std::jthread signal_thread([&signal_ioc] { signal_ioc.run(); });

  server->Run();
  signal_ioc.stop();
  return 0;
}

// Exit codes: 0 when the user ended the session, 1 when no connection could
// be made, 2 when the session ended with a communication failure.
inline int RunClient(const ClientOptions &opt, int input_fd, Console &console) {
  net::io_context ioc;
  tcp::resolver resolver(ioc);
  auto endpoints = tcpops::Resolve(resolver, opt.host, opt.port);
  if (!endpoints) {
    console.ReportFailure("Failed to resolve the server address.",
                          endpoints.error());
    return 1;
  }
  tcp::socket socket(ioc);
  if (auto st = tcpops::Connect(socket, *endpoints); !st) {
    console.ReportFailure("Failed to connect to the server. Is it running?",
                          st.error());
    return 1;
  }
  tcpops::SetTcpNoDelay(socket);

  RunMode mode = opt.mode;
  if (mode == RunMode::async && !IsPollableInput(input_fd)) {
    mode = RunMode::sync;
  }

  ClientOutcome outcome;
  if (mode == RunMode::async) {
    AsyncClient client(ioc, std::move(socket), input_fd, console);
    outcome = client.Run();
  } else {
    Connection conn(std::move(socket));
    LineReader input(input_fd);
    SyncClient client(conn, input, console);
    outcome = client.Run();
  }
  console.Notice("\nConnection closed.");
  return outcome == ClientOutcome::connection_failed ? 2 : 0;
}

} // namespace upecho
