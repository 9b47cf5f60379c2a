// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "config/config.hpp"
#include "relay/server.hpp"

#include <absl/debugging/failure_signal_handler.h>
#include <absl/debugging/symbolize.h>
#include <absl/flags/flag.h>
#include <locale.h>
#include <signal.h>

#include <functional>
#include <string>

#include "core/logging.hpp"
#include "net/asio.hpp"

int main(int argc, const char* argv[]) {
  std::string exec_path = argv[0];

  // Set C library locale to make sure CommandLine can parse
  // argument values in the correct encoding.
  setlocale(LC_ALL, "");
  // For numbers we never want the C library's locale sensitive
  // conversion from number to string.
  setlocale(LC_NUMERIC, "C");

  // Major routine
  // - Read config from config file and flags
  // - Connect to the plugin, then hand the tunnel to the dispatch loop
  absl::InitializeSymbolizer(exec_path.c_str());
  absl::FailureSignalHandlerOptions failure_handle_options;
  absl::InstallFailureSignalHandler(failure_handle_options);

  config::SetServerUsageMessage(exec_path);
  config::ReadConfigFileAndArguments(argc, argv);

  relay::ServerConfig server_config;
  std::string err;
  if (!config::BuildServerConfig(&server_config, &err)) {
    LOG(ERROR) << "invalid configuration: " << err;
    return -1;
  }

  CHECK_NE(SIG_ERR, signal(SIGPIPE, SIG_IGN));

  relay::Server server(absl::GetFlag(FLAGS_plugin), absl::GetFlag(FLAGS_control), absl::GetFlag(FLAGS_data),
                       server_config);

  asio::error_code ec;
  asio::signal_set signals(server.io_context());
  signals.add(SIGINT, ec);
  signals.add(SIGTERM, ec);
#if defined(SIGUSR1)
  signals.add(SIGUSR1, ec);
#endif
  std::function<void(asio::error_code, int)> cb;
  cb = [&](asio::error_code error, int signal_number) {
    if (error == asio::error::operation_aborted) {
      return;
    }
#if defined(SIGUSR1)
    if (signal_number == SIGUSR1) {
      LOG(WARNING) << "Tunnel reconnect requested";
      server.ReconnectTunnel();
      signals.async_wait(cb);
      return;
    }
#endif
    LOG(WARNING) << "Application exiting";
    server.Stop();
  };
  signals.async_wait(cb);

  server.Start(ec);
  if (ec) {
    LOG(ERROR) << "server start failed: " << ec;
    asio::post(server.io_context(), [&signals]() {
      asio::error_code cancel_ec;
      signals.cancel(cancel_ec);
    });
    server.Join();
    return -1;
  }

  server.Loop();

  asio::post(server.io_context(), [&signals]() {
    asio::error_code cancel_ec;
    signals.cancel(cancel_ec);
  });
  server.Join();

  LOG(WARNING) << "Application exited";

  return 0;
}
