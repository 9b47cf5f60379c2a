// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "config/config.hpp"

#include <stdlib.h>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/strings/str_cat.h>

#include "config/config_file.hpp"
#include "core/logging.hpp"
#include "core/utils.hpp"

ABSL_FLAG(std::string, plugin, "", "Plugin control endpoint (host:port), empty to attach externally");
ABSL_FLAG(std::string, control, "", "Tunnel peer endpoint (host:port), empty to attach externally");
ABSL_FLAG(std::string, data, "", "Data connection endpoint (host:port)");
ABSL_FLAG(int32_t, read_timeout_ms, 200, "Bound of one read attempt of a poll loop in milliseconds");
ABSL_FLAG(int32_t, probe_interval_ms, 5000, "Keepalive probe interval of the tunnel in milliseconds");
ABSL_FLAG(int32_t,
          probe_timeout_ms,
          30000,
          "Tunnel idle time in milliseconds after which it is reconnected, must exceed probe_interval_ms");
ABSL_FLAG(int32_t, connect_timeout_ms, 5000, "Connect timeout in milliseconds");
ABSL_FLAG(uint32_t, request_queue_size, 64, "Requests queued for dispatch before the readers are held back");
ABSL_FLAG(std::string, configfile, "", "load configs from file");

namespace config {

namespace {

void ParseConfigFileOption(int argc, const char** argv) {
  int pos = 1;
  while (pos < argc) {
    std::string arg = argv[pos];
    if (pos + 1 < argc && (arg == "-K" || arg == "--config" || arg == "-configfile" || arg == "--configfile")) {
      absl::SetFlag(&FLAGS_configfile, argv[pos + 1]);
      argv[pos] = "";
      argv[pos + 1] = "";
      pos += 2;
      continue;
    }
    ++pos;
  }
}

}  // namespace

bool ReadConfig() {
  std::string path = absl::GetFlag(FLAGS_configfile);
  if (path.empty()) {
    return true;
  }
  ConfigFile config_file(path);
  if (!config_file.Open()) {
    return false;
  }

  config_file.Read("plugin", &FLAGS_plugin);
  config_file.Read("control", &FLAGS_control);
  config_file.Read("data", &FLAGS_data);
  config_file.Read("read_timeout_ms", &FLAGS_read_timeout_ms);
  config_file.Read("probe_interval_ms", &FLAGS_probe_interval_ms);
  config_file.Read("probe_timeout_ms", &FLAGS_probe_timeout_ms);
  config_file.Read("connect_timeout_ms", &FLAGS_connect_timeout_ms);
  config_file.Read("request_queue_size", &FLAGS_request_queue_size);
  return true;
}

void ReadConfigFileAndArguments(int argc, const char** argv) {
  ParseConfigFileOption(argc, argv);
  if (!ReadConfig()) {
    LOG(ERROR) << "failed to load config file: " << absl::GetFlag(FLAGS_configfile);
    exit(-1);
  }
  if (argc) {
    absl::ParseCommandLine(argc, const_cast<char**>(argv));
  }

  // first line of logging
  LOG(WARNING) << "Application starting: plugin " << absl::GetFlag(FLAGS_plugin) << " control "
               << absl::GetFlag(FLAGS_control) << " data " << absl::GetFlag(FLAGS_data);
#ifndef NDEBUG
  LOG(WARNING) << "Debug build (NDEBUG not #defined)\n";
#endif
}

void SetServerUsageMessage(std::string_view exec_path) {
  absl::SetProgramUsageMessage(absl::StrCat("Usage: ", std::string(relay::Basename(exec_path)), " [options ...]\n", R"(
  -K, --configfile <file> Read config from a file
  --plugin <host:port> Plugin control endpoint
  --control <host:port> Tunnel peer endpoint
  --data <host:port> Data connection endpoint
  --read_timeout_ms <ms> Bound of one read attempt
  --probe_interval_ms <ms> Keepalive probe interval
  --probe_timeout_ms <ms> Tunnel idle time before reconnecting
  --connect_timeout_ms <ms> Connect timeout
  --request_queue_size <n> Requests queued for dispatch
)"));
}

bool BuildServerConfig(relay::ServerConfig* config, std::string* err) {
  int32_t read_timeout_ms = absl::GetFlag(FLAGS_read_timeout_ms);
  int32_t probe_interval_ms = absl::GetFlag(FLAGS_probe_interval_ms);
  int32_t probe_timeout_ms = absl::GetFlag(FLAGS_probe_timeout_ms);
  int32_t connect_timeout_ms = absl::GetFlag(FLAGS_connect_timeout_ms);
  uint32_t request_queue_size = absl::GetFlag(FLAGS_request_queue_size);

  if (read_timeout_ms <= 0) {
    *err = absl::StrCat("read_timeout_ms must be positive, got ", read_timeout_ms);
    return false;
  }
  if (probe_interval_ms <= 0) {
    *err = absl::StrCat("probe_interval_ms must be positive, got ", probe_interval_ms);
    return false;
  }
  if (probe_timeout_ms <= probe_interval_ms) {
    *err = absl::StrCat("probe_timeout_ms (", probe_timeout_ms, ") must exceed probe_interval_ms (",
                        probe_interval_ms, ")");
    return false;
  }
  if (connect_timeout_ms <= 0) {
    *err = absl::StrCat("connect_timeout_ms must be positive, got ", connect_timeout_ms);
    return false;
  }
  if (request_queue_size == 0) {
    *err = "request_queue_size must not be zero";
    return false;
  }

  config->read_timeout = std::chrono::milliseconds(read_timeout_ms);
  config->probe_interval = std::chrono::milliseconds(probe_interval_ms);
  config->probe_timeout = std::chrono::milliseconds(probe_timeout_ms);
  config->connect_timeout = std::chrono::milliseconds(connect_timeout_ms);
  config->request_queue_size = request_queue_size;
  return true;
}

}  // namespace config
