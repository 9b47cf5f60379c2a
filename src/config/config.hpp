// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CONFIG_CONFIG
#define H_CONFIG_CONFIG

#include <stdint.h>

#include <string>
#include <string_view>

#include <absl/flags/declare.h>

#include "relay/server_config.hpp"

ABSL_DECLARE_FLAG(std::string, plugin);
ABSL_DECLARE_FLAG(std::string, control);
ABSL_DECLARE_FLAG(std::string, data);
ABSL_DECLARE_FLAG(int32_t, read_timeout_ms);
ABSL_DECLARE_FLAG(int32_t, probe_interval_ms);
ABSL_DECLARE_FLAG(int32_t, probe_timeout_ms);
ABSL_DECLARE_FLAG(int32_t, connect_timeout_ms);
ABSL_DECLARE_FLAG(uint32_t, request_queue_size);
ABSL_DECLARE_FLAG(std::string, configfile);

namespace config {

// Loads the file named by --configfile into the flags. A missing --configfile
// is fine; a file that is named but unreadable or not a JSON object is not.
bool ReadConfig();

// Picks up -K/--configfile, loads the file, then parses the command line so
// that explicit flags win over the file.
void ReadConfigFileAndArguments(int argc, const char** argv);

void SetServerUsageMessage(std::string_view exec_path);

// Converts the current flags into a ServerConfig. Returns false and fills
// |err| when they do not describe a usable configuration.
bool BuildServerConfig(relay::ServerConfig* config, std::string* err);

}  // namespace config

#endif  // H_CONFIG_CONFIG
