// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#ifndef H_CONFIG_CONFIG_FILE
#define H_CONFIG_CONFIG_FILE

#include <stdint.h>

#include <string>

#include <absl/flags/flag.h>
#include <nlohmann/json.hpp>

namespace config {

// A JSON object on disk whose keys overwrite flag values.
class ConfigFile {
 public:
  explicit ConfigFile(std::string path);
  ~ConfigFile();

  // Reads and parses the file. Fails on I/O errors and on anything that is
  // not a JSON object.
  bool Open();

  // Copies |key| into |value| when present with the right type. Returns
  // false, leaving the flag alone, otherwise.
  template <typename T>
  bool Read(const std::string& key, absl::Flag<T>* value);

  const std::string& path() const { return path_; }

 private:
  bool ReadImpl(const std::string& key, std::string* value);
  bool ReadImpl(const std::string& key, int32_t* value);
  bool ReadImpl(const std::string& key, uint32_t* value);

  const std::string path_;
  nlohmann::json root_;
};

}  // namespace config

#endif  // H_CONFIG_CONFIG_FILE
