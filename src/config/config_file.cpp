// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "config/config_file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <stdint.h>

#include <utility>

#include "core/logging.hpp"

using json = nlohmann::json;

namespace {

constexpr const size_t kReadBufferSize = 32768u;

ssize_t ReadFileToBuffer(const std::string& path, char* buf, size_t buf_len) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    return -1;
  }
  ssize_t ret = ::read(fd, buf, buf_len);

  if (ret < 0 || close(fd) < 0) {
    return -1;
  }
  return ret;
}

}  // anonymous namespace

namespace config {

ConfigFile::ConfigFile(std::string path) : path_(std::move(path)) {}

ConfigFile::~ConfigFile() = default;

bool ConfigFile::Open() {
  char buffer[kReadBufferSize];
  ssize_t size = ReadFileToBuffer(path_, buffer, sizeof(buffer));
  if (size < 0) {
    PLOG(WARNING) << "configure file failed to read: " << path_;
    return false;
  }
  std::string json_content(buffer, size);
  root_ = json::parse(json_content, nullptr, false);
  if (root_.is_discarded() || !root_.is_object()) {
    LOG(WARNING) << "bad config file: " << path_ << " content: \"" << json_content << "\"";
    root_ = json::object();
    return false;
  }
  VLOG(2) << "loaded from config file: " << path_;
  return true;
}

bool ConfigFile::ReadImpl(const std::string& key, std::string* value) {
  if (root_.contains(key) && root_[key].is_string()) {
    *value = root_[key].get<std::string>();
    return true;
  }
  return false;
}

bool ConfigFile::ReadImpl(const std::string& key, int32_t* value) {
  if (root_.contains(key) && root_[key].is_number_integer()) {
    int64_t real_value = root_[key].get<int64_t>();
    if (real_value < INT32_MIN || real_value > INT32_MAX) {
      return false;
    }
    *value = static_cast<int32_t>(real_value);
    return true;
  }
  return false;
}

bool ConfigFile::ReadImpl(const std::string& key, uint32_t* value) {
  if (root_.contains(key) && root_[key].is_number_unsigned()) {
    uint64_t real_value = root_[key].get<uint64_t>();
    if (real_value > UINT32_MAX) {
      return false;
    }
    *value = static_cast<uint32_t>(real_value);
    return true;
  }
  return false;
}

template <typename T>
bool ConfigFile::Read(const std::string& key, absl::Flag<T>* value) {
  T real_value;
  if (!ReadImpl(key, &real_value)) {
    VLOG(1) << "failed to load option " << key;
    return false;
  }
  absl::SetFlag(value, real_value);
  VLOG(1) << "loaded option " << key << ": " << real_value;
  return true;
}

template bool ConfigFile::Read(const std::string& key, absl::Flag<std::string>* value);
template bool ConfigFile::Read(const std::string& key, absl::Flag<int32_t>* value);
template bool ConfigFile::Read(const std::string& key, absl::Flag<uint32_t>* value);

}  // namespace config
