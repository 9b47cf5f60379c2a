// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2022-2024 Chilledheart  */

#include "core/utils.hpp"

#include <errno.h>
#include <pthread.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#include <mutex>

#include "core/logging.hpp"

namespace relay {

namespace {
constexpr const char kSeparators[] = "/";
}  // namespace

bool SetCurrentThreadName(const std::string& name) {
  // We don't want to do this for the main thread because that would rename
  // the process, causing tools like killall to stop working.
  if (static_cast<pid_t>(::syscall(SYS_gettid)) == getpid())
    return true;
  // Set the name for the LWP (which gets truncated to 15 characters).
  int err = prctl(PR_SET_NAME, name.c_str());
  // We expect EPERM failures in sandboxed processes, just ignore those.
  if (err < 0 && errno != EPERM)
    PLOG(ERROR) << "prctl(PR_SET_NAME)";
  return err == 0;
}

uint64_t GetMonotonicTime() {
  static struct timespec start_ts;
  static std::once_flag started;
  struct timespec ts;
  int ret = 0;
  std::call_once(started, [&ret]() { ret = clock_gettime(CLOCK_MONOTONIC, &start_ts); });
  if (ret < 0) {
    PLOG(WARNING) << "clock_gettime failed";
    return 0;
  }

  ret = clock_gettime(CLOCK_MONOTONIC, &ts);
  if (ret < 0) {
    PLOG(WARNING) << "clock_gettime failed";
    return 0;
  }
  // offset by one so that the first observation is distinguishable from "never"
  return static_cast<uint64_t>(ts.tv_sec - start_ts.tv_sec) * NS_PER_SECOND + ts.tv_nsec - start_ts.tv_nsec + 1;
}

std::string_view Basename(std::string_view path) {
  // trim the extra trailing slash
  auto first_non_slash_at_end_pos = path.find_last_not_of(kSeparators);

  // path is in the root directory
  if (first_non_slash_at_end_pos == std::string_view::npos) {
    return path.empty() ? "" : path.substr(0, 1);
  }

  auto last_slash_pos = path.find_last_of(kSeparators, first_non_slash_at_end_pos);

  // path is in the current directory
  if (last_slash_pos == std::string_view::npos) {
    return path.substr(0, first_non_slash_at_end_pos + 1);
  }

  return path.substr(last_slash_pos + 1, first_non_slash_at_end_pos - last_slash_pos);
}

}  // namespace relay
