// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */

#include "core/logging.hpp"

#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/syscall.h>
#include <sys/time.h>
#include <time.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <iomanip>
#include <string>

#include <absl/synchronization/mutex.h>

#include "core/utils.hpp"

ABSL_FLAG(int32_t, v, 0, "verboselevel");
ABSL_FLAG(int32_t,
          minloglevel,
          0,
          "Messages logged at a lower level than this don't "
          "actually get logged anywhere");
ABSL_FLAG(bool, log_prefix, true, "Prepend the log prefix to the start of each log line");
ABSL_FLAG(bool, log_thread_id, false, "Prepend the thread id to the log prefix");

namespace relay {

namespace {

const char* const log_severity_names[LOGGING_NUM_SEVERITIES] = {"INFO", "WARNING", "ERROR", "FATAL"};

// Serializes the actual write so lines from different threads never interleave.
absl::Mutex log_mutex;

std::atomic<int64_t> num_messages_[LOGGING_NUM_SEVERITIES];

}  // namespace

const char* log_severity_name(int severity) {
  if (severity >= 0 && severity < LOGGING_NUM_SEVERITIES)
    return log_severity_names[severity];
  return "UNKNOWN";
}

bool VLogIsOn(int verbose_level) {
  return verbose_level <= absl::GetFlag(FLAGS_v);
}

LogMessage::LogMessage(const char* file, int line, LogSeverity severity) : severity_(severity) {
  Init(file, line);
}

LogMessage::~LogMessage() {
  Flush();
}

int64_t LogMessage::num_messages(int severity) {
  if (severity < 0 || severity >= LOGGING_NUM_SEVERITIES)
    return 0;
  return num_messages_[severity].load(std::memory_order_relaxed);
}

void LogMessage::Init(const char* file, int line) {
  preserved_errno_ = errno;

  // If specified, prepend a prefix to each line.  For example:
  //    [1018/160715.123456:INFO:server.cpp(153)]
  //    (month, date, time, microseconds, log level, file basename, line)
  if (absl::GetFlag(FLAGS_log_prefix)) {
    stream_ << '[';
    if (absl::GetFlag(FLAGS_log_thread_id))
      stream_ << static_cast<long>(::syscall(SYS_gettid)) << ':';
    timeval tv;
    gettimeofday(&tv, nullptr);
    time_t t = tv.tv_sec;
    struct tm local_time;
    localtime_r(&t, &local_time);
    struct tm* tm_time = &local_time;
    stream_ << std::setfill('0') << std::setw(2) << 1 + tm_time->tm_mon << std::setw(2) << tm_time->tm_mday << '/'
            << std::setw(2) << tm_time->tm_hour << std::setw(2) << tm_time->tm_min << std::setw(2) << tm_time->tm_sec
            << '.' << std::setw(6) << tv.tv_usec << ':' << std::setfill(' ');
    if (severity_ >= 0) {
      stream_ << log_severity_name(severity_);
    } else {
      stream_ << "VERBOSE" << -severity_;
    }
    stream_ << ":" << Basename(file) << "(" << line << ")] ";
  }
}

void LogMessage::Flush() {
  if (has_been_flushed_ || severity_ < absl::GetFlag(FLAGS_minloglevel))
    return;

  std::string message = stream_.str();
  if (message.empty() || message.back() != '\n')
    message.push_back('\n');

  // Prevent any subtle race conditions by wrapping a mutex lock around
  // the actual logging action per se.
  {
    absl::MutexLock l(&log_mutex);
    fwrite(message.data(), 1, message.size(), stderr);
    fflush(stderr);
    ++num_messages_[std::max(severity_, LOGGING_INFO)];
  }

  // If errno was already set before we enter the logging call, we'll
  // set it back to that value when we return from the logging call.
  if (preserved_errno_ != 0) {
    errno = preserved_errno_;
  }

  has_been_flushed_ = true;
}

void LogMessage::Fail() {
  abort();
}

ErrnoLogMessage::ErrnoLogMessage(const char* file, int line, LogSeverity severity, int err)
    : LogMessage(file, line, severity), err_(err) {}

ErrnoLogMessage::~ErrnoLogMessage() {
  char buf[256];
  stream() << ": " << ::strerror_r(err_, buf, sizeof(buf)) << " [" << err_ << "]";
}

LogMessageFatal::LogMessageFatal(const char* file, int line) : LogMessage(file, line, LOGGING_FATAL) {}

LogMessageFatal::~LogMessageFatal() {
  Flush();
  Fail();
}

}  // namespace relay
