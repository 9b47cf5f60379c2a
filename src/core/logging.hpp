// SPDX-License-Identifier: GPL-2.0
/* Copyright (c) 2019-2024 Chilledheart  */
#ifndef H_CORE_LOGGING
#define H_CORE_LOGGING

#include <errno.h>
#include <stdint.h>

#include <ostream>
#include <sstream>

#include <absl/flags/declare.h>
#include <absl/flags/flag.h>

ABSL_DECLARE_FLAG(int32_t, v);
ABSL_DECLARE_FLAG(int32_t, minloglevel);
ABSL_DECLARE_FLAG(bool, log_prefix);
ABSL_DECLARE_FLAG(bool, log_thread_id);

namespace relay {

typedef int LogSeverity;
// Note: the verbose level is encoded as a negative severity
const LogSeverity LOGGING_VERBOSE = -1;
const LogSeverity LOGGING_INFO = 0;
const LogSeverity LOGGING_WARNING = 1;
const LogSeverity LOGGING_ERROR = 2;
const LogSeverity LOGGING_FATAL = 3;
const LogSeverity LOGGING_NUM_SEVERITIES = 4;

#ifdef NDEBUG
const LogSeverity LOGGING_DFATAL = LOGGING_ERROR;
#else
const LogSeverity LOGGING_DFATAL = LOGGING_FATAL;
#endif

const char* log_severity_name(int severity);

bool VLogIsOn(int verbose_level);

// This class more or less represents a particular log message.  You
// create an instance of LogMessage and then stream stuff to it.
// When you finish streaming to it, ~LogMessage is called and the
// full message gets streamed to the appropriate destination.
class LogMessage {
 public:
  LogMessage(const char* file, int line, LogSeverity severity);
  virtual ~LogMessage();

  LogMessage(const LogMessage&) = delete;
  LogMessage& operator=(const LogMessage&) = delete;

  std::ostream& stream() { return stream_; }

  LogSeverity severity() const { return severity_; }

  // Number of messages sent at each severity since process start.
  static int64_t num_messages(int severity);

 protected:
  void Flush();

  // Fail with a crash
  [[noreturn]] static void Fail();

 private:
  void Init(const char* file, int line);

  std::ostringstream stream_;
  const LogSeverity severity_;
  int preserved_errno_;
  bool has_been_flushed_ = false;
};

// Appends a formatted system message of the errno to the log message.
class ErrnoLogMessage : public LogMessage {
 public:
  ErrnoLogMessage(const char* file, int line, LogSeverity severity, int err);
  ~ErrnoLogMessage() override;

 private:
  int err_;
};

// A LogMessage that always crashes the process once flushed.
class LogMessageFatal : public LogMessage {
 public:
  LogMessageFatal(const char* file, int line);
  [[noreturn]] ~LogMessageFatal() override;
};

// This class is used to explicitly ignore values in the conditional
// logging macros.  This avoids compiler warnings like "value computed
// is not used" and "statement has no effect".
class LogMessageVoidify {
 public:
  LogMessageVoidify() = default;
  // This has to be an operator with a precedence lower than << but
  // higher than ?:
  void operator&(std::ostream&) {}
};

}  // namespace relay

#define LAZY_STREAM(stream, condition) !(condition) ? (void)0 : ::relay::LogMessageVoidify() & (stream)

#define COMPACT_RELAY_LOG_INFO ::relay::LogMessage(__FILE__, __LINE__, ::relay::LOGGING_INFO)
#define COMPACT_RELAY_LOG_WARNING ::relay::LogMessage(__FILE__, __LINE__, ::relay::LOGGING_WARNING)
#define COMPACT_RELAY_LOG_ERROR ::relay::LogMessage(__FILE__, __LINE__, ::relay::LOGGING_ERROR)
#define COMPACT_RELAY_LOG_DFATAL ::relay::LogMessage(__FILE__, __LINE__, ::relay::LOGGING_DFATAL)
#define COMPACT_RELAY_LOG_FATAL ::relay::LogMessageFatal(__FILE__, __LINE__)

#define LOG_IS_ON(severity) (::relay::LOGGING_##severity >= absl::GetFlag(FLAGS_minloglevel))
#define VLOG_IS_ON(verboselevel) ::relay::VLogIsOn(verboselevel)

#define LOG_STREAM(severity) COMPACT_RELAY_LOG_##severity.stream()

#define LOG(severity) LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity))
#define LOG_IF(severity, condition) LAZY_STREAM(LOG_STREAM(severity), LOG_IS_ON(severity) && (condition))

#define VLOG(verboselevel) \
  LAZY_STREAM(::relay::LogMessage(__FILE__, __LINE__, -(verboselevel)).stream(), VLOG_IS_ON(verboselevel))

#define PLOG(severity)                                                                                  \
  LAZY_STREAM(::relay::ErrnoLogMessage(__FILE__, __LINE__, ::relay::LOGGING_##severity, errno).stream(), \
              LOG_IS_ON(severity))

#define CHECK(condition) \
  LAZY_STREAM(::relay::LogMessageFatal(__FILE__, __LINE__).stream() << "Check failed: " #condition ". ", !(condition))

#define CHECK_OP(name, op, val1, val2) CHECK((val1)op(val2)) << "(" #val1 " " #op " " #val2 ") "

#define CHECK_EQ(val1, val2) CHECK_OP(EQ, ==, val1, val2)
#define CHECK_NE(val1, val2) CHECK_OP(NE, !=, val1, val2)
#define CHECK_LE(val1, val2) CHECK_OP(LE, <=, val1, val2)
#define CHECK_LT(val1, val2) CHECK_OP(LT, <, val1, val2)
#define CHECK_GE(val1, val2) CHECK_OP(GE, >=, val1, val2)
#define CHECK_GT(val1, val2) CHECK_OP(GT, >, val1, val2)

#if defined(NDEBUG) && !defined(DCHECK_ALWAYS_ON)
#define DCHECK_IS_ON() 0
#else
#define DCHECK_IS_ON() 1
#endif

#if DCHECK_IS_ON()
#define DCHECK(condition) CHECK(condition)
#define DCHECK_EQ(val1, val2) CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) CHECK_GT(val1, val2)
#else
// the condition is still compiled but never evaluated
#define DCHECK(condition) \
  while (false)           \
  CHECK(condition)
#define DCHECK_EQ(val1, val2) \
  while (false)               \
  CHECK_EQ(val1, val2)
#define DCHECK_NE(val1, val2) \
  while (false)               \
  CHECK_NE(val1, val2)
#define DCHECK_LE(val1, val2) \
  while (false)               \
  CHECK_LE(val1, val2)
#define DCHECK_LT(val1, val2) \
  while (false)               \
  CHECK_LT(val1, val2)
#define DCHECK_GE(val1, val2) \
  while (false)               \
  CHECK_GE(val1, val2)
#define DCHECK_GT(val1, val2) \
  while (false)               \
  CHECK_GT(val1, val2)
#endif  // DCHECK_IS_ON()

#define NOTREACHED() DCHECK(false)

#endif  //  H_CORE_LOGGING
