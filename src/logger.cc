// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fcntl.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace afltriage {

namespace {
constexpr size_t k_log_line_cap = 4096;
// syslog LOG_USER facility
constexpr int k_syslog_facility = 1;

// indexed by LOG_LVL
constexpr const char *k_level_names[LL_LENGTH] = {
    "EMERGENCY", "ALERT",  "CRITICAL",      "ERROR",
    "WARNING",   "NOTICE", "INFORMATIONAL", "DEBUG",
};

class LogSink {
public:
  bool open(int mode, const char *path) {
    close();
    switch (mode) {
    case LOG_DISABLE:
      break;
    case LOG_SYSLOG:
      if (!connect_syslog()) {
        return false;
      }
      break;
    case LOG_STDOUT:
      _fd = STDOUT_FILENO;
      break;
    case LOG_FILE:
      if (!path) {
        return false;
      }
      _fd = ::open(path, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
      if (_fd == -1) {
        return false;
      }
      break;
    case LOG_STDERR:
    default:
      mode = LOG_STDERR;
      _fd = STDERR_FILENO;
      break;
    }
    _mode = mode;
    return true;
  }

  void close() {
    if (_fd >= 0 && (_mode == LOG_SYSLOG || _mode == LOG_FILE)) {
      ::close(_fd);
    }
    _fd = -1;
    _mode = LOG_DISABLE;
  }

  void write_line(int lvl, const char *name, const char *fmt, va_list args) {
    if (_fd < 0 || !fmt || lvl < 0 || lvl >= LL_LENGTH) {
      return;
    }
    char buf[k_log_line_cap];
    size_t len = format_header(buf, sizeof(buf), lvl, name);

    // keep room for the newline and the terminating nul
    size_t const cap = sizeof(buf) - len - 1;
    int const body = vsnprintf(&buf[len], cap, fmt, args);
    if (body > 0 && cap > 0) {
      len += std::min(static_cast<size_t>(body), cap - 1);
    }
    if (_mode != LOG_SYSLOG) {
      buf[len++] = '\n';
    }
    emit(buf, len);
  }

  int level{LL_WARNING};

private:
  bool connect_syslog() {
    const sockaddr_un sa = {AF_UNIX, "/dev/log"};
    int const fd = socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd == -1) {
      return false;
    }
    if (connect(fd, reinterpret_cast<const sockaddr *>(&sa), sizeof(sa)) ==
        -1) {
      ::close(fd);
      return false;
    }
    _fd = fd;
    return true;
  }

  size_t format_header(char *buf, size_t size, int lvl,
                       const char *name) const {
    using namespace std::chrono;
    auto const now = system_clock::now().time_since_epoch();
    auto const secs = duration_cast<seconds>(now);
    auto const usecs = duration_cast<microseconds>(now - secs);

    time_t const t = secs.count();
    struct tm lt;
    localtime_r(&t, &lt);
    char tm_str[sizeof("mmm dd HH:MM:SS")];
    (void)strftime(tm_str, sizeof(tm_str), "%b %d %H:%M:%S", &lt);

    int res;
    if (_mode == LOG_SYSLOG) {
      res = snprintf(buf, size, "<%d>%s.%06ld %s[%d]: ",
                     lvl + k_syslog_facility * 8, tm_str,
                     static_cast<long>(usecs.count()), name, getpid());
    } else {
      res = snprintf(buf, size, "<%s>%s.%06ld %s[%d]: ", k_level_names[lvl],
                     tm_str, static_cast<long>(usecs.count()), name, getpid());
    }
    return res > 0 ? std::min(static_cast<size_t>(res), size - 1) : 0;
  }

  void emit(const char *buf, size_t len) const {
    ssize_t rc;
    do {
      if (_mode == LOG_SYSLOG) {
        rc = sendto(_fd, buf, len, MSG_NOSIGNAL, nullptr, 0);
      } else {
        rc = ::write(_fd, buf, len);
      }
    } while (rc == -1 && errno == EINTR);
  }

  int _fd{STDERR_FILENO};
  int _mode{LOG_STDERR};
};

LogSink s_sink;
} // namespace

bool LOG_open(int mode, const char *path) { return s_sink.open(mode, path); }

void LOG_close() { s_sink.close(); }

void LOG_setlevel(int lvl) {
  if (lvl >= LL_EMERGENCY && lvl <= LL_DEBUG) {
    s_sink.level = lvl;
  }
}

int LOG_getlevel() { return s_sink.level; }

bool LOG_is_logging_enabled_for_level(int level) {
  return level <= s_sink.level;
}

// NOLINTNEXTLINE(cert-dcl50-cpp)
void log_printfln(int lvl, const char *name, const char *fmt, ...) {
  va_list args;
  va_start(args, fmt);
  s_sink.write_line(lvl, name, fmt, args);
  va_end(args);
}

} // namespace afltriage
