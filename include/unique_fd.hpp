// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include <unistd.h>
#include <utility>

namespace afltriage {

/// Owning file descriptor, closed when it goes out of scope
class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) : _fd(fd) {}
  ~UniqueFd() { reset(); }

  UniqueFd(const UniqueFd &) = delete;
  UniqueFd &operator=(const UniqueFd &) = delete;

  UniqueFd(UniqueFd &&other) noexcept : _fd(other.release()) {}
  UniqueFd &operator=(UniqueFd &&other) noexcept {
    reset(other.release());
    return *this;
  }

  [[nodiscard]] int get() const { return _fd; }
  explicit operator bool() const { return _fd >= 0; }

  int release() { return std::exchange(_fd, -1); }

  void reset(int fd = -1) {
    if (_fd >= 0) {
      ::close(_fd);
    }
    _fd = fd;
  }

private:
  int _fd{-1};
};

} // namespace afltriage
