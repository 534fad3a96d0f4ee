// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#pragma once

#include "atres_def.hpp"

#include <span>
#include <string>
#include <string_view>
#include <sys/stat.h>

namespace afltriage {

/// Create `<tmpdir>/<prefix>.XXXXXX<suffix>` holding `data`.
/// On success `path` is set to the created file, which is left on disk.
ATRes create_temp_file(std::string_view prefix, std::span<const std::byte> data,
                       mode_t mode, std::string &path,
                       std::string_view suffix = {});

/// Owns a path on disk and unlinks it on destruction when it is temporary
class TempFileHolder {
public:
  TempFileHolder() = default;
  TempFileHolder(std::string path, bool is_temporary)
      : _path(std::move(path)), _is_temporary(is_temporary) {}

  ~TempFileHolder() { reset(); }

  TempFileHolder(const TempFileHolder &) = delete;
  TempFileHolder &operator=(const TempFileHolder &) = delete;

  TempFileHolder(TempFileHolder &&other) noexcept : TempFileHolder() {
    *this = std::move(other);
  }

  TempFileHolder &operator=(TempFileHolder &&other) noexcept {
    using std::swap;
    swap(_path, other._path);
    swap(_is_temporary, other._is_temporary);
    return *this;
  }

  [[nodiscard]] const std::string &path() const { return _path; }

  [[nodiscard]] bool is_temporary() const { return _is_temporary; }

  std::string release() {
    std::string s = std::move(_path);
    _path.clear();
    _is_temporary = false;
    return s;
  }

  void reset();

private:
  std::string _path;
  bool _is_temporary = false;
};

} // namespace afltriage
