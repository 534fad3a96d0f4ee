// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include "tempfile.hpp"

#include "atres_helpers.hpp"
#include "unique_fd.hpp"

#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace afltriage {

ATRes create_temp_file(std::string_view prefix, std::span<const std::byte> data,
                       mode_t mode, std::string &path,
                       std::string_view suffix) {
  std::error_code ec;
  auto template_str =
      std::string{std::filesystem::temp_directory_path(ec) / prefix} +
      ".XXXXXX";
  ATRES_CHECK_ERRORCODE(ec, AT_WHAT_TEMP_FILE,
                        "Failed to determine temp directory path");
  template_str.append(suffix);

  // Create temporary file
  UniqueFd fd{mkostemps(template_str.data(), static_cast<int>(suffix.size()),
                        O_CLOEXEC)};
  if (!fd) {
    ATRES_CHECK_ERRNO(-1, AT_WHAT_TEMP_FILE,
                      "Failed to create temporary file %s",
                      template_str.c_str());
  }
  // unlinked unless ownership is handed over to the caller
  TempFileHolder holder{template_str, true};

  ATRES_CHECK_ERRNO(fchmod(fd.get(), mode), AT_WHAT_TEMP_FILE,
                    "Failed to change temp file %s permissions",
                    template_str.c_str());

  const std::byte *cur = data.data();
  size_t remaining = data.size();
  while (remaining > 0) {
    ssize_t const written = write(fd.get(), cur, remaining);
    if (written == -1 && errno == EINTR) {
      continue;
    }
    ATRES_CHECK_ERRNO(written, AT_WHAT_TEMP_FILE,
                      "Failed to write temporary file %s",
                      template_str.c_str());
    cur += written;
    remaining -= written;
  }

  path = holder.release();
  return {};
}

void TempFileHolder::reset() {
  if (_is_temporary && !_path.empty()) {
    unlink(_path.c_str());
  }
  _path.clear();
  _is_temporary = false;
}

} // namespace afltriage
