// Unless explicitly stated otherwise all files in this repository are licensed
// under the Apache License Version 2.0. This product includes software
// developed at Datadog (https://www.datadoghq.com/). Copyright 2021-Present
// Datadog, Inc.

#include <gtest/gtest.h>

#include "atres.hpp"
#include "embedded_data.hpp"
#include "loghandle.hpp"
#include "triage_script.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace afltriage {

TEST(TriageScript, EmbeddedData) {
  std::span<const std::byte> const data = triage_script_data();
  ASSERT_FALSE(data.empty());
  std::string_view const text{reinterpret_cast<const char *>(data.data()),
                              data.size()};
  EXPECT_NE(text.find("import gdb"), std::string_view::npos);
  EXPECT_NE(text.find("current_tid"), std::string_view::npos);
}

TEST(TriageScript, Internal) {
  LogHandle handle;
  std::string path;
  {
    TriageScript script;
    ASSERT_TRUE(IsATResOK(TriageScript::create_internal(script)));
    EXPECT_TRUE(script.is_internal());
    ASSERT_TRUE(IsATResOK(script.path(path)));
    EXPECT_EQ(path, script.location());
    EXPECT_EQ(std::filesystem::path{path}.extension(), ".py");

    std::ifstream file(path, std::ios::binary);
    std::stringstream content;
    content << file.rdbuf();
    std::span<const std::byte> const data = triage_script_data();
    EXPECT_EQ(content.str(),
              std::string(reinterpret_cast<const char *>(data.data()),
                          data.size()));

    struct stat st;
    ASSERT_EQ(stat(path.c_str(), &st), 0);
    EXPECT_EQ(st.st_mode & 0777, 0600);

    // ownership follows the script
    TriageScript moved = std::move(script);
    EXPECT_TRUE(std::filesystem::exists(path));
  }
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST(TriageScript, ExternalIsNotSupported) {
  LogHandle handle;
  TriageScript const script = TriageScript::external("/opt/my_triage.py");
  EXPECT_FALSE(script.is_internal());
  EXPECT_EQ(script.location(), "/opt/my_triage.py");
  std::string path;
  EXPECT_EQ(script.path(path),
            atres_error(AT_WHAT_UNSUPPORTED_SCRIPT_LOCATION));
  EXPECT_TRUE(path.empty());
}

} // namespace afltriage
