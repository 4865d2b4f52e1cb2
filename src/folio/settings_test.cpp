// Copyright 2025 Jonas Teuwen. All Rights Reserved.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#include "folio/settings.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace folio {
namespace {

constexpr const char* kVariables[] = {
    "BASEDIR",          "RANGEBEGIN",         "RANGEEND",
    "BASEURL",          "USER_AGENT",         "TIMEOUT_SECONDS",
    "TILE_CONCURRENCY", "CANVAS_CONCURRENCY", "PAGE_BATCH_SIZE",
};

}  // namespace

class SettingsTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnvironment(); }
  void TearDown() override { ClearEnvironment(); }

  static void ClearEnvironment() {
    for (const char* name : kVariables) {
      unsetenv(absl::StrCat(kEnvPrefix, name).c_str());
    }
  }

  static void Set(const char* name, const char* value) {
    setenv(absl::StrCat(kEnvPrefix, name).c_str(), value, /*overwrite=*/1);
  }
};

TEST_F(SettingsTest, Defaults) {
  const Settings settings;
  EXPECT_EQ(settings.base_dir, fs::path("."));
  EXPECT_EQ(settings.range_begin, 1u);
  EXPECT_EQ(settings.range_end, 259u);
  EXPECT_EQ(settings.base_url,
            "http://www.bl.uk/manuscripts/Proxy.ashx?view=");
  EXPECT_EQ(settings.user_agent, "Mozilla/5.0");
  EXPECT_EQ(settings.request_timeout, std::chrono::seconds(60));
  EXPECT_EQ(settings.tile_concurrency, 5u);
  EXPECT_EQ(settings.canvas_concurrency, 5u);
  EXPECT_EQ(settings.page_batch_size, 5u);
  EXPECT_EQ(settings.zoom_level, 13u);
  EXPECT_EQ(settings.jpeg_quality, 95);
  EXPECT_EQ(settings.retry.max_attempts, 5);
  EXPECT_TRUE(settings.Validate().ok());
}

TEST_F(SettingsTest, EmptyEnvironmentKeepsDefaults) {
  auto settings_or = LoadSettingsFromEnv();
  ASSERT_TRUE(settings_or.ok()) << settings_or.status();
  EXPECT_EQ(settings_or->range_end, 259u);
  EXPECT_EQ(settings_or->tile_concurrency, 5u);
}

TEST_F(SettingsTest, EnvironmentOverrides) {
  Set("BASEDIR", "/tmp/out");
  Set("RANGEBEGIN", "3");
  Set("RANGEEND", " 12 ");
  Set("BASEURL", "http://mirror/view=");
  Set("USER_AGENT", "folio-test");
  Set("TIMEOUT_SECONDS", "15");
  Set("TILE_CONCURRENCY", "8");
  Set("CANVAS_CONCURRENCY", "2");
  Set("PAGE_BATCH_SIZE", "1");

  auto settings_or = LoadSettingsFromEnv();
  ASSERT_TRUE(settings_or.ok()) << settings_or.status();
  EXPECT_EQ(settings_or->base_dir, fs::path("/tmp/out"));
  EXPECT_EQ(settings_or->range_begin, 3u);
  EXPECT_EQ(settings_or->range_end, 12u);
  EXPECT_EQ(settings_or->base_url, "http://mirror/view=");
  EXPECT_EQ(settings_or->user_agent, "folio-test");
  EXPECT_EQ(settings_or->request_timeout, std::chrono::seconds(15));
  EXPECT_EQ(settings_or->tile_concurrency, 8u);
  EXPECT_EQ(settings_or->canvas_concurrency, 2u);
  EXPECT_EQ(settings_or->page_batch_size, 1u);
}

TEST_F(SettingsTest, MalformedNumberIsAnError) {
  for (const char* value : {"five", "-1", "0", "1.5", ""}) {
    ClearEnvironment();
    Set("TILE_CONCURRENCY", value);
    auto settings_or = LoadSettingsFromEnv();
    EXPECT_FALSE(settings_or.ok()) << "accepted '" << value << "'";
    if (!settings_or.ok()) {
      EXPECT_EQ(settings_or.status().code(),
                absl::StatusCode::kInvalidArgument);
    }
  }
}

TEST_F(SettingsTest, InvertedRangeIsAnError) {
  Set("RANGEBEGIN", "10");
  Set("RANGEEND", "2");
  auto settings_or = LoadSettingsFromEnv();
  ASSERT_FALSE(settings_or.ok());
  EXPECT_EQ(settings_or.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST_F(SettingsTest, RangeEndPastLastPageIsAnError) {
  Set("RANGEEND", "4294967295");
  auto settings_or = LoadSettingsFromEnv();
  ASSERT_FALSE(settings_or.ok());
  EXPECT_EQ(settings_or.status().code(), absl::StatusCode::kOutOfRange);
}

TEST_F(SettingsTest, ValidateRejectsBadValues) {
  Settings settings;
  settings.jpeg_quality = 0;
  EXPECT_FALSE(settings.Validate().ok());

  settings = Settings{};
  settings.canvas_concurrency = 0;
  EXPECT_FALSE(settings.Validate().ok());

  settings = Settings{};
  settings.request_timeout = std::chrono::seconds(0);
  EXPECT_FALSE(settings.Validate().ok());
}

}  // namespace folio
