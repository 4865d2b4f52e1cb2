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

#include "folio/legacy/page_metadata.h"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include <boost/asio/io_context.hpp>

#include "folio/testing/fake_http_client.h"
#include "folio/testing/run_sync.h"

namespace folio {
namespace legacy {
namespace {

using namespace std::chrono_literals;  // NOLINT(build/namespaces)

constexpr char kDeepZoomXml[] = R"(<?xml version="1.0" encoding="UTF-8"?>
<Image TileSize="256" Overlap="0" Format="jpg"
       xmlns="http://schemas.microsoft.com/deepzoom/2008">
  <Size Width="1000" Height="2000"/>
</Image>)";

runtime::FetchOptions FastOptions() {
  runtime::FetchOptions options;
  options.retry.multiplier = 1ms;
  options.retry.min_wait = 0ms;
  options.retry.max_wait = 1ms;
  return options;
}

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ParsePageMetadataTest, AppliesOffByOneCorrection) {
  auto metadata_or = ParsePageMetadata(kDeepZoomXml);
  ASSERT_TRUE(metadata_or.ok()) << metadata_or.status();
  EXPECT_EQ(metadata_or->width, 999u);
  EXPECT_EQ(metadata_or->height, 1999u);
  EXPECT_EQ(metadata_or->tile_size, 256u);
}

TEST(ParsePageMetadataTest, MinimalDescriptor) {
  auto metadata_or = ParsePageMetadata(
      R"(<Image TileSize="100"><Size Width="100" Height="100"/></Image>)");
  ASSERT_TRUE(metadata_or.ok()) << metadata_or.status();
  EXPECT_EQ(metadata_or->width, 99u);
  EXPECT_EQ(metadata_or->height, 99u);
  EXPECT_EQ(metadata_or->tile_size, 100u);
}

TEST(ParsePageMetadataTest, RejectsMissingOrMalformedFields) {
  for (const char* xml : {
           "",
           "not xml at all <",
           R"(<Other TileSize="256"><Size Width="10" Height="10"/></Other>)",
           R"(<Image TileSize="256"/>)",
           R"(<Image><Size Width="10" Height="10"/></Image>)",
           R"(<Image TileSize="256"><Size Height="10"/></Image>)",
           R"(<Image TileSize="256"><Size Width="10"/></Image>)",
           R"(<Image TileSize="abc"><Size Width="10" Height="10"/></Image>)",
           R"(<Image TileSize="256"><Size Width="-4" Height="10"/></Image>)",
           R"(<Image TileSize="256"><Size Width="1.5" Height="10"/></Image>)",
           R"(<Image TileSize="0"><Size Width="10" Height="10"/></Image>)",
           R"(<Image TileSize="256"><Size Width="1" Height="10"/></Image>)",
       }) {
    auto metadata_or = ParsePageMetadata(xml);
    EXPECT_FALSE(metadata_or.ok()) << "accepted: " << xml;
    if (!metadata_or.ok()) {
      EXPECT_EQ(metadata_or.status().code(),
                absl::StatusCode::kInvalidArgument);
    }
  }
}

// ============================================================================
// URLs
// ============================================================================

TEST(LegacyEndpointTest, BuildsMetadataAndTileUrls) {
  LegacyEndpoint endpoint{"http://www.bl.uk/manuscripts/Proxy.ashx?view=",
                          "ms1"};
  const FolioRef ref{1, FolioSide::kRecto};
  EXPECT_EQ(endpoint.MetadataUrl(ref),
            "http://www.bl.uk/manuscripts/Proxy.ashx?view=ms1_f001r.xml");
  EXPECT_EQ(endpoint.TilePrefix(ref),
            "http://www.bl.uk/manuscripts/Proxy.ashx?view=ms1_f001r_files/13/");
  EXPECT_EQ(core::TileUrl(endpoint.TilePrefix({12, FolioSide::kVerso}), {3, 4}),
            "http://www.bl.uk/manuscripts/Proxy.ashx?view=ms1_f012v_files/13/"
            "3_4.jpg");
}

// ============================================================================
// Fetching
// ============================================================================

class FetchPageMetadataTest : public ::testing::Test {
 protected:
  boost::asio::io_context io_;
  testing::FakeHttpClient client_;
};

TEST_F(FetchPageMetadataTest, FetchesAndParses) {
  client_.SetTextResponse("http://h/ms1_f001r.xml", kDeepZoomXml);
  runtime::FetchExecutor executor(client_, io_.get_executor(), FastOptions());

  auto metadata_or = testing::RunSync(
      io_, FetchPageMetadata(executor, "http://h/ms1_f001r.xml"));
  ASSERT_TRUE(metadata_or.ok()) << metadata_or.status();
  EXPECT_EQ(metadata_or->width, 999u);
}

TEST_F(FetchPageMetadataTest, MalformedDocumentIsNotRetried) {
  client_.SetTextResponse("http://h/ms1_f001r.xml", "<html>maintenance</html>");
  runtime::FetchExecutor executor(client_, io_.get_executor(), FastOptions());

  auto metadata_or = testing::RunSync(
      io_, FetchPageMetadata(executor, "http://h/ms1_f001r.xml"));
  ASSERT_FALSE(metadata_or.ok());
  EXPECT_EQ(metadata_or.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(client_.RequestCount(), 1u);
}

TEST_F(FetchPageMetadataTest, HttpFailureAfterRetries) {
  runtime::FetchExecutor executor(client_, io_.get_executor(), FastOptions());

  auto metadata_or = testing::RunSync(
      io_, FetchPageMetadata(executor, "http://h/ms1_f001r.xml"));
  ASSERT_FALSE(metadata_or.ok());
  EXPECT_EQ(metadata_or.status().code(), absl::StatusCode::kNotFound);
  EXPECT_EQ(client_.RequestCount(), 5u);
}

}  // namespace legacy
}  // namespace folio
