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

#include "folio/net/url.h"

#include <gtest/gtest.h>

namespace folio {
namespace net {

TEST(UrlTest, ParsesHttpWithQuery) {
  auto url_or =
      ParseUrl("http://www.bl.uk/manuscripts/Proxy.ashx?view=ms1_f001r.xml");
  ASSERT_TRUE(url_or.ok()) << url_or.status();
  EXPECT_EQ(url_or->scheme, "http");
  EXPECT_EQ(url_or->host, "www.bl.uk");
  EXPECT_EQ(url_or->port, 80);
  EXPECT_EQ(url_or->target, "/manuscripts/Proxy.ashx?view=ms1_f001r.xml");
  EXPECT_FALSE(url_or->IsTls());
}

TEST(UrlTest, ParsesHttpsWithPortAndNoPath) {
  auto url_or = ParseUrl("HTTPS://iiif.example.org:8443");
  ASSERT_TRUE(url_or.ok()) << url_or.status();
  EXPECT_EQ(url_or->scheme, "https");
  EXPECT_EQ(url_or->port, 8443);
  EXPECT_EQ(url_or->target, "/");
  EXPECT_EQ(url_or->HostHeader(), "iiif.example.org:8443");
  EXPECT_TRUE(url_or->IsTls());
}

TEST(UrlTest, DropsFragment) {
  auto url_or = ParseUrl("https://h/a/b#frag");
  ASSERT_TRUE(url_or.ok()) << url_or.status();
  EXPECT_EQ(url_or->target, "/a/b");
  EXPECT_EQ(url_or->ToString(), "https://h/a/b");
}

TEST(UrlTest, RejectsUnsupportedOrMalformed) {
  for (const char* text :
       {"ftp://host/x", "host/x", "://host", "http://", "http://h:0/",
        "http://h:99999/", "http://h:abc/", "http://user@h/"}) {
    auto url_or = ParseUrl(text);
    EXPECT_FALSE(url_or.ok()) << "accepted " << text;
    if (!url_or.ok()) {
      EXPECT_EQ(url_or.status().code(), absl::StatusCode::kInvalidArgument);
    }
  }
}

TEST(UrlTest, ResolvesRedirectLocations) {
  auto base_or = ParseUrl("http://h/iiif/a/manifest.json?x=1");
  ASSERT_TRUE(base_or.ok()) << base_or.status();

  auto absolute_or = ResolveLocation(*base_or, "https://other/y");
  ASSERT_TRUE(absolute_or.ok()) << absolute_or.status();
  EXPECT_EQ(absolute_or->ToString(), "https://other/y");

  auto scheme_rel_or = ResolveLocation(*base_or, "//cdn/z");
  ASSERT_TRUE(scheme_rel_or.ok()) << scheme_rel_or.status();
  EXPECT_EQ(scheme_rel_or->ToString(), "http://cdn/z");

  auto host_rel_or = ResolveLocation(*base_or, "/root.json");
  ASSERT_TRUE(host_rel_or.ok()) << host_rel_or.status();
  EXPECT_EQ(host_rel_or->ToString(), "http://h/root.json");

  auto path_rel_or = ResolveLocation(*base_or, "other.json");
  ASSERT_TRUE(path_rel_or.ok()) << path_rel_or.status();
  EXPECT_EQ(path_rel_or->ToString(), "http://h/iiif/a/other.json");

  EXPECT_FALSE(ResolveLocation(*base_or, "").ok());
}

TEST(UrlTest, LastPathSegment) {
  EXPECT_EQ(LastPathSegment("https://h/iiif/ms-1/manifest.json"),
            "manifest.json");
  EXPECT_EQ(LastPathSegment("https://h/iiif/ms-1/manifest?format=json"),
            "manifest");
  EXPECT_EQ(LastPathSegment("https://h/iiif/"), "");
  EXPECT_EQ(LastPathSegment("https://h"), "");
}

}  // namespace net
}  // namespace folio
