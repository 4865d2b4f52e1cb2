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

#include <pugixml.hpp>

#include <string>
#include <utility>
#include <vector>

#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace legacy {

namespace {

absl::StatusOr<uint32_t> ReadPositiveAttribute(const pugi::xml_node& node,
                                               const char* name) {
  const pugi::xml_attribute attribute = node.attribute(name);
  if (attribute.empty()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("<%s> has no %s attribute", node.name(), name));
  }
  uint32_t value = 0;
  if (!absl::SimpleAtoi(absl::StripAsciiWhitespace(attribute.value()),
                        &value) ||
      value == 0) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("<%s %s=\"%s\"> is not a positive integer",
                        node.name(), name, attribute.value()));
  }
  return value;
}

}  // namespace

std::string LegacyEndpoint::MetadataUrl(const core::FolioRef& ref) const {
  return absl::StrCat(base_url, manuscript_id, "_", core::LegacyFileStem(ref),
                      ".xml");
}

std::string LegacyEndpoint::TilePrefix(const core::FolioRef& ref) const {
  return absl::StrCat(base_url, manuscript_id, "_", core::LegacyFileStem(ref),
                      "_files/", zoom_level, "/");
}

absl::StatusOr<PageMetadata> ParsePageMetadata(std::string_view xml) {
  pugi::xml_document doc;
  const pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size());
  if (!parsed) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Failed to parse page descriptor: %s",
                        parsed.description()));
  }

  const pugi::xml_node image = doc.child("Image");
  if (image.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Page descriptor has no <Image> root element");
  }
  const pugi::xml_node size = image.child("Size");
  if (size.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Page descriptor has no <Size> element");
  }

  DECLARE_ASSIGN_OR_RETURN(uint32_t, tile_size,
                           ReadPositiveAttribute(image, "TileSize"));
  DECLARE_ASSIGN_OR_RETURN(uint32_t, reported_width,
                           ReadPositiveAttribute(size, "Width"));
  DECLARE_ASSIGN_OR_RETURN(uint32_t, reported_height,
                           ReadPositiveAttribute(size, "Height"));

  // The server reports each dimension one too large.
  if (reported_width < 2 || reported_height < 2) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Page descriptor size %dx%d leaves no pixels",
                        reported_width, reported_height));
  }

  PageMetadata metadata;
  metadata.width = reported_width - 1;
  metadata.height = reported_height - 1;
  metadata.tile_size = tile_size;
  return metadata;
}

boost::asio::awaitable<absl::StatusOr<PageMetadata>> FetchPageMetadata(
    runtime::FetchExecutor& executor, std::string url) {
  runtime::FetchResult fetched = co_await executor.FetchOne(url);
  if (!fetched.ok()) {
    co_return foliocore::status::AddTrace(
        fetched.bytes.status(), __func__, __FILE__, __LINE__,
        absl::StrFormat("fetching %s", url));
  }

  const std::vector<uint8_t>& body = *fetched.bytes;
  absl::StatusOr<PageMetadata> metadata_or = ParsePageMetadata(
      std::string_view(reinterpret_cast<const char*>(body.data()),
                       body.size()));
  if (!metadata_or.ok()) {
    co_return foliocore::status::AddTrace(
        metadata_or.status(), __func__, __FILE__, __LINE__,
        absl::StrFormat("parsing %s", url));
  }

  VLOG(1) << "Metadata " << url << ": " << metadata_or->width << "x"
          << metadata_or->height << ", tile " << metadata_or->tile_size;
  co_return metadata_or;
}

}  // namespace legacy
}  // namespace folio
