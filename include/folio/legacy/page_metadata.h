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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_LEGACY_PAGE_METADATA_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_LEGACY_PAGE_METADATA_H_

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "absl/status/statusor.h"
#include "folio/core/page_descriptor.h"
#include "folio/core/tile_grid.h"
#include "folio/runtime/fetch_executor.h"

/**
 * @file page_metadata.h
 * @brief Deep-zoom page descriptors of the legacy manuscript viewer
 *
 * Per page the server publishes a Deep Zoom descriptor
 *
 *     <Image TileSize="256" ...><Size Width="4001" Height="5001"/></Image>
 *
 * whose Width and Height are one larger than the pixel size of the tile
 * pyramid. The parsed metadata carries the corrected (reported - 1) values.
 */

namespace folio {
namespace legacy {

/// @brief Zoom level of the full-resolution tiles
inline constexpr uint32_t kDefaultZoomLevel = 13;

/// @brief Page size and tiling, after the off-by-one correction
struct PageMetadata {
  uint32_t width = 0;      ///< Reported width - 1
  uint32_t height = 0;     ///< Reported height - 1
  uint32_t tile_size = 0;  ///< Tile edge length

  [[nodiscard]] core::PageGeometry ToGeometry() const {
    return core::PageGeometry{width, height, tile_size};
  }
};

/// @brief URL scheme of one legacy manuscript
struct LegacyEndpoint {
  std::string base_url;       ///< e.g. "http://host/Proxy.ashx?view="
  std::string manuscript_id;  ///< e.g. "add_ms_19352"
  uint32_t zoom_level = kDefaultZoomLevel;

  /// @brief "{base}{manuscript}_{stem}.xml"
  [[nodiscard]] std::string MetadataUrl(const core::FolioRef& ref) const;

  /// @brief "{base}{manuscript}_{stem}_files/{zoom}/"
  [[nodiscard]] std::string TilePrefix(const core::FolioRef& ref) const;
};

/// @brief Parse a Deep Zoom descriptor
///
/// @param xml Descriptor document
/// @return Corrected metadata, or kInvalidArgument if the document is not
///         XML, lacks one of the three fields, or a field is not a positive
///         integer
absl::StatusOr<PageMetadata> ParsePageMetadata(std::string_view xml);

/// @brief Fetch and parse the descriptor of one page
///
/// Transport failures are retried by the executor; a malformed document is
/// returned as an error immediately.
boost::asio::awaitable<absl::StatusOr<PageMetadata>> FetchPageMetadata(
    runtime::FetchExecutor& executor, std::string url);

}  // namespace legacy
}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_LEGACY_PAGE_METADATA_H_
