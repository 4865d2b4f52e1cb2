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

#ifndef FOLIO_FOLIO_INCLUDE_FOLIO_MANIFEST_IIIF_MANIFEST_H_
#define FOLIO_FOLIO_INCLUDE_FOLIO_MANIFEST_IIIF_MANIFEST_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "absl/status/statusor.h"
#include "folio/core/page_range.h"

/**
 * @file iiif_manifest.h
 * @brief IIIF Presentation manifest model and image URL resolution
 *
 * Only the path the downloader needs is modelled:
 *
 *     manifest.items[]                  Canvas
 *       .items[0]                       AnnotationPage
 *         .items[0]                     Annotation
 *           .body                       ImageBody
 *             .service[0]               Service -> image URL
 *
 * A manifest without an `items` array of canvases with string ids is a
 * schema error. Everything below the canvas is optional; a gap anywhere on
 * the path is reported as a NoImageReason instead of an error.
 */

namespace folio {
namespace manifest {

/// @brief Language map, e.g. {"en": ["Folio 1r"], "la": ["..."]}
using LanguageMap = std::map<std::string, std::vector<std::string>>;

/// @brief A label is either a plain string or a language map
using Label = std::variant<std::string, LanguageMap>;

/// @brief Display text of a label
///
/// A plain string is used as is. For a language map, the first "en" value;
/// otherwise (or if that is empty) the decimal `index`.
std::string ExtractLabel(const Label& label, uint32_t index);

/// @brief IIIF Image API service descriptor
struct Service {
  std::optional<std::string> id;       ///< "id" (v3)
  std::optional<std::string> legacy_id;  ///< "@id" (v2)
  std::optional<std::string> type;     ///< "type" (v3)
  std::optional<std::string> legacy_type;  ///< "@type" (v2)
  std::optional<std::string> profile;

  /// @brief Service base URL ("id" preferred over "@id"), or empty
  [[nodiscard]] std::string ServiceId() const;

  /// @brief Whether the service speaks Image API 3
  [[nodiscard]] bool IsV3() const;
};

struct ImageBody {
  std::optional<std::string> id;
  std::optional<std::string> format;
  std::vector<Service> services;
};

struct Annotation {
  std::optional<std::string> id;
  std::optional<std::string> motivation;
  std::optional<ImageBody> body;
};

struct AnnotationPage {
  std::optional<std::string> id;
  std::vector<Annotation> items;
};

struct Canvas {
  std::string id;
  Label label;
  std::optional<uint32_t> width;
  std::optional<uint32_t> height;
  std::vector<AnnotationPage> items;
};

struct Manifest {
  std::string id;
  std::optional<Label> label;
  std::vector<Canvas> items;
};

/// @brief Why a canvas has no downloadable image
enum class NoImageReason : uint8_t {
  kNone,              ///< Image available
  kNoAnnotationPage,  ///< Canvas has no annotation page
  kNoAnnotation,      ///< First annotation page is empty
  kNoImageBody,       ///< First annotation has no body
  kNoService,         ///< Body has no image service
  kNoServiceId,       ///< Service has neither "id" nor "@id"
};

/// @brief Human-readable reason
const char* ToString(NoImageReason reason);

/// @brief Result of resolving a canvas image URL
struct ImageUrl {
  std::string url;  ///< Empty unless available
  NoImageReason reason = NoImageReason::kNone;

  [[nodiscard]] bool Available() const {
    return reason == NoImageReason::kNone;
  }
};

/// @brief Full-resolution image URL for a service
///
/// "{id}/full/max/0/default.jpg" for Image API 3, otherwise
/// "{id}/full/full/0/default.jpg". A trailing '/' on the id is dropped.
std::string BuildImageUrl(const Service& service);

/// @brief Follow canvas -> page -> annotation -> body -> service
ImageUrl ResolveImageUrl(const Canvas& canvas);

/// @brief A canvas selected for download
struct ResolvedCanvas {
  uint32_t index = 0;  ///< 1-based position in the manifest
  std::string canvas_id;
  std::string label;   ///< ExtractLabel() result
  ImageUrl image;
};

/// @brief Parse manifest JSON
/// @param json_text Manifest document
/// @return Manifest, or kInvalidArgument for malformed JSON or schema mismatch
absl::StatusOr<Manifest> ParseManifest(std::string_view json_text);

/// @brief Resolve the canvases of a (sub-)range, in manifest order
///
/// @param manifest Parsed manifest
/// @param range 1-based inclusive canvas range; all canvases if unset
/// @return Resolved canvases, or kOutOfRange if the range exceeds the manifest
absl::StatusOr<std::vector<ResolvedCanvas>> ResolveCanvases(
    const Manifest& manifest, const std::optional<core::PageRange>& range);

}  // namespace manifest
}  // namespace folio

#endif  // FOLIO_FOLIO_INCLUDE_FOLIO_MANIFEST_IIIF_MANIFEST_H_
