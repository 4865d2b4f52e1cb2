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

#include "folio/manifest/iiif_manifest.h"

#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "absl/status/status.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio {
namespace manifest {

namespace {

using json = nlohmann::json;

std::optional<std::string> GetString(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}

std::optional<uint32_t> GetDimension(const json& object, const char* key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number_unsigned()) {
    return std::nullopt;
  }
  const auto value = it->get<uint64_t>();
  if (value > UINT32_MAX) {
    return std::nullopt;
  }
  return static_cast<uint32_t>(value);
}

/// Objects of a field that may hold either one object or an array of them.
std::vector<const json*> ObjectsOf(const json& object, const char* key) {
  std::vector<const json*> out;
  auto it = object.find(key);
  if (it == object.end()) {
    return out;
  }
  if (it->is_object()) {
    out.push_back(&*it);
  } else if (it->is_array()) {
    for (const auto& element : *it) {
      if (element.is_object()) {
        out.push_back(&element);
      }
    }
  }
  return out;
}

Label ParseLabel(const json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  LanguageMap languages;
  if (!value.is_object()) {
    return languages;
  }
  for (auto it = value.begin(); it != value.end(); ++it) {
    const json& texts = it.value();
    auto& out = languages[it.key()];
    if (texts.is_string()) {
      out.push_back(texts.get<std::string>());
    } else if (texts.is_array()) {
      for (const auto& text : texts) {
        if (text.is_string()) {
          out.push_back(text.get<std::string>());
        }
      }
    }
  }
  return languages;
}

Service ParseService(const json& object) {
  Service service;
  service.id = GetString(object, "id");
  service.legacy_id = GetString(object, "@id");
  service.type = GetString(object, "type");
  service.legacy_type = GetString(object, "@type");
  service.profile = GetString(object, "profile");
  return service;
}

ImageBody ParseBody(const json& object) {
  ImageBody body;
  body.id = GetString(object, "id");
  body.format = GetString(object, "format");
  for (const json* service : ObjectsOf(object, "service")) {
    body.services.push_back(ParseService(*service));
  }
  return body;
}

Annotation ParseAnnotation(const json& object) {
  Annotation annotation;
  annotation.id = GetString(object, "id");
  annotation.motivation = GetString(object, "motivation");
  auto bodies = ObjectsOf(object, "body");
  if (!bodies.empty()) {
    annotation.body = ParseBody(*bodies.front());
  }
  return annotation;
}

AnnotationPage ParseAnnotationPage(const json& object) {
  AnnotationPage page;
  page.id = GetString(object, "id");
  for (const json* annotation : ObjectsOf(object, "items")) {
    page.items.push_back(ParseAnnotation(*annotation));
  }
  return page;
}

absl::StatusOr<Canvas> ParseCanvas(const json& object, size_t position) {
  if (!object.is_object()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Canvas %d is not a JSON object", position + 1));
  }
  Canvas canvas;
  auto id = GetString(object, "id");
  if (!id.has_value()) {
    return MAKE_STATUS(
        absl::StatusCode::kInvalidArgument,
        absl::StrFormat("Canvas %d has no string 'id'", position + 1));
  }
  canvas.id = std::move(*id);
  if (auto it = object.find("label"); it != object.end()) {
    canvas.label = ParseLabel(*it);
  } else {
    canvas.label = LanguageMap{};
  }
  canvas.width = GetDimension(object, "width");
  canvas.height = GetDimension(object, "height");
  for (const json* page : ObjectsOf(object, "items")) {
    canvas.items.push_back(ParseAnnotationPage(*page));
  }
  return canvas;
}

}  // namespace

std::string ExtractLabel(const Label& label, uint32_t index) {
  if (const auto* text = std::get_if<std::string>(&label)) {
    return *text;
  }
  const auto& languages = std::get<LanguageMap>(label);
  if (auto it = languages.find("en");
      it != languages.end() && !it->second.empty()) {
    return it->second.front();
  }
  return absl::StrCat(index);
}

std::string Service::ServiceId() const {
  if (id.has_value() && !id->empty()) {
    return *id;
  }
  return legacy_id.value_or("");
}

bool Service::IsV3() const {
  std::string marker;
  if (type.has_value() && !type->empty()) {
    marker = *type;
  } else {
    marker = legacy_type.value_or("");
  }
  return absl::StrContains(absl::AsciiStrToLower(marker), "3") ||
         absl::StrContains(ServiceId(), "/3/");
}

const char* ToString(NoImageReason reason) {
  switch (reason) {
    case NoImageReason::kNone:
      return "image available";
    case NoImageReason::kNoAnnotationPage:
      return "canvas has no annotation page";
    case NoImageReason::kNoAnnotation:
      return "annotation page has no annotation";
    case NoImageReason::kNoImageBody:
      return "annotation has no image body";
    case NoImageReason::kNoService:
      return "image body has no image service";
    case NoImageReason::kNoServiceId:
      return "image service has no id";
  }
  return "unknown";
}

std::string BuildImageUrl(const Service& service) {
  std::string base = service.ServiceId();
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return absl::StrCat(base, service.IsV3() ? "/full/max/0/default.jpg"
                                           : "/full/full/0/default.jpg");
}

ImageUrl ResolveImageUrl(const Canvas& canvas) {
  ImageUrl result;
  if (canvas.items.empty()) {
    result.reason = NoImageReason::kNoAnnotationPage;
    return result;
  }
  const AnnotationPage& page = canvas.items.front();
  if (page.items.empty()) {
    result.reason = NoImageReason::kNoAnnotation;
    return result;
  }
  const Annotation& annotation = page.items.front();
  if (!annotation.body.has_value()) {
    result.reason = NoImageReason::kNoImageBody;
    return result;
  }
  if (annotation.body->services.empty()) {
    result.reason = NoImageReason::kNoService;
    return result;
  }
  const Service& service = annotation.body->services.front();
  if (service.ServiceId().empty()) {
    result.reason = NoImageReason::kNoServiceId;
    return result;
  }
  result.url = BuildImageUrl(service);
  return result;
}

absl::StatusOr<Manifest> ParseManifest(std::string_view json_text) {
  const json document =
      json::parse(json_text.begin(), json_text.end(), nullptr,
                  /*allow_exceptions=*/false);
  if (document.is_discarded()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Manifest is not valid JSON");
  }
  if (!document.is_object()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Manifest is not a JSON object");
  }

  auto items = document.find("items");
  if (items == document.end() || !items->is_array()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Manifest has no 'items' array of canvases");
  }

  Manifest manifest;
  manifest.id = GetString(document, "id").value_or(
      GetString(document, "@id").value_or(""));
  if (auto it = document.find("label"); it != document.end()) {
    manifest.label = ParseLabel(*it);
  }

  manifest.items.reserve(items->size());
  for (size_t i = 0; i < items->size(); ++i) {
    DECLARE_ASSIGN_OR_RETURN(Canvas, canvas, ParseCanvas((*items)[i], i));
    manifest.items.push_back(std::move(canvas));
  }
  return manifest;
}

absl::StatusOr<std::vector<ResolvedCanvas>> ResolveCanvases(
    const Manifest& manifest, const std::optional<core::PageRange>& range) {
  size_t first = 1;
  size_t last = manifest.items.size();
  if (range.has_value()) {
    RETURN_IF_ERROR(core::ValidateRange(*range, manifest.items.size()),
                    "canvas range does not fit the manifest");
    first = range->start;
    last = range->end;
  }

  std::vector<ResolvedCanvas> resolved;
  resolved.reserve(last >= first ? last - first + 1 : 0);
  for (size_t position = first; position <= last; ++position) {
    const Canvas& canvas = manifest.items[position - 1];
    ResolvedCanvas entry;
    entry.index = static_cast<uint32_t>(position);
    entry.canvas_id = canvas.id;
    entry.label = ExtractLabel(canvas.label, entry.index);
    entry.image = ResolveImageUrl(canvas);
    resolved.push_back(std::move(entry));
  }
  return resolved;
}

}  // namespace manifest
}  // namespace folio
