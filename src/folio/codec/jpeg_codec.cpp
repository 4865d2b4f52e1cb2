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

#include "folio/codec/jpeg_codec.h"

#include <algorithm>
#include <array>
#include <csetjmp>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include <jpeglib.h>

#include "absl/status/status.h"
#include "absl/strings/str_format.h"
#include "foliocore/status/status_macros.h"

namespace folio::codec {

namespace {  // ---- libjpeg error manager ----

/// @brief Error manager that longjmps back instead of calling exit()
struct JpegErrorManager {
  jpeg_error_mgr pub{};
  std::jmp_buf jump_buffer{};
  char error_message[JMSG_LENGTH_MAX]{};

  static void ErrorExit(j_common_ptr cinfo) {
    auto* self = reinterpret_cast<JpegErrorManager*>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, self->error_message);
    std::longjmp(self->jump_buffer, 1);
  }

  // Corrupt-data warnings are promoted to errors; a tile that decodes with
  // warnings is garbage we would rather leave blank.
  static void EmitMessage(j_common_ptr cinfo, int msg_level) {
    if (msg_level < 0) {
      ErrorExit(cinfo);
    }
  }
};

/// @brief Owns a decompressor for the duration of one decode
struct Decompressor {
  jpeg_decompress_struct cinfo{};
  JpegErrorManager err{};

  Decompressor() {
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = JpegErrorManager::ErrorExit;
    err.pub.emit_message = JpegErrorManager::EmitMessage;
    jpeg_create_decompress(&cinfo);
  }
  ~Decompressor() { jpeg_destroy_decompress(&cinfo); }

  Decompressor(const Decompressor&) = delete;
  Decompressor& operator=(const Decompressor&) = delete;
};

/// @brief Owns a compressor and its malloc'd output buffer
struct Compressor {
  jpeg_compress_struct cinfo{};
  JpegErrorManager err{};
  unsigned char* buffer = nullptr;
  unsigned long buffer_size = 0;  // NOLINT(runtime/int): libjpeg API type

  Compressor() {
    cinfo.err = jpeg_std_error(&err.pub);
    err.pub.error_exit = JpegErrorManager::ErrorExit;
    jpeg_create_compress(&cinfo);
  }
  ~Compressor() {
    jpeg_destroy_compress(&cinfo);
    std::free(buffer);
  }

  Compressor(const Compressor&) = delete;
  Compressor& operator=(const Compressor&) = delete;
};

}  // namespace

absl::StatusOr<Image> DecodeJpeg(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument, "Empty JPEG data");
  }

  Decompressor d;
  jpeg_decompress_struct* c = &d.cinfo;

  // Every libjpeg failure below lands here. No C++ object with a non-trivial
  // destructor may be constructed between setjmp and the longjmp.
  std::vector<uint8_t> pixels;
  if (setjmp(d.err.jump_buffer)) {
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        absl::StrFormat("JPEG decode error: %s", d.err.error_message));
  }

  jpeg_mem_src(c, data.data(), static_cast<unsigned long>(data.size()));

  if (jpeg_read_header(c, TRUE) != JPEG_HEADER_OK) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to read JPEG header");
  }

  const bool grayscale = c->jpeg_color_space == JCS_GRAYSCALE;
  c->out_color_space = grayscale ? JCS_GRAYSCALE : JCS_RGB;
  c->quantize_colors = FALSE;

  if (!jpeg_start_decompress(c)) {
    return MAKE_STATUS(absl::StatusCode::kDataLoss,
                       "Failed to start JPEG decompression");
  }

  const uint32_t width = static_cast<uint32_t>(c->output_width);
  const uint32_t height = static_cast<uint32_t>(c->output_height);
  const int components = c->output_components;
  if (components != 1 && components != 3) {
    jpeg_abort_decompress(c);
    return MAKE_STATUS(
        absl::StatusCode::kDataLoss,
        absl::StrFormat("Expected 1 or 3 JPEG components, got %d",
                        components));
  }

  pixels.resize(static_cast<size_t>(width) * height * components);
  const size_t row_stride = static_cast<size_t>(width) * components;

  // Batch a few scanlines to reduce call overhead
  constexpr JDIMENSION kBatch = 16;
  std::array<JSAMPROW, kBatch> rows{};
  while (c->output_scanline < c->output_height) {
    const JDIMENSION n =
        std::min<JDIMENSION>(kBatch, c->output_height - c->output_scanline);
    for (JDIMENSION i = 0; i < n; ++i) {
      rows[i] = pixels.data() +
                (static_cast<size_t>(c->output_scanline) + i) * row_stride;
    }
    if (jpeg_read_scanlines(c, rows.data(), n) == 0) {
      jpeg_abort_decompress(c);
      return MAKE_STATUS(absl::StatusCode::kDataLoss,
                         "jpeg_read_scanlines returned 0");
    }
  }
  jpeg_finish_decompress(c);

  if (!grayscale) {
    return Image(ImageDimensions{width, height}, std::move(pixels));
  }

  Image rgb(ImageDimensions{width, height});
  uint8_t* dst = rgb.GetData();
  for (size_t i = 0; i < pixels.size(); ++i) {
    dst[3 * i + 0] = pixels[i];
    dst[3 * i + 1] = pixels[i];
    dst[3 * i + 2] = pixels[i];
  }
  return rgb;
}

absl::StatusOr<std::vector<uint8_t>> EncodeJpeg(const Image& image,
                                                int quality) {
  if (image.Empty()) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       "Cannot encode an empty image");
  }
  if (quality < 1 || quality > 100) {
    return MAKE_STATUS(absl::StatusCode::kInvalidArgument,
                       absl::StrFormat("JPEG quality %d not in 1..100",
                                       quality));
  }

  Compressor e;
  jpeg_compress_struct* c = &e.cinfo;

  if (setjmp(e.err.jump_buffer)) {
    return MAKE_STATUS(
        absl::StatusCode::kInternal,
        absl::StrFormat("JPEG encode error: %s", e.err.error_message));
  }

  jpeg_mem_dest(c, &e.buffer, &e.buffer_size);

  c->image_width = image.GetWidth();
  c->image_height = image.GetHeight();
  c->input_components = static_cast<int>(Image::kChannels);
  c->in_color_space = JCS_RGB;
  jpeg_set_defaults(c);
  jpeg_set_quality(c, quality, TRUE);

  jpeg_start_compress(c, TRUE);
  const size_t row_stride = image.GetStride();
  // libjpeg takes non-const row pointers but only reads through them.
  auto* base = const_cast<uint8_t*>(image.GetData());
  while (c->next_scanline < c->image_height) {
    JSAMPROW row = base + static_cast<size_t>(c->next_scanline) * row_stride;
    jpeg_write_scanlines(c, &row, 1);
  }
  jpeg_finish_compress(c);

  return std::vector<uint8_t>(e.buffer, e.buffer + e.buffer_size);
}

}  // namespace folio::codec
