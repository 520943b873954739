#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "image/rgba_image.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace vinyl::image {

/// 8-byte PNG file signature.
inline constexpr std::array<u8, 8> kPngSignature = {
    0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};

/// PNG color type for 8-bit truecolor with alpha.
inline constexpr u8 kColorTypeRgba = 6;

/// Serialize one chunk: length, type, payload, CRC32(type + payload).
/// type must be exactly four ASCII characters.
void append_chunk(std::vector<u8>& out, std::string_view type,
                  const u8* data, size_t size);

/// Filter-type byte 0 before every row, rows concatenated.
std::vector<u8> build_scanlines(const RgbaImage& img);

/// Encode an RGBA image as a complete PNG byte stream
/// (signature, IHDR, a single IDAT, IEND).
Result<std::vector<u8>> encode_png(const RgbaImage& img,
                                   int compression_level = 9);

/// Write bytes to `path` via a sibling temporary file and a rename, so a
/// failed write never leaves a truncated file at `path`.
Result<void> write_file_atomic(const fs::path& path, const std::vector<u8>& bytes);

} // namespace vinyl::image
