#pragma once

#include "core/types.hpp"
#include "image/rgba_image.hpp"

#include <cstring>
#include <string>
#include <vector>

#include <zlib.h>

namespace vinyl::test {

/// Minimal reader for the PNGs produced by encode_png: checks the signature
/// and every chunk CRC, inflates IDAT and undoes filter type 0.
struct DecodedPng {
    bool ok = false;
    std::string error;
    std::vector<std::string> chunk_types;
    u32 width = 0;
    u32 height = 0;
    u8 bit_depth = 0;
    u8 color_type = 0;
    u8 compression = 0;
    u8 filter = 0;
    u8 interlace = 0;
    std::vector<u8> pixels;
};

inline u32 read_u32_be(const std::vector<u8>& b, size_t pos) {
    return (static_cast<u32>(b[pos]) << 24) | (static_cast<u32>(b[pos + 1]) << 16) |
           (static_cast<u32>(b[pos + 2]) << 8) | static_cast<u32>(b[pos + 3]);
}

inline DecodedPng decode_png(const std::vector<u8>& bytes) {
    DecodedPng out;
    static const u8 sig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1a, '\n'};
    if (bytes.size() < 8 || std::memcmp(bytes.data(), sig, 8) != 0) {
        out.error = "bad signature";
        return out;
    }

    std::vector<u8> idat;
    size_t pos = 8;
    while (pos + 12 <= bytes.size()) {
        u32 length = read_u32_be(bytes, pos);
        if (pos + 12 + length > bytes.size()) {
            out.error = "truncated chunk";
            return out;
        }
        std::string type(reinterpret_cast<const char*>(&bytes[pos + 4]), 4);
        const u8* payload = bytes.data() + pos + 8;
        u32 stored_crc = read_u32_be(bytes, pos + 8 + length);
        uLong crc = crc32(0L, bytes.data() + pos + 4, 4 + length);
        if (static_cast<u32>(crc) != stored_crc) {
            out.error = "CRC mismatch in " + type;
            return out;
        }
        out.chunk_types.push_back(type);

        if (type == "IHDR" && length == 13) {
            std::vector<u8> h(payload, payload + 13);
            out.width = read_u32_be(h, 0);
            out.height = read_u32_be(h, 4);
            out.bit_depth = h[8];
            out.color_type = h[9];
            out.compression = h[10];
            out.filter = h[11];
            out.interlace = h[12];
        } else if (type == "IDAT") {
            idat.insert(idat.end(), payload, payload + length);
        }
        pos += 12 + length;
        if (type == "IEND") break;
    }

    const size_t row_bytes = static_cast<size_t>(out.width) * 4;
    std::vector<u8> raw((row_bytes + 1) * out.height);
    uLongf raw_size = static_cast<uLongf>(raw.size());
    if (uncompress(raw.data(), &raw_size, idat.data(),
                   static_cast<uLong>(idat.size())) != Z_OK ||
        raw_size != raw.size()) {
        out.error = "inflate failed";
        return out;
    }

    for (u32 y = 0; y < out.height; ++y) {
        const u8* row = raw.data() + y * (row_bytes + 1);
        if (row[0] != 0) {
            out.error = "unexpected filter type";
            return out;
        }
        out.pixels.insert(out.pixels.end(), row + 1, row + 1 + row_bytes);
    }
    out.ok = true;
    return out;
}

} // namespace vinyl::test
