#include "image/png_writer.hpp"

#include <algorithm>
#include <fstream>
#include <string>
#include <system_error>

#include <spdlog/spdlog.h>
#include <zlib.h>

namespace vinyl::image {

namespace {

/// Appends big-endian integers and raw bytes to a buffer.
class BinaryWriter {
public:
    explicit BinaryWriter(std::vector<u8>& out) : out_(out) {}

    void write_u8(u8 v) { out_.push_back(v); }

    void write_u32_be(u32 v) {
        out_.push_back(static_cast<u8>((v >> 24) & 0xFF));
        out_.push_back(static_cast<u8>((v >> 16) & 0xFF));
        out_.push_back(static_cast<u8>((v >> 8) & 0xFF));
        out_.push_back(static_cast<u8>(v & 0xFF));
    }

    void write_bytes(const u8* data, size_t size) {
        if (size > 0) out_.insert(out_.end(), data, data + size);
    }

private:
    std::vector<u8>& out_;
};

u32 chunk_crc(std::string_view type, const u8* data, size_t size) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, reinterpret_cast<const Bytef*>(type.data()),
                static_cast<uInt>(type.size()));
    // zlib takes uInt lengths; feed large payloads in pieces
    while (size > 0) {
        uInt piece = static_cast<uInt>(std::min<size_t>(size, 1u << 30));
        crc = crc32(crc, data, piece);
        data += piece;
        size -= piece;
    }
    return static_cast<u32>(crc);
}

} // namespace

void append_chunk(std::vector<u8>& out, std::string_view type,
                  const u8* data, size_t size) {
    BinaryWriter w(out);
    w.write_u32_be(static_cast<u32>(size));
    w.write_bytes(reinterpret_cast<const u8*>(type.data()), type.size());
    w.write_bytes(data, size);
    w.write_u32_be(chunk_crc(type, data, size));
}

std::vector<u8> build_scanlines(const RgbaImage& img) {
    const size_t row_bytes = img.row_bytes();
    std::vector<u8> raw;
    raw.reserve((row_bytes + 1) * img.height);
    for (u32 y = 0; y < img.height; ++y) {
        raw.push_back(0); // filter type: None
        const u8* row = img.pixels.data() + y * row_bytes;
        raw.insert(raw.end(), row, row + row_bytes);
    }
    return raw;
}

Result<std::vector<u8>> encode_png(const RgbaImage& img, int compression_level) {
    if (img.width == 0 || img.height == 0) {
        return Error("PNG image must have non-zero dimensions");
    }
    const size_t expected = static_cast<size_t>(img.width) * img.height * 4;
    if (img.pixels.size() != expected) {
        return Error("PNG pixel buffer has " + std::to_string(img.pixels.size()) +
                     " bytes, expected " + std::to_string(expected));
    }
    if (compression_level < 0 || compression_level > 9) {
        return Error("invalid zlib compression level " +
                     std::to_string(compression_level));
    }

    std::vector<u8> raw = build_scanlines(img);

    uLongf compressed_size = compressBound(static_cast<uLong>(raw.size()));
    std::vector<u8> compressed(compressed_size);
    int zret = compress2(compressed.data(), &compressed_size, raw.data(),
                         static_cast<uLong>(raw.size()), compression_level);
    if (zret != Z_OK) {
        return Error("zlib compress2 failed (code " + std::to_string(zret) + ")");
    }
    compressed.resize(compressed_size);
    spdlog::debug("Compressed {} scanline bytes to {} bytes", raw.size(),
                  compressed.size());

    std::vector<u8> ihdr;
    BinaryWriter h(ihdr);
    h.write_u32_be(img.width);
    h.write_u32_be(img.height);
    h.write_u8(8);              // bit depth
    h.write_u8(kColorTypeRgba);
    h.write_u8(0);              // compression: deflate
    h.write_u8(0);              // filter method
    h.write_u8(0);              // interlace: none

    std::vector<u8> png(kPngSignature.begin(), kPngSignature.end());
    png.reserve(png.size() + 3 * 12 + ihdr.size() + compressed.size());
    append_chunk(png, "IHDR", ihdr.data(), ihdr.size());
    append_chunk(png, "IDAT", compressed.data(), compressed.size());
    append_chunk(png, "IEND", nullptr, 0);
    return png;
}

Result<void> write_file_atomic(const fs::path& path, const std::vector<u8>& bytes) {
    fs::path tmp_path = path;
    tmp_path += ".tmp";

    {
        std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return Error("Failed to open " + tmp_path.string() + " for writing");
        }
        file.write(reinterpret_cast<const char*>(bytes.data()),
                   static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file) {
            file.close();
            std::error_code ignored;
            fs::remove(tmp_path, ignored);
            return Error("Failed to write " + tmp_path.string());
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp_path, ignored);
        return Error("Failed to rename " + tmp_path.string() + " to " +
                     path.string() + ": " + ec.message());
    }
    return {};
}

} // namespace vinyl::image
