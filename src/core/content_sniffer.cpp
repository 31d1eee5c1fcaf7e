/**
 * @file content_sniffer.cpp
 * @brief Implementation of byte-signature MIME detection
 */

#include "pipedream/core/content_sniffer.h"

#include <array>
#include <cstdint>
#include <string_view>

namespace pipedream {

namespace {

using byte_view = std::span<const uint8_t>;

constexpr std::string_view text_plain = "text/plain; charset=utf-8";
constexpr std::string_view octet_stream = "application/octet-stream";

auto is_whitespace(uint8_t b) -> bool {
    return b == '\t' || b == '\n' || b == '\x0c' || b == '\r' || b == ' ';
}

auto is_tag_terminator(uint8_t b) -> bool {
    return b == ' ' || b == '>';
}

auto starts_with(byte_view data, std::string_view prefix) -> bool {
    if (data.size() < prefix.size()) {
        return false;
    }
    for (std::size_t i = 0; i < prefix.size(); ++i) {
        if (data[i] != static_cast<uint8_t>(prefix[i])) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Pattern match where '?' in the pattern accepts any byte
 */
auto matches_masked(byte_view data, std::string_view pattern) -> bool {
    if (data.size() < pattern.size()) {
        return false;
    }
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] != '?' && data[i] != static_cast<uint8_t>(pattern[i])) {
            return false;
        }
    }
    return true;
}

auto skip_whitespace(byte_view data) -> byte_view {
    std::size_t i = 0;
    while (i < data.size() && is_whitespace(data[i])) {
        ++i;
    }
    return data.subspan(i);
}

// Case-insensitive HTML tag match followed by a space or '>'.
auto matches_html_tag(byte_view data, std::string_view tag) -> bool {
    if (data.size() < tag.size() + 1) {
        return false;
    }
    for (std::size_t i = 0; i < tag.size(); ++i) {
        uint8_t b = data[i];
        auto expected = static_cast<uint8_t>(tag[i]);
        if (expected >= 'A' && expected <= 'Z') {
            b = static_cast<uint8_t>(b & 0xDF);
        }
        if (b != expected) {
            return false;
        }
    }
    return is_tag_terminator(data[tag.size()]);
}

auto is_html(byte_view data) -> bool {
    static constexpr std::array<std::string_view, 17> tags = {
        "<!DOCTYPE HTML", "<HTML", "<HEAD", "<SCRIPT", "<IFRAME", "<H1",
        "<DIV", "<FONT", "<TABLE", "<A", "<STYLE", "<TITLE", "<B",
        "<BODY", "<BR", "<P", "<!--",
    };
    auto trimmed = skip_whitespace(data);
    for (auto tag : tags) {
        if (matches_html_tag(trimmed, tag)) {
            return true;
        }
    }
    return false;
}

auto is_mp4(byte_view data) -> bool {
    if (data.size() < 12) {
        return false;
    }
    uint32_t box_size = (static_cast<uint32_t>(data[0]) << 24) |
                        (static_cast<uint32_t>(data[1]) << 16) |
                        (static_cast<uint32_t>(data[2]) << 8) |
                        static_cast<uint32_t>(data[3]);
    if (box_size < 12 || box_size % 4 != 0 || data.size() < box_size) {
        return false;
    }
    if (!starts_with(data.subspan(4), "ftyp")) {
        return false;
    }
    for (std::size_t st = 8; st < box_size; st += 4) {
        if (st == 12) {
            // minor version field
            continue;
        }
        if (st + 3 <= data.size() && starts_with(data.subspan(st), "mp4")) {
            return true;
        }
    }
    return false;
}

auto is_binary_byte(uint8_t b) -> bool {
    return b <= 0x08 || b == 0x0B || (b >= 0x0E && b <= 0x1A) || (b >= 0x1C && b <= 0x1F);
}

struct exact_signature {
    std::string_view prefix;
    std::string_view content_type;
};

struct masked_signature {
    std::string_view pattern;
    std::string_view content_type;
};

constexpr std::string_view sv(const char* data, std::size_t size) {
    return std::string_view(data, size);
}

}  // namespace

auto detect_content_type(std::span<const std::byte> input) -> std::string {
    byte_view data(reinterpret_cast<const uint8_t*>(input.data()),
                   input.size() < sniff_length ? input.size() : sniff_length);

    if (is_html(data)) {
        return "text/html; charset=utf-8";
    }
    if (starts_with(skip_whitespace(data), "<?xml")) {
        return "text/xml; charset=utf-8";
    }

    static const exact_signature exact[] = {
        {"%PDF-", "application/pdf"},
        {"%!PS-Adobe-", "application/postscript"},
        {"\xFE\xFF", "text/plain; charset=utf-16be"},
        {"\xFF\xFE", "text/plain; charset=utf-16le"},
        {"\xEF\xBB\xBF", "text/plain; charset=utf-8"},
        {sv("\x00\x00\x01\x00", 4), "image/x-icon"},
        {sv("\x00\x00\x02\x00", 4), "image/x-icon"},
        {"BM", "image/bmp"},
        {"GIF87a", "image/gif"},
        {"GIF89a", "image/gif"},
        {"\x89PNG\x0D\x0A\x1A\x0A", "image/png"},
        {"\xFF\xD8\xFF", "image/jpeg"},
        {"ID3", "audio/mpeg"},
        {sv("OggS\x00", 5), "application/ogg"},
        {sv("MThd\x00\x00\x00\x06", 8), "audio/midi"},
        {"\x1A\x45\xDF\xA3", "video/webm"},
        {"wOFF", "font/woff"},
        {"wOF2", "font/woff2"},
        {"\x1F\x8B\x08", "application/x-gzip"},
        {"PK\x03\x04", "application/zip"},
        {sv("Rar!\x1A\x07\x00", 7), "application/x-rar-compressed"},
        {sv("Rar!\x1A\x07\x01\x00", 8), "application/x-rar-compressed"},
        {sv("\x00\x61\x73\x6D", 4), "application/wasm"},
    };

    static const masked_signature masked[] = {
        {"RIFF????WEBPVP", "image/webp"},
        {"FORM????AIFF", "audio/aiff"},
        {"RIFF????AVI ", "video/avi"},
        {"RIFF????WAVE", "audio/wave"},
    };

    for (const auto& sig : exact) {
        if (starts_with(data, sig.prefix)) {
            return std::string(sig.content_type);
        }
    }
    for (const auto& sig : masked) {
        if (matches_masked(data, sig.pattern)) {
            return std::string(sig.content_type);
        }
    }
    if (is_mp4(data)) {
        return "video/mp4";
    }

    for (auto b : data) {
        if (is_binary_byte(b)) {
            return std::string(octet_stream);
        }
    }
    return std::string(text_plain);
}

}  // namespace pipedream
