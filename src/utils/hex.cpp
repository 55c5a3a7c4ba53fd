#include "bsonc/utils/hex.hpp"

#include <algorithm>
#include <cstdio>

namespace bsonc::utils {
namespace {

constexpr std::string_view kDigits = "0123456789abcdef";
constexpr std::string_view kSeparators = " \t\r\n,;:-_|[](){}";

// 返回 nibble 值；不是 hex 字符时返回 -1。
[[nodiscard]] int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

void append_byte(std::string &out, core::byte b) {
    out.push_back(kDigits[(b >> 4) & 0x0F]);
    out.push_back(kDigits[b & 0x0F]);
}

void append_offset(std::string &out, std::size_t offset) {
    char buf[24];
    const int n = std::snprintf(buf, sizeof(buf), "%04zx: ", offset);
    if (n > 0) {
        out.append(buf, static_cast<std::size_t>(n));
    }
}

} // namespace

std::string hex_dump(core::bytes_view bytes, HexDumpOptions options) {
    const std::size_t total = bytes.size();
    const std::size_t shown =
        options.max_bytes == 0 ? total : std::min(total, options.max_bytes);
    const std::size_t per_line =
        options.bytes_per_line == 0 ? std::size_t{16} : options.bytes_per_line;

    std::string out;
    out.reserve((shown / per_line + 2) * (per_line * 4 + 8));

    for (std::size_t offset = 0; offset < shown; offset += per_line) {
        const auto line = bytes.subspan(offset, std::min(per_line, shown - offset));

        if (options.show_offset) {
            append_offset(out, offset);
        }
        for (std::size_t i = 0; i < line.size(); ++i) {
            if (i != 0) {
                out.push_back(' ');
            }
            append_byte(out, line[i]);
        }

        if (options.show_ascii) {
            // 末行补齐到整行宽度，ASCII 列才能对齐
            out.append((per_line - line.size()) * 3 + 3, ' ');
            for (const auto b : line) {
                out.push_back((b >= 0x20 && b <= 0x7E) ? static_cast<char>(b) : '.');
            }
        }
        out.push_back('\n');
    }

    if (shown < total) {
        out += "... (truncated, total=" + std::to_string(total) + " bytes)\n";
    }
    return out;
}

std::string to_hex(core::bytes_view bytes) {
    std::string out;
    out.reserve(bytes.size() * 2);
    for (const auto b : bytes) {
        append_byte(out, b);
    }
    return out;
}

std::error_code parse_hex(std::string_view text,
                          std::vector<core::byte> &out) noexcept {
    out.clear();
    const auto invalid = core::make_error_code(core::errc::invalid_argument);

    int high = -1;
    std::size_t i = 0;
    while (i < text.size()) {
        const char c = text[i];
        if (kSeparators.find(c) != std::string_view::npos) {
            ++i;
            continue;
        }
        // 0x 前缀只在字节边界上识别
        if (high < 0 && c == '0' && i + 1 < text.size() &&
            (text[i + 1] == 'x' || text[i + 1] == 'X')) {
            i += 2;
            continue;
        }

        const int v = nibble(c);
        if (v < 0) {
            out.clear();
            return invalid;
        }
        if (high < 0) {
            high = v;
        } else {
            out.push_back(static_cast<core::byte>((high << 4) | v));
            high = -1;
        }
        ++i;
    }

    if (high >= 0) {
        out.clear();
        return invalid;
    }
    return {};
}

std::error_code decode_hex_exact(std::string_view text,
                                 core::mutable_bytes_view out) noexcept {
    if (text.size() != out.size() * 2) {
        return core::make_error_code(core::errc::invalid_argument);
    }
    for (std::size_t i = 0; i < out.size(); ++i) {
        const int hi = nibble(text[2 * i]);
        const int lo = nibble(text[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return core::make_error_code(core::errc::invalid_argument);
        }
        out[i] = static_cast<core::byte>((hi << 4) | lo);
    }
    return {};
}

} // namespace bsonc::utils
