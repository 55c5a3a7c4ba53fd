#pragma once

#include "bsonc/core/common.hpp"
#include "bsonc/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bsonc::utils {

struct HexDumpOptions final {
    std::size_t bytes_per_line{16};

    // 最多输出的字节数（0 表示不限制），超出时追加一行截断提示。
    std::size_t max_bytes{256};

    bool show_offset{true};

    // 行尾附加可打印字符列（不可打印字符显示为 '.'）。
    bool show_ascii{false};
};

/**
 * @brief 把原始文档字节格式化为多行 hexdump，用于日志与排查。
 *
 * 每行形如 "0010: 0c 00 00 00 ..."，偏移为十六进制。
 */
[[nodiscard]] std::string hex_dump(core::bytes_view bytes,
                                   HexDumpOptions options = {});

// 紧凑小写 hex，无分隔符（ObjectId 文本形式即由此生成）。
[[nodiscard]] std::string to_hex(core::bytes_view bytes);

/**
 * @brief 宽松解析：把 "0c 00 00 00 10 ..." 这类文本转换为字节。
 *
 * - 忽略空白与 , ; : - _ | 以及各种括号；
 * - 字节边界上的 0x/0X 前缀会被跳过；
 * - 非 hex 字符或奇数个 hex 位返回 core::errc::invalid_argument，out 被清空。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<core::byte> &out) noexcept;

/**
 * @brief 严格解析：text 必须恰好是 2 * out.size() 个 hex 字符，不允许分隔符。
 */
std::error_code decode_hex_exact(std::string_view text,
                                 core::mutable_bytes_view out) noexcept;

} // namespace bsonc::utils
