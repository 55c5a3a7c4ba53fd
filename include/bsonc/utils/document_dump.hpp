#pragma once

#include "bsonc/core/common.hpp"

#include <cstddef>
#include <string>

namespace bsonc::utils {

/**
 * @brief 文档字节的可读化输出（调试/日志用途）。
 *
 * 说明：
 * - 直接遍历线上字节，不先解码为 bson::Value，因此也能输出损坏文档的有效前缀；
 * - 遇到格式错误时在出错位置输出 <error: ...>，并附带绝对偏移；
 * - 输出不是 Extended JSON，只保证人眼可读。
 */
struct DumpOptions final {
    // 递归最大深度：更深的子文档输出为 { ... }。
    std::size_t max_depth{16};

    // 每个文档/数组最多输出的元素数（0 表示不限制）。
    std::size_t max_elements{128};

    // string/binary 最多输出的字节数（0 表示不限制）。
    std::size_t max_payload_bytes{256};

    // 是否使用多行缩进格式。
    bool multiline{true};

    // 每层缩进空格数（multiline=true 时生效）。
    std::size_t indent_spaces{2};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

/**
 * @brief 将一篇完整文档格式化为字符串。
 */
[[nodiscard]] std::string dump_document(bsonc::core::bytes_view doc,
                                        DumpOptions options = {});

} // namespace bsonc::utils
