#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace bsonc::core {

using byte = std::uint8_t;
using bytes_view = std::span<const byte>;
using mutable_bytes_view = std::span<byte>;

// 单个文档的最小长度：4 字节长度前缀 + 结尾 0x00。
inline constexpr std::size_t kMinDocumentSize = 5;

// 文档嵌套深度上限：防止恶意输入（或循环引用的指针图）导致栈溢出。
inline constexpr std::size_t kMaxDocumentDepth = 100;

// 流式 Decoder 默认允许的最大文档长度（16MB，与常见服务端上限一致）。
inline constexpr std::size_t kDefaultMaxDocumentSize = 16 * 1024 * 1024;

}  // namespace bsonc::core
