#pragma once

// 读写游标共用的线上格式细节（小端整数、元素 payload 长度计算）。仅供 src/bson 内部使用。

#include "bsonc/bson/error.hpp"
#include "bsonc/bson/types.hpp"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <system_error>

namespace bsonc::bson::wire {

inline constexpr std::size_t kMaxInt32 = static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max());

template <class UInt>
UInt load_le(const byte* p) noexcept {
  UInt v = 0;
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    v = static_cast<UInt>(v | (static_cast<UInt>(p[i]) << (8u * i)));
  }
  return v;
}

template <class UInt>
void store_le(byte* p, UInt v) noexcept {
  for (std::size_t i = 0; i < sizeof(UInt); ++i) {
    p[i] = static_cast<byte>((v >> (8u * i)) & 0xFFu);
  }
}

// 从 in[pos] 开始扫描一个 C 字符串，成功时 len 为不含结尾 0x00 的长度。
inline std::error_code scan_cstring(bytes_view in, std::size_t pos, std::size_t& len) noexcept {
  if (pos > in.size()) {
    return make_error_code(errc::truncated);
  }
  const void* hit = std::memchr(in.data() + pos, 0, in.size() - pos);
  if (hit == nullptr) {
    return make_error_code(errc::truncated);
  }
  len = static_cast<std::size_t>(static_cast<const byte*>(hit) - (in.data() + pos));
  return {};
}

// 长度前缀字符串（int32 长度含结尾 0x00）：返回整体字节数（4 + len）。
inline std::error_code string_span(bytes_view in, std::size_t pos, std::size_t& size) noexcept {
  if (pos > in.size() || in.size() - pos < 4) {
    return make_error_code(errc::truncated);
  }
  const auto len = static_cast<std::int32_t>(load_le<std::uint32_t>(in.data() + pos));
  if (len < 1) {
    return make_error_code(errc::malformed_document);
  }
  const auto n = static_cast<std::size_t>(len);
  if (in.size() - pos - 4 < n) {
    return make_error_code(errc::truncated);
  }
  if (in[pos + 4 + n - 1] != 0) {
    return make_error_code(errc::malformed_document);
  }
  size = 4 + n;
  return {};
}

// 嵌入文档（长度前缀含自身 4 字节与结尾 0x00）：返回整体字节数。
inline std::error_code document_span(bytes_view in, std::size_t pos, std::size_t& size) noexcept {
  if (pos > in.size() || in.size() - pos < 4) {
    return make_error_code(errc::truncated);
  }
  const auto len = static_cast<std::int32_t>(load_le<std::uint32_t>(in.data() + pos));
  if (len < static_cast<std::int32_t>(core::kMinDocumentSize)) {
    return make_error_code(errc::malformed_document);
  }
  const auto n = static_cast<std::size_t>(len);
  if (in.size() - pos < n) {
    return make_error_code(errc::truncated);
  }
  if (in[pos + n - 1] != 0) {
    return make_error_code(errc::malformed_document);
  }
  size = n;
  return {};
}

/**
 * @brief 计算位于 in[pos] 的元素 payload 字节数（不解码 payload 内容）。
 *
 * skip 的核心：只读取长度前缀/定长字段即可越过整个值。
 */
inline std::error_code value_size(element_type type, bytes_view in, std::size_t pos, std::size_t& size) noexcept {
  auto fixed = [&](std::size_t n) -> std::error_code {
    if (pos > in.size() || in.size() - pos < n) {
      return make_error_code(errc::truncated);
    }
    size = n;
    return {};
  };

  switch (type) {
    case element_type::double_:
    case element_type::datetime:
    case element_type::timestamp:
    case element_type::int64:
      return fixed(8);
    case element_type::int32:
      return fixed(4);
    case element_type::boolean:
      return fixed(1);
    case element_type::object_id:
      return fixed(12);
    case element_type::decimal128:
      return fixed(16);
    case element_type::undefined:
    case element_type::null:
    case element_type::min_key:
    case element_type::max_key:
      return fixed(0);
    case element_type::string:
    case element_type::javascript:
    case element_type::symbol:
      return string_span(in, pos, size);
    case element_type::document:
    case element_type::array:
      return document_span(in, pos, size);
    case element_type::binary: {
      if (pos > in.size() || in.size() - pos < 5) {
        return make_error_code(errc::truncated);
      }
      const auto len = static_cast<std::int32_t>(load_le<std::uint32_t>(in.data() + pos));
      if (len < 0) {
        return make_error_code(errc::malformed_document);
      }
      const auto n = static_cast<std::size_t>(len);
      if (in.size() - pos - 5 < n) {
        return make_error_code(errc::truncated);
      }
      size = 5 + n;
      return {};
    }
    case element_type::regex: {
      std::size_t pattern_len = 0;
      auto ec = scan_cstring(in, pos, pattern_len);
      if (ec) {
        return ec;
      }
      std::size_t options_len = 0;
      ec = scan_cstring(in, pos + pattern_len + 1, options_len);
      if (ec) {
        return ec;
      }
      size = pattern_len + 1 + options_len + 1;
      return {};
    }
    case element_type::dbpointer: {
      std::size_t ns_size = 0;
      auto ec = string_span(in, pos, ns_size);
      if (ec) {
        return ec;
      }
      if (in.size() - pos - ns_size < 12) {
        return make_error_code(errc::truncated);
      }
      size = ns_size + 12;
      return {};
    }
    case element_type::code_with_scope: {
      if (pos > in.size() || in.size() - pos < 4) {
        return make_error_code(errc::truncated);
      }
      const auto total = static_cast<std::int32_t>(load_le<std::uint32_t>(in.data() + pos));
      // 总长 = 4（自身）+ string（至少 5）+ document（至少 5）。
      if (total < 14) {
        return make_error_code(errc::malformed_document);
      }
      const auto n = static_cast<std::size_t>(total);
      if (in.size() - pos < n) {
        return make_error_code(errc::truncated);
      }
      const auto scoped = in.subspan(pos, n);
      std::size_t code_size = 0;
      auto ec = string_span(scoped, 4, code_size);
      if (ec) {
        return ec;
      }
      std::size_t scope_size = 0;
      ec = document_span(scoped, 4 + code_size, scope_size);
      if (ec) {
        return ec;
      }
      if (4 + code_size + scope_size != n) {
        return make_error_code(errc::malformed_document);
      }
      size = n;
      return {};
    }
  }
  return make_error_code(errc::unknown_element_type);
}

}  // namespace bsonc::bson::wire
