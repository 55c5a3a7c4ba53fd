#pragma once

#include "bsonc/core/common.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bsonc::bson {

using byte = bsonc::core::byte;
using bytes_view = bsonc::core::bytes_view;
using mutable_bytes_view = bsonc::core::mutable_bytes_view;

/**
 * @brief 元素类型标记（元素首字节）。
 *
 * 每个元素在线上的布局为：类型字节 + 以 0x00 结尾的 key + payload。
 * payload 的字节布局由类型决定，全部为小端序。
 */
enum class element_type : std::uint8_t {
  double_ = 0x01,
  string = 0x02,
  document = 0x03,
  array = 0x04,
  binary = 0x05,
  undefined = 0x06,
  object_id = 0x07,
  boolean = 0x08,
  datetime = 0x09,
  null = 0x0A,
  regex = 0x0B,
  dbpointer = 0x0C,
  javascript = 0x0D,
  symbol = 0x0E,
  code_with_scope = 0x0F,
  int32 = 0x10,
  timestamp = 0x11,
  int64 = 0x12,
  decimal128 = 0x13,
  min_key = 0xFF,
  max_key = 0x7F,
};

/**
 * @brief binary 元素的子类型字节。
 */
enum class binary_subtype : std::uint8_t {
  generic = 0x00,
  function = 0x01,
  binary_old = 0x02,
  uuid_old = 0x03,
  uuid = 0x04,
  md5 = 0x05,
  encrypted = 0x06,
  user_defined = 0x80,
};

[[nodiscard]] std::optional<element_type> element_type_from_byte(std::uint8_t b) noexcept;
[[nodiscard]] std::string_view to_string(element_type t) noexcept;

struct ObjectId final {
  std::array<byte, 12> bytes{};

  /**
   * @brief 由 24 位 16 进制文本解析；长度或字符非法返回 core::errc::invalid_argument。
   */
  static std::error_code from_hex(std::string_view text, ObjectId& out) noexcept;
  [[nodiscard]] std::string to_hex() const;
  [[nodiscard]] bool is_zero() const noexcept;

  friend bool operator==(const ObjectId&, const ObjectId&) = default;
};

// UTC 毫秒时间戳。
struct DateTime final {
  std::int64_t millis{0};
  friend bool operator==(const DateTime&, const DateTime&) = default;
};

// 内部复制用时间戳：t 为秒，i 为同一秒内的递增序号。
struct Timestamp final {
  std::uint32_t t{0};
  std::uint32_t i{0};
  friend bool operator==(const Timestamp&, const Timestamp&) = default;
};

// IEEE 754-2008 decimal128，仅作为不透明的 16 字节承载，不做算术。
struct Decimal128 final {
  std::uint64_t high{0};
  std::uint64_t low{0};
  friend bool operator==(const Decimal128&, const Decimal128&) = default;
};

struct Binary final {
  std::uint8_t subtype{static_cast<std::uint8_t>(binary_subtype::generic)};
  std::vector<byte> data;
  friend bool operator==(const Binary&, const Binary&) = default;
};

struct Regex final {
  std::string pattern;
  std::string options;
  friend bool operator==(const Regex&, const Regex&) = default;
};

struct DBPointer final {
  std::string ns;
  ObjectId id;
  friend bool operator==(const DBPointer&, const DBPointer&) = default;
};

struct JavaScript final {
  std::string code;
  friend bool operator==(const JavaScript&, const JavaScript&) = default;
};

struct Symbol final {
  std::string value;
  friend bool operator==(const Symbol&, const Symbol&) = default;
};

struct Null final {
  friend bool operator==(const Null&, const Null&) = default;
};
struct Undefined final {
  friend bool operator==(const Undefined&, const Undefined&) = default;
};
struct MinKey final {
  friend bool operator==(const MinKey&, const MinKey&) = default;
};
struct MaxKey final {
  friend bool operator==(const MaxKey&, const MaxKey&) = default;
};

}  // namespace bsonc::bson
