#include "bsonc/bson/types.hpp"

#include "bsonc/core/error.hpp"
#include "bsonc/utils/hex.hpp"

#include <algorithm>

namespace bsonc::bson {

std::optional<element_type> element_type_from_byte(std::uint8_t b) noexcept {
  switch (static_cast<element_type>(b)) {
    case element_type::double_:
    case element_type::string:
    case element_type::document:
    case element_type::array:
    case element_type::binary:
    case element_type::undefined:
    case element_type::object_id:
    case element_type::boolean:
    case element_type::datetime:
    case element_type::null:
    case element_type::regex:
    case element_type::dbpointer:
    case element_type::javascript:
    case element_type::symbol:
    case element_type::code_with_scope:
    case element_type::int32:
    case element_type::timestamp:
    case element_type::int64:
    case element_type::decimal128:
    case element_type::min_key:
    case element_type::max_key:
      return static_cast<element_type>(b);
    default:
      return std::nullopt;
  }
}

std::string_view to_string(element_type t) noexcept {
  switch (t) {
    case element_type::double_:
      return "double";
    case element_type::string:
      return "string";
    case element_type::document:
      return "document";
    case element_type::array:
      return "array";
    case element_type::binary:
      return "binary";
    case element_type::undefined:
      return "undefined";
    case element_type::object_id:
      return "objectId";
    case element_type::boolean:
      return "bool";
    case element_type::datetime:
      return "datetime";
    case element_type::null:
      return "null";
    case element_type::regex:
      return "regex";
    case element_type::dbpointer:
      return "dbPointer";
    case element_type::javascript:
      return "javascript";
    case element_type::symbol:
      return "symbol";
    case element_type::code_with_scope:
      return "codeWithScope";
    case element_type::int32:
      return "int32";
    case element_type::timestamp:
      return "timestamp";
    case element_type::int64:
      return "int64";
    case element_type::decimal128:
      return "decimal128";
    case element_type::min_key:
      return "minKey";
    case element_type::max_key:
      return "maxKey";
  }
  return "unknown";
}

std::error_code ObjectId::from_hex(std::string_view text, ObjectId& out) noexcept {
  // 固定 24 个 hex 字符；失败时 out 不变。
  std::array<byte, 12> raw{};
  auto ec = utils::decode_hex_exact(text, mutable_bytes_view{raw.data(), raw.size()});
  if (ec) {
    return ec;
  }
  out.bytes = raw;
  return {};
}

std::string ObjectId::to_hex() const {
  return utils::to_hex(bytes_view{bytes.data(), bytes.size()});
}

bool ObjectId::is_zero() const noexcept {
  return std::all_of(bytes.begin(), bytes.end(), [](byte b) { return b == 0; });
}

}  // namespace bsonc::bson
