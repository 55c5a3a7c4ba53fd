#pragma once

#include <system_error>

namespace bsonc::bson {

/**
 * @brief 文档读写层（DocumentReader/DocumentWriter）错误码。
 *
 * 说明：
 * - truncated/malformed_document/unknown_element_type 属于输入不合法，
 *   只会出现在解码方向；
 * - cursor_invariant 表示写入侧 open/close 不配对，通常是 Codec 实现 bug。
 */
enum class errc : int {
  ok = 0,
  truncated = 1,
  malformed_document = 2,
  unknown_element_type = 3,
  type_mismatch = 4,
  invalid_key = 5,
  length_overflow = 6,
  cursor_invariant = 7,
  not_a_document = 8,
  depth_exceeded = 9,
  key_not_found = 10,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bsonc::bson

namespace std {
template <>
struct is_error_code_enum<bsonc::bson::errc> : true_type {};
}  // namespace std
