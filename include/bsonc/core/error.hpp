#pragma once

#include <system_error>

namespace bsonc::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有编解码接口返回 std::error_code，不抛异常；
 * - 各模块（bson/codec/io）有自己的 errc 与 error_category，
 *   这里只放与具体模块无关的参数类错误。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bsonc::core

namespace std {
template <>
struct is_error_code_enum<bsonc::core::errc> : true_type {};
}  // namespace std
