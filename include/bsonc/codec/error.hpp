#pragma once

#include <system_error>

namespace bsonc::codec {

/**
 * @brief Codec 层（注册表、结构体/映射 Codec、默认 Codec）错误码。
 *
 * 说明：
 * - unregistered_type/tag_conflict 来自注册表查找与构建；
 * - 其余为单次编码/解码失败，只中止当前调用，不影响注册表状态。
 */
enum class errc : int {
  ok = 0,
  unregistered_type = 1,
  tag_conflict = 2,
  precision_loss = 3,
  field_access_denied = 4,
  incompatible_type = 5,
  overflow = 6,
  unknown_field = 7,
  duplicate_key = 8,
  unsupported_key = 9,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bsonc::codec

namespace std {
template <>
struct is_error_code_enum<bsonc::codec::errc> : true_type {};
}  // namespace std
