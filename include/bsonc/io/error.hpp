#pragma once

#include <system_error>

namespace bsonc::io {

// 流式 Encoder/Decoder 错误码；底层传输错误（asio）原样透传。
enum class errc : int {
  ok = 0,
  end_of_stream = 1,
  document_too_large = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace bsonc::io

namespace std {
template <>
struct is_error_code_enum<bsonc::io::errc> : true_type {};
}  // namespace std
