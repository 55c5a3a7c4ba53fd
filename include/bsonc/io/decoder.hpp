#pragma once

#include "bsonc/codec/marshal.hpp"
#include "bsonc/core/common.hpp"
#include "bsonc/io/error.hpp"
#include "bsonc/io/stream.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace bsonc::io {

struct DecoderOptions final {
  // 单篇文档长度上限（含长度前缀）；超过返回 errc::document_too_large。
  std::size_t max_document_size{core::kDefaultMaxDocumentSize};
  codec::DecodeOptions decode{};
};

/**
 * @brief 流式解码器：按长度前缀从流中切出一篇篇文档并解码。
 *
 * 说明：
 * - 新文档开始前流正常结束：返回 errc::end_of_stream；
 * - 文档中途结束：返回 bson::errc::truncated；
 * - 长度前缀小于 5：返回 bson::errc::malformed_document。
 */
class Decoder final {
 public:
  Decoder(Stream& stream, const codec::Registry& registry, DecoderOptions options = {})
    : stream_(stream), registry_(registry), options_(options) {}

  template <class T>
  std::error_code decode(T& value) {
    return decode_ref(reflect::make_ref(value));
  }

  std::error_code decode_ref(reflect::ValueRef v);

  /**
   * @brief 只切出下一篇文档的原始字节（不解码）。
   */
  std::error_code read_document(std::vector<core::byte>& out);

  [[nodiscard]] std::size_t documents_read() const noexcept { return documents_; }

 private:
  Stream& stream_;
  const codec::Registry& registry_;
  DecoderOptions options_{};
  std::vector<core::byte> buffer_{};
  std::size_t documents_{0};
};

}  // namespace bsonc::io
