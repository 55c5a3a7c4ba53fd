#pragma once

#include "bsonc/codec/marshal.hpp"
#include "bsonc/io/stream.hpp"

#include <cstddef>
#include <system_error>
#include <vector>

namespace bsonc::io {

/**
 * @brief 流式编码器：每次 encode 把一个值编码为一篇文档并整体写入流。
 *
 * 编码失败时流中不会出现半篇文档。内部缓冲区在多次调用之间复用。
 */
class Encoder final {
 public:
  Encoder(Stream& stream, const codec::Registry& registry, codec::EncodeOptions options = {})
    : stream_(stream), registry_(registry), options_(options) {}

  template <class T>
  std::error_code encode(const T& value) {
    return encode_ref(reflect::make_ref(value));
  }

  std::error_code encode_ref(reflect::ConstValueRef v);

  [[nodiscard]] std::size_t documents_written() const noexcept { return documents_; }

 private:
  Stream& stream_;
  const codec::Registry& registry_;
  codec::EncodeOptions options_{};
  std::vector<core::byte> buffer_{};
  std::size_t documents_{0};
};

}  // namespace bsonc::io
