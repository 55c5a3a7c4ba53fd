#include "bsonc/io/decoder.hpp"

#include "bsonc/bson/error.hpp"
#include "bson/wire.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cstdint>

namespace bsonc::io {

std::error_code Decoder::read_document(std::vector<core::byte>& out) {
  std::array<core::byte, 4> prefix{};
  std::size_t n = 0;
  auto ec = stream_.read_exactly(core::mutable_bytes_view{prefix.data(), prefix.size()}, n);
  if (ec) {
    return ec;
  }
  if (n == 0) {
    return make_error_code(errc::end_of_stream);
  }
  if (n < prefix.size()) {
    spdlog::debug("bsonc: stream ended inside a length prefix ({} of 4 bytes)", n);
    return bson::make_error_code(bson::errc::truncated);
  }

  // 长度前缀是 int32：超过 INT32_MAX 的值（即负数）属于格式错误，而不是超限
  const std::size_t size = bson::wire::load_le<std::uint32_t>(prefix.data());
  if (size < core::kMinDocumentSize || size > bson::wire::kMaxInt32) {
    spdlog::debug("bsonc: invalid document length {} in stream", size);
    return bson::make_error_code(bson::errc::malformed_document);
  }
  if (size > options_.max_document_size) {
    spdlog::debug("bsonc: document length {} exceeds limit {}", size, options_.max_document_size);
    return make_error_code(errc::document_too_large);
  }

  out.resize(size);
  std::copy(prefix.begin(), prefix.end(), out.begin());
  const core::mutable_bytes_view rest{out.data() + prefix.size(), size - prefix.size()};
  ec = stream_.read_exactly(rest, n);
  if (ec) {
    out.clear();
    return ec;
  }
  if (n < rest.size()) {
    spdlog::debug("bsonc: stream ended inside a document ({} of {} bytes)", n + prefix.size(), size);
    out.clear();
    return bson::make_error_code(bson::errc::truncated);
  }
  return {};
}

std::error_code Decoder::decode_ref(reflect::ValueRef v) {
  auto ec = read_document(buffer_);
  if (ec) {
    return ec;
  }
  const auto& o = options_.decode;
  const codec::DecodeContext ctx{registry_, o.truncate, o.strict, o.zero_structs};
  ec = codec::decode_document(ctx, core::bytes_view{buffer_.data(), buffer_.size()}, v);
  if (ec) {
    return ec;
  }
  ++documents_;
  return {};
}

}  // namespace bsonc::io
