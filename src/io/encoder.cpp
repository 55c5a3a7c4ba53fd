#include "bsonc/io/encoder.hpp"

#include <spdlog/spdlog.h>

namespace bsonc::io {

std::error_code Encoder::encode_ref(reflect::ConstValueRef v) {
  buffer_.clear();
  const codec::EncodeContext ctx{registry_, options_.min_size};
  auto ec = codec::encode_document(ctx, v, buffer_);
  if (ec) {
    return ec;
  }
  ec = stream_.write_all(core::bytes_view{buffer_.data(), buffer_.size()});
  if (ec) {
    spdlog::debug("bsonc: encoder write failed after {} documents: {}", documents_, ec.message());
    return ec;
  }
  ++documents_;
  return {};
}

}  // namespace bsonc::io
