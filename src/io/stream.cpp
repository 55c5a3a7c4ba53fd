#include "bsonc/io/stream.hpp"

#include "bsonc/core/error.hpp"

#include <algorithm>
#include <cstring>

namespace bsonc::io {

std::error_code Stream::read_exactly(core::mutable_bytes_view dst, std::size_t& n) {
  n = 0;
  while (n < dst.size()) {
    std::size_t got = 0;
    auto ec = read_some(dst.subspan(n), got);
    if (ec) {
      return ec;
    }
    if (got == 0) {
      return {};
    }
    n += got;
  }
  return {};
}

std::error_code MemoryStream::read_some(core::mutable_bytes_view dst, std::size_t& n) {
  if (!open_) {
    n = 0;
    return core::make_error_code(core::errc::invalid_argument);
  }
  n = std::min(dst.size(), remaining());
  if (n != 0) {
    std::memcpy(dst.data(), input_.data() + read_pos_, n);
    read_pos_ += n;
  }
  return {};
}

std::error_code MemoryStream::write_all(core::bytes_view src) {
  if (!open_) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  output_.insert(output_.end(), src.begin(), src.end());
  return {};
}

void MemoryStream::feed(core::bytes_view data) { input_.insert(input_.end(), data.begin(), data.end()); }

}  // namespace bsonc::io
