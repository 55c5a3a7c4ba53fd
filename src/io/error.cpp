#include "bsonc/io/error.hpp"

#include <string>

namespace bsonc::io {
namespace {

class bsonc_io_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bsonc.io"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::end_of_stream:
        return "end of stream";
      case errc::document_too_large:
        return "document exceeds maximum size";
      default:
        return "unknown bsonc.io error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static bsonc_io_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace bsonc::io
