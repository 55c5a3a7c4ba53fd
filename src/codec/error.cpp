#include "bsonc/codec/error.hpp"

#include <string>

namespace bsonc::codec {
namespace {

class bsonc_codec_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bsonc.codec"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::unregistered_type:
        return "no codec registered for type";
      case errc::tag_conflict:
        return "conflicting struct tags";
      case errc::precision_loss:
        return "value cannot be represented without precision loss";
      case errc::field_access_denied:
        return "field is not accessible";
      case errc::incompatible_type:
        return "element type incompatible with destination";
      case errc::overflow:
        return "integer value out of range";
      case errc::unknown_field:
        return "unknown field";
      case errc::duplicate_key:
        return "duplicate document key";
      case errc::unsupported_key:
        return "unsupported map key";
      default:
        return "unknown bsonc.codec error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static bsonc_codec_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace bsonc::codec
