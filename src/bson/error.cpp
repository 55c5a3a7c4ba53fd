#include "bsonc/bson/error.hpp"

#include <string>

namespace bsonc::bson {
namespace {

class bsonc_bson_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bsonc.bson"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::truncated:
        return "truncated document";
      case errc::malformed_document:
        return "malformed document";
      case errc::unknown_element_type:
        return "unknown element type";
      case errc::type_mismatch:
        return "element type mismatch";
      case errc::invalid_key:
        return "invalid element key";
      case errc::length_overflow:
        return "document length overflow";
      case errc::cursor_invariant:
        return "document cursor invariant violated";
      case errc::not_a_document:
        return "top-level value is not a document";
      case errc::depth_exceeded:
        return "maximum document depth exceeded";
      case errc::key_not_found:
        return "key not found";
      default:
        return "unknown bsonc.bson error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static bsonc_bson_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace bsonc::bson
