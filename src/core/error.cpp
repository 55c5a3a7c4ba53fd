#include "bsonc/core/error.hpp"

#include <string>

namespace bsonc::core {
namespace {

class bsonc_core_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "bsonc.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_argument:
        return "invalid argument";
      default:
        return "unknown bsonc.core error";
    }
  }
};

}  // namespace

const std::error_category& error_category() noexcept {
  static bsonc_core_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // namespace bsonc::core
