#include "bsonc/bson/value.hpp"

#include <bit>
#include <type_traits>
#include <utility>

namespace bsonc::bson {

// Document

Document& Document::append(std::string key, Value value) {
  elements.push_back(Element{std::move(key), std::move(value)});
  return *this;
}

const Value* Document::find(std::string_view key) const noexcept {
  for (const auto& e : elements) {
    if (e.key == key) {
      return &e.value;
    }
  }
  return nullptr;
}

Value* Document::find(std::string_view key) noexcept {
  for (auto& e : elements) {
    if (e.key == key) {
      return &e.value;
    }
  }
  return nullptr;
}

std::size_t Document::size() const noexcept { return elements.size(); }

bool Document::empty() const noexcept { return elements.empty(); }

bool operator==(const Document& lhs, const Document& rhs) noexcept {
  return lhs.elements == rhs.elements;
}

bool operator==(const CodeWithScope& lhs, const CodeWithScope& rhs) noexcept {
  return lhs.code == rhs.code && lhs.scope == rhs.scope;
}

bool operator==(const Element& lhs, const Element& rhs) noexcept {
  return lhs.key == rhs.key && lhs.value == rhs.value;
}

// Value

Value::Value(Null v) : storage_(v) {}
Value::Value(double v) : storage_(v) {}
Value::Value(std::string v) : storage_(std::move(v)) {}
Value::Value(Document v) : storage_(std::move(v)) {}
Value::Value(Array v) : storage_(std::move(v)) {}
Value::Value(Binary v) : storage_(std::move(v)) {}
Value::Value(Undefined v) : storage_(v) {}
Value::Value(ObjectId v) : storage_(v) {}
Value::Value(bool v) : storage_(v) {}
Value::Value(DateTime v) : storage_(v) {}
Value::Value(Regex v) : storage_(std::move(v)) {}
Value::Value(DBPointer v) : storage_(std::move(v)) {}
Value::Value(JavaScript v) : storage_(std::move(v)) {}
Value::Value(Symbol v) : storage_(std::move(v)) {}
Value::Value(CodeWithScope v) : storage_(std::move(v)) {}
Value::Value(std::int32_t v) : storage_(v) {}
Value::Value(Timestamp v) : storage_(v) {}
Value::Value(std::int64_t v) : storage_(v) {}
Value::Value(Decimal128 v) : storage_(v) {}
Value::Value(MinKey v) : storage_(v) {}
Value::Value(MaxKey v) : storage_(v) {}

Value Value::string(std::string v) { return Value(std::move(v)); }
Value Value::document(Document v) { return Value(std::move(v)); }
Value Value::array(Array v) { return Value(std::move(v)); }
Value Value::int32(std::int32_t v) { return Value(v); }
Value Value::int64(std::int64_t v) { return Value(v); }

element_type Value::type() const noexcept {
  return std::visit(
    [](const auto& v) -> element_type {
      using T = std::decay_t<decltype(v)>;
      if constexpr (std::is_same_v<T, Null>) {
        return element_type::null;
      } else if constexpr (std::is_same_v<T, double>) {
        return element_type::double_;
      } else if constexpr (std::is_same_v<T, std::string>) {
        return element_type::string;
      } else if constexpr (std::is_same_v<T, Document>) {
        return element_type::document;
      } else if constexpr (std::is_same_v<T, Array>) {
        return element_type::array;
      } else if constexpr (std::is_same_v<T, Binary>) {
        return element_type::binary;
      } else if constexpr (std::is_same_v<T, Undefined>) {
        return element_type::undefined;
      } else if constexpr (std::is_same_v<T, ObjectId>) {
        return element_type::object_id;
      } else if constexpr (std::is_same_v<T, bool>) {
        return element_type::boolean;
      } else if constexpr (std::is_same_v<T, DateTime>) {
        return element_type::datetime;
      } else if constexpr (std::is_same_v<T, Regex>) {
        return element_type::regex;
      } else if constexpr (std::is_same_v<T, DBPointer>) {
        return element_type::dbpointer;
      } else if constexpr (std::is_same_v<T, JavaScript>) {
        return element_type::javascript;
      } else if constexpr (std::is_same_v<T, Symbol>) {
        return element_type::symbol;
      } else if constexpr (std::is_same_v<T, CodeWithScope>) {
        return element_type::code_with_scope;
      } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return element_type::int32;
      } else if constexpr (std::is_same_v<T, Timestamp>) {
        return element_type::timestamp;
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return element_type::int64;
      } else if constexpr (std::is_same_v<T, Decimal128>) {
        return element_type::decimal128;
      } else if constexpr (std::is_same_v<T, MinKey>) {
        return element_type::min_key;
      } else {
        return element_type::max_key;
      }
    },
    storage_);
}

bool operator==(const Value& lhs, const Value& rhs) noexcept {
  if (lhs.storage_.index() != rhs.storage_.index()) {
    return false;
  }
  // double 按位比较：NaN 与自身相等，+0/-0 视为不同（与线上字节一致）。
  if (const auto* a = std::get_if<double>(&lhs.storage_)) {
    const auto* b = std::get_if<double>(&rhs.storage_);
    return std::bit_cast<std::uint64_t>(*a) == std::bit_cast<std::uint64_t>(*b);
  }
  return lhs.storage_ == rhs.storage_;
}

}  // namespace bsonc::bson
