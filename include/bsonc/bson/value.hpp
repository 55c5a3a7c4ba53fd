#pragma once

#include "bsonc/bson/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace bsonc::bson {

class Value;
struct Element;

using Array = std::vector<Value>;

/**
 * @brief 有序文档（保持元素顺序，允许重复 key）。
 *
 * 作为“解码任意文档”的目标类型使用：未知结构的文档可以完整解码为 Document，
 * 再按 key 访问。
 */
struct Document final {
  std::vector<Element> elements;

  Document& append(std::string key, Value value);

  // 返回第一个 key 匹配的元素值，找不到返回 nullptr。
  [[nodiscard]] const Value* find(std::string_view key) const noexcept;
  [[nodiscard]] Value* find(std::string_view key) noexcept;

  [[nodiscard]] std::size_t size() const noexcept;
  [[nodiscard]] bool empty() const noexcept;

  friend bool operator==(const Document& lhs, const Document& rhs) noexcept;
  friend bool operator!=(const Document& lhs, const Document& rhs) noexcept { return !(lhs == rhs); }
};

struct CodeWithScope final {
  std::string code;
  Document scope;
  friend bool operator==(const CodeWithScope& lhs, const CodeWithScope& rhs) noexcept;
};

/**
 * @brief 未解码的完整文档字节（含长度前缀与结尾 0x00）。
 *
 * 解码到 Raw 只做一次拷贝，不解析元素；适合延迟解码或原样转发。
 */
struct Raw final {
  std::vector<byte> bytes;
  [[nodiscard]] bytes_view view() const noexcept { return bytes_view{bytes.data(), bytes.size()}; }
  friend bool operator==(const Raw&, const Raw&) = default;
};

/**
 * @brief 任意元素值（强类型，支持嵌套 Document/Array）。
 *
 * 约定：
 * - 每种元素类型对应 variant 的一个分支，type() 给出对应的 element_type；
 * - 构造函数均为 explicit，避免 const char* 之类隐式落入 bool 分支。
 */
class Value final {
 public:
  using storage_type = std::variant<
    Null,
    double,
    std::string,
    Document,
    Array,
    Binary,
    Undefined,
    ObjectId,
    bool,
    DateTime,
    Regex,
    DBPointer,
    JavaScript,
    Symbol,
    CodeWithScope,
    std::int32_t,
    Timestamp,
    std::int64_t,
    Decimal128,
    MinKey,
    MaxKey>;

  Value() = default;

  explicit Value(Null v);
  explicit Value(double v);
  explicit Value(std::string v);
  explicit Value(Document v);
  explicit Value(Array v);
  explicit Value(Binary v);
  explicit Value(Undefined v);
  explicit Value(ObjectId v);
  explicit Value(bool v);
  explicit Value(DateTime v);
  explicit Value(Regex v);
  explicit Value(DBPointer v);
  explicit Value(JavaScript v);
  explicit Value(Symbol v);
  explicit Value(CodeWithScope v);
  explicit Value(std::int32_t v);
  explicit Value(Timestamp v);
  explicit Value(std::int64_t v);
  explicit Value(Decimal128 v);
  explicit Value(MinKey v);
  explicit Value(MaxKey v);

  [[nodiscard]] const storage_type& storage() const noexcept { return storage_; }
  [[nodiscard]] storage_type& storage() noexcept { return storage_; }

  [[nodiscard]] element_type type() const noexcept;

  template <class T>
  [[nodiscard]] const T* get_if() const noexcept {
    return std::get_if<T>(&storage_);
  }

  template <class T>
  [[nodiscard]] T* get_if() noexcept {
    return std::get_if<T>(&storage_);
  }

  [[nodiscard]] bool is_null() const noexcept { return std::holds_alternative<Null>(storage_); }

  static Value string(std::string v);
  static Value document(Document v);
  static Value array(Array v);
  static Value int32(std::int32_t v);
  static Value int64(std::int64_t v);

  friend bool operator==(const Value& lhs, const Value& rhs) noexcept;
  friend bool operator!=(const Value& lhs, const Value& rhs) noexcept { return !(lhs == rhs); }

 private:
  storage_type storage_{};
};

struct Element final {
  std::string key;
  Value value;
  friend bool operator==(const Element& lhs, const Element& rhs) noexcept;
};

}  // namespace bsonc::bson
