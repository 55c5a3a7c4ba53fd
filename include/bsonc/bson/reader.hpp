#pragma once

#include "bsonc/bson/error.hpp"
#include "bsonc/bson/types.hpp"
#include "bsonc/bson/value.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace bsonc::bson {

class DocumentReader;

/**
 * @brief 一个元素的头部：类型与 key（key 指向原缓冲区，不拷贝）。
 */
struct ElementHeader final {
  element_type type{element_type::null};
  std::string_view key{};
  // 元素首字节（类型字节）在整个输入中的绝对偏移。
  std::size_t offset{0};
};

/**
 * @brief 定位在“一个值”上的只读句柄。
 *
 * payload 恰好覆盖该值的全部字节（不含类型字节与 key），创建时已按长度前缀校验过边界。
 * read_* 会校验 type 与调用是否匹配，不匹配返回 errc::type_mismatch。
 *
 * 只能经 DocumentReader、from_document() 或 make() 得到，三者都先校验 payload。
 */
class ValueReader final {
 public:
  ValueReader() = default;

  /**
   * @brief 由调用方提供的 payload 构造（自定义 Codec 拼装值时使用）。
   *
   * payload 必须恰好是一个 type 类型的值：长度不足返回 errc::truncated，
   * 长度前缀与 payload 大小不符返回 errc::malformed_document，
   * depth 超过 core::kMaxDocumentDepth 返回 errc::depth_exceeded。失败时 out 不变。
   */
  static std::error_code make(
    element_type type,
    bytes_view payload,
    std::size_t offset,
    std::size_t depth,
    ValueReader& out) noexcept;

  /**
   * @brief 把一段完整文档字节当作“文档值”包装（顶层解码入口）。
   *
   * 要求 doc 恰好是一个文档：长度前缀等于 doc.size() 且以 0x00 结尾。
   */
  static std::error_code from_document(bytes_view doc, ValueReader& out) noexcept;

  [[nodiscard]] element_type type() const noexcept { return type_; }
  [[nodiscard]] bytes_view payload() const noexcept { return payload_; }
  [[nodiscard]] std::size_t offset() const noexcept { return offset_; }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
  [[nodiscard]] bool is_null() const noexcept { return type_ == element_type::null; }

  std::error_code read_double(double& out) const noexcept;
  std::error_code read_string(std::string& out) const;
  std::error_code read_string_view(std::string_view& out) const noexcept;
  std::error_code read_binary(Binary& out) const;
  std::error_code read_binary_view(std::uint8_t& subtype, bytes_view& data) const noexcept;
  std::error_code read_undefined() const noexcept;
  std::error_code read_object_id(ObjectId& out) const noexcept;
  std::error_code read_boolean(bool& out) const noexcept;
  std::error_code read_datetime(std::int64_t& millis) const noexcept;
  std::error_code read_null() const noexcept;
  std::error_code read_regex(Regex& out) const;
  std::error_code read_dbpointer(DBPointer& out) const;
  std::error_code read_javascript(std::string& out) const;
  std::error_code read_symbol(std::string& out) const;
  std::error_code read_code_with_scope(std::string& code, bytes_view& scope) const;
  std::error_code read_int32(std::int32_t& out) const noexcept;
  std::error_code read_timestamp(Timestamp& out) const noexcept;
  std::error_code read_int64(std::int64_t& out) const noexcept;
  std::error_code read_decimal128(Decimal128& out) const noexcept;
  std::error_code read_min_key() const noexcept;
  std::error_code read_max_key() const noexcept;

  /**
   * @brief 打开嵌入文档或数组（两者线上布局相同），得到子游标。
   */
  std::error_code read_document(DocumentReader& out) const noexcept;

  // 文档/数组的完整字节（含长度前缀与结尾 0x00）。
  std::error_code read_raw_document(bytes_view& out) const noexcept;

  /**
   * @brief 把当前值完整解码为 Value（Document/Array 递归展开）。
   */
  std::error_code read_value(Value& out) const;

 private:
  friend class DocumentReader;

  ValueReader(element_type type, bytes_view payload, std::size_t offset, std::size_t depth) noexcept;

  [[nodiscard]] std::error_code expect(element_type t) const noexcept;

  element_type type_{element_type::null};
  bytes_view payload_{};
  std::size_t offset_{0};
  std::size_t depth_{0};
};

/**
 * @brief 文档读游标：按需逐个产出元素头，不预先解析整篇文档。
 *
 * 用法：
 * - open() 校验长度前缀与结尾字节；
 * - next() 产出下一个元素头，到达结尾时 out 为 std::nullopt；
 * - 每个元素头之后可以 value_reader()/read_value()/skip_value()/descend_into() 取走值；
 *   未取走就调用 next() 时会自动跳过该值。
 *
 * 子游标（descend_into/ValueReader::read_document）与父游标共享同一段缓冲区，
 * offset() 始终是相对最外层输入的绝对偏移，便于定位错误。
 */
class DocumentReader final {
 public:
  DocumentReader() = default;

  static std::error_code open(bytes_view doc, DocumentReader& out) noexcept;
  static std::error_code open(bytes_view doc, std::size_t base_offset, std::size_t depth, DocumentReader& out) noexcept;

  std::error_code next(std::optional<ElementHeader>& out) noexcept;

  std::error_code value_reader(ValueReader& out) noexcept;
  std::error_code read_value(Value& out);
  std::error_code skip_value() noexcept;
  std::error_code descend_into(DocumentReader& child) noexcept;

  [[nodiscard]] std::size_t offset() const noexcept { return base_ + pos_; }
  [[nodiscard]] std::size_t depth() const noexcept { return depth_; }
  [[nodiscard]] bytes_view bytes() const noexcept { return doc_; }
  [[nodiscard]] bool has_pending() const noexcept { return pending_.has_value(); }

 private:
  std::error_code take_pending(ValueReader& out) noexcept;

  bytes_view doc_{};
  std::size_t base_{0};
  std::size_t pos_{0};
  std::size_t depth_{0};
  std::optional<ElementHeader> pending_{};
  bool done_{false};
};

/**
 * @brief 沿 key 路径随机访问：逐层跳过不匹配的元素，命中时 out 定位到目标值。
 *
 * 说明：
 * - 路径为空时 out 为整篇文档；
 * - 某一层找不到 key 返回 errc::key_not_found；
 * - 中间层不是文档/数组返回 errc::type_mismatch。
 */
std::error_code lookup(bytes_view doc, std::span<const std::string_view> path, ValueReader& out) noexcept;

inline std::error_code lookup(bytes_view doc, std::initializer_list<std::string_view> path, ValueReader& out) noexcept {
  return lookup(doc, std::span<const std::string_view>(path.begin(), path.size()), out);
}

}  // namespace bsonc::bson
