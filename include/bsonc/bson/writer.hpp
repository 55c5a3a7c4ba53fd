#pragma once

#include "bsonc/bson/error.hpp"
#include "bsonc/bson/types.hpp"
#include "bsonc/bson/value.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <vector>

namespace bsonc::bson {

class ValueWriter;

/**
 * @brief 数组元素 key（"0"、"1"、...）的栈上缓冲，避免每个元素一次 std::to_string 分配。
 */
class IndexKey final {
 public:
  explicit IndexKey(std::size_t index) noexcept;
  [[nodiscard]] std::string_view view() const noexcept { return {buf_.data(), len_}; }

 private:
  std::array<char, 24> buf_{};
  std::size_t len_{0};
};

/**
 * @brief 文档写游标：向可增长缓冲区顺序追加元素，嵌套文档的长度前缀在关闭时回填。
 *
 * 实现模型：
 * - open_document()/open_array() 写入 4 字节占位，并把占位偏移压栈；
 * - close_document() 写入结尾 0x00，按“当前尾部 - 占位偏移”回填长度并出栈；
 * - 所有写入都是尾部追加，嵌套 open/close 不会搬移已写入的字节。
 *
 * 约定：
 * - 游标只在一次编码调用内存在，不做线程安全保证；
 * - 元素必须写在某个已打开的文档/数组内，否则返回 errc::cursor_invariant；
 * - key 不能包含 '\0'（线上 key 为 C 字符串），否则返回 errc::invalid_key。
 */
class DocumentWriter final {
 public:
  explicit DocumentWriter(std::vector<byte>& out) noexcept;

  DocumentWriter(const DocumentWriter&) = delete;
  DocumentWriter& operator=(const DocumentWriter&) = delete;

  // 打开顶层文档（栈必须为空）。
  std::error_code open_document() noexcept;
  std::error_code open_document(std::string_view key) noexcept;
  std::error_code open_array(std::string_view key) noexcept;
  // 关闭最内层的文档或数组并回填长度。
  std::error_code close_document() noexcept;

  std::error_code write_double(std::string_view key, double v) noexcept;
  std::error_code write_string(std::string_view key, std::string_view v) noexcept;
  std::error_code write_binary(std::string_view key, std::uint8_t subtype, bytes_view data) noexcept;
  std::error_code write_undefined(std::string_view key) noexcept;
  std::error_code write_object_id(std::string_view key, const ObjectId& v) noexcept;
  std::error_code write_boolean(std::string_view key, bool v) noexcept;
  std::error_code write_datetime(std::string_view key, std::int64_t millis) noexcept;
  std::error_code write_null(std::string_view key) noexcept;
  std::error_code write_regex(std::string_view key, std::string_view pattern, std::string_view options) noexcept;
  std::error_code write_dbpointer(std::string_view key, std::string_view ns, const ObjectId& id) noexcept;
  std::error_code write_javascript(std::string_view key, std::string_view code) noexcept;
  std::error_code write_symbol(std::string_view key, std::string_view v) noexcept;
  std::error_code write_code_with_scope(std::string_view key, std::string_view code, bytes_view scope) noexcept;
  std::error_code write_int32(std::string_view key, std::int32_t v) noexcept;
  std::error_code write_timestamp(std::string_view key, Timestamp v) noexcept;
  std::error_code write_int64(std::string_view key, std::int64_t v) noexcept;
  std::error_code write_decimal128(std::string_view key, Decimal128 v) noexcept;
  std::error_code write_min_key(std::string_view key) noexcept;
  std::error_code write_max_key(std::string_view key) noexcept;

  /**
   * @brief 写入任意 Value（Document/Array 会递归写出）。
   */
  std::error_code write_value(std::string_view key, const Value& v) noexcept;

  // 把 Document 作为顶层文档完整写出（栈必须为空）。
  std::error_code write_document(const Document& doc) noexcept;
  std::error_code write_document(std::string_view key, const Document& doc) noexcept;

  /**
   * @brief 以嵌入文档写入一段已编码的完整文档字节（会校验长度前缀与结尾字节）。
   *
   * 栈为空时作为顶层文档直接追加。
   */
  std::error_code write_raw_document(std::string_view key, bytes_view doc) noexcept;
  std::error_code write_raw_document(bytes_view doc) noexcept;

  /**
   * @brief 写入一个已编码的元素 payload（不含类型字节与 key）。
   *
   * 调用方负责 payload 与 type 匹配；这里只做最基本的长度校验。
   */
  std::error_code write_raw_value(std::string_view key, element_type type, bytes_view payload) noexcept;

  /**
   * @brief 取得定位在当前文档下一个元素（key）上的 ValueWriter。
   */
  [[nodiscard]] ValueWriter element(std::string_view key) noexcept;

  [[nodiscard]] std::size_t depth() const noexcept { return stack_.size(); }
  [[nodiscard]] bool in_array() const noexcept { return !stack_.empty() && stack_.back().array; }
  [[nodiscard]] std::size_t size() const noexcept { return out_.size(); }

 private:
  struct Frame final {
    std::size_t offset{0};
    bool array{false};
  };

  std::error_code begin_element(element_type type, std::string_view key) noexcept;
  std::error_code push_frame(bool array) noexcept;
  void append_u8(byte v);
  void append_bytes(bytes_view v);
  void append_cstring(std::string_view v);
  std::error_code append_string(std::string_view v) noexcept;
  template <class UInt>
  void append_le(UInt v);

  std::vector<byte>& out_;
  std::vector<Frame> stack_{};
};

/**
 * @brief 定位在“一个值”上的写入句柄。
 *
 * 说明：
 * - 嵌套值：由 DocumentWriter::element(key) 产生，所有写入都以该 key 追加到当前文档；
 * - 顶层值：由 top_level() 产生，只允许写入文档（open_document/write_raw_document），
 *   其它类型返回 errc::not_a_document；
 * - Codec 写完一个值后游标正好位于该值之后；打开的文档需由 Codec 自己关闭。
 */
class ValueWriter final {
 public:
  ValueWriter(DocumentWriter& w, std::string_view key) noexcept;
  static ValueWriter top_level(DocumentWriter& w) noexcept;

  [[nodiscard]] DocumentWriter& writer() noexcept { return *w_; }
  [[nodiscard]] std::string_view key() const noexcept { return key_; }
  [[nodiscard]] bool is_top_level() const noexcept { return top_level_; }

  std::error_code open_document() noexcept;
  std::error_code open_array() noexcept;

  std::error_code write_double(double v) noexcept;
  std::error_code write_string(std::string_view v) noexcept;
  std::error_code write_binary(std::uint8_t subtype, bytes_view data) noexcept;
  std::error_code write_undefined() noexcept;
  std::error_code write_object_id(const ObjectId& v) noexcept;
  std::error_code write_boolean(bool v) noexcept;
  std::error_code write_datetime(std::int64_t millis) noexcept;
  std::error_code write_null() noexcept;
  std::error_code write_regex(std::string_view pattern, std::string_view options) noexcept;
  std::error_code write_dbpointer(std::string_view ns, const ObjectId& id) noexcept;
  std::error_code write_javascript(std::string_view code) noexcept;
  std::error_code write_symbol(std::string_view v) noexcept;
  std::error_code write_code_with_scope(std::string_view code, bytes_view scope) noexcept;
  std::error_code write_int32(std::int32_t v) noexcept;
  std::error_code write_timestamp(Timestamp v) noexcept;
  std::error_code write_int64(std::int64_t v) noexcept;
  std::error_code write_decimal128(Decimal128 v) noexcept;
  std::error_code write_min_key() noexcept;
  std::error_code write_max_key() noexcept;
  std::error_code write_value(const Value& v) noexcept;
  std::error_code write_document(const Document& doc) noexcept;
  std::error_code write_raw_document(bytes_view doc) noexcept;
  std::error_code write_raw_value(element_type type, bytes_view payload) noexcept;

 private:
  ValueWriter(DocumentWriter& w, std::string_view key, bool top_level) noexcept;

  [[nodiscard]] std::error_code reject_top_level() const noexcept;

  DocumentWriter* w_;
  std::string_view key_{};
  bool top_level_{false};
};

}  // namespace bsonc::bson
