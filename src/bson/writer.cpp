#include "bsonc/bson/writer.hpp"

#include "wire.hpp"

#include <bit>
#include <charconv>
#include <type_traits>
#include <variant>

namespace bsonc::bson {

IndexKey::IndexKey(std::size_t index) noexcept {
  const auto res = std::to_chars(buf_.data(), buf_.data() + buf_.size(), index);
  len_ = static_cast<std::size_t>(res.ptr - buf_.data());
}

/*
 * DocumentWriter 的实现模型：
 * - stack_ 中每个 Frame 记录“长度占位”在 out_ 中的偏移；
 * - 元素 = 类型字节 + key（C 字符串）+ payload，直接追加到 out_ 尾部；
 * - 关闭时写结尾 0x00，再把 [offset, 尾部) 的字节数回填到占位处。
 */
DocumentWriter::DocumentWriter(std::vector<byte>& out) noexcept : out_(out) {}

void DocumentWriter::append_u8(byte v) { out_.push_back(v); }

void DocumentWriter::append_bytes(bytes_view v) {
  out_.insert(out_.end(), v.begin(), v.end());
}

void DocumentWriter::append_cstring(std::string_view v) {
  out_.insert(out_.end(), v.begin(), v.end());
  out_.push_back(0);
}

template <class UInt>
void DocumentWriter::append_le(UInt v) {
  const auto offset = out_.size();
  out_.resize(offset + sizeof(UInt));
  wire::store_le<UInt>(out_.data() + offset, v);
}

std::error_code DocumentWriter::append_string(std::string_view v) noexcept {
  // int32 长度包含结尾 0x00。
  if (v.size() >= wire::kMaxInt32) {
    return make_error_code(errc::length_overflow);
  }
  append_le<std::uint32_t>(static_cast<std::uint32_t>(v.size() + 1));
  append_cstring(v);
  return {};
}

std::error_code DocumentWriter::begin_element(element_type type, std::string_view key) noexcept {
  if (stack_.empty()) {
    return make_error_code(errc::cursor_invariant);
  }
  if (key.find('\0') != std::string_view::npos) {
    return make_error_code(errc::invalid_key);
  }
  append_u8(static_cast<byte>(type));
  append_cstring(key);
  return {};
}

std::error_code DocumentWriter::push_frame(bool array) noexcept {
  if (stack_.size() >= core::kMaxDocumentDepth) {
    return make_error_code(errc::depth_exceeded);
  }
  stack_.push_back(Frame{out_.size(), array});
  append_le<std::uint32_t>(0);
  return {};
}

std::error_code DocumentWriter::open_document() noexcept {
  if (!stack_.empty()) {
    return make_error_code(errc::cursor_invariant);
  }
  return push_frame(false);
}

std::error_code DocumentWriter::open_document(std::string_view key) noexcept {
  if (stack_.size() >= core::kMaxDocumentDepth) {
    return make_error_code(errc::depth_exceeded);
  }
  auto ec = begin_element(element_type::document, key);
  if (ec) {
    return ec;
  }
  return push_frame(false);
}

std::error_code DocumentWriter::open_array(std::string_view key) noexcept {
  if (stack_.size() >= core::kMaxDocumentDepth) {
    return make_error_code(errc::depth_exceeded);
  }
  auto ec = begin_element(element_type::array, key);
  if (ec) {
    return ec;
  }
  return push_frame(true);
}

std::error_code DocumentWriter::close_document() noexcept {
  if (stack_.empty()) {
    return make_error_code(errc::cursor_invariant);
  }
  const auto frame = stack_.back();
  append_u8(0);
  const auto length = out_.size() - frame.offset;
  if (length > wire::kMaxInt32) {
    return make_error_code(errc::length_overflow);
  }
  wire::store_le<std::uint32_t>(out_.data() + frame.offset, static_cast<std::uint32_t>(length));
  stack_.pop_back();
  return {};
}

std::error_code DocumentWriter::write_double(std::string_view key, double v) noexcept {
  auto ec = begin_element(element_type::double_, key);
  if (ec) {
    return ec;
  }
  append_le<std::uint64_t>(std::bit_cast<std::uint64_t>(v));
  return {};
}

std::error_code DocumentWriter::write_string(std::string_view key, std::string_view v) noexcept {
  auto ec = begin_element(element_type::string, key);
  if (ec) {
    return ec;
  }
  return append_string(v);
}

std::error_code DocumentWriter::write_binary(std::string_view key, std::uint8_t subtype, bytes_view data) noexcept {
  // 旧式子类型 0x02 在 payload 内部再带一层 int32 长度。
  const bool old = subtype == static_cast<std::uint8_t>(binary_subtype::binary_old);
  const auto total = data.size() + (old ? 4u : 0u);
  if (total > wire::kMaxInt32) {
    return make_error_code(errc::length_overflow);
  }
  auto ec = begin_element(element_type::binary, key);
  if (ec) {
    return ec;
  }
  append_le<std::uint32_t>(static_cast<std::uint32_t>(total));
  append_u8(subtype);
  if (old) {
    append_le<std::uint32_t>(static_cast<std::uint32_t>(data.size()));
  }
  append_bytes(data);
  return {};
}

std::error_code DocumentWriter::write_undefined(std::string_view key) noexcept {
  return begin_element(element_type::undefined, key);
}

std::error_code DocumentWriter::write_object_id(std::string_view key, const ObjectId& v) noexcept {
  auto ec = begin_element(element_type::object_id, key);
  if (ec) {
    return ec;
  }
  append_bytes(bytes_view{v.bytes.data(), v.bytes.size()});
  return {};
}

std::error_code DocumentWriter::write_boolean(std::string_view key, bool v) noexcept {
  auto ec = begin_element(element_type::boolean, key);
  if (ec) {
    return ec;
  }
  append_u8(v ? 0x01 : 0x00);
  return {};
}

std::error_code DocumentWriter::write_datetime(std::string_view key, std::int64_t millis) noexcept {
  auto ec = begin_element(element_type::datetime, key);
  if (ec) {
    return ec;
  }
  append_le<std::uint64_t>(static_cast<std::uint64_t>(millis));
  return {};
}

std::error_code DocumentWriter::write_null(std::string_view key) noexcept {
  return begin_element(element_type::null, key);
}

std::error_code DocumentWriter::write_regex(std::string_view key, std::string_view pattern, std::string_view options) noexcept {
  if (pattern.find('\0') != std::string_view::npos || options.find('\0') != std::string_view::npos) {
    return make_error_code(errc::invalid_key);
  }
  auto ec = begin_element(element_type::regex, key);
  if (ec) {
    return ec;
  }
  append_cstring(pattern);
  append_cstring(options);
  return {};
}

std::error_code DocumentWriter::write_dbpointer(std::string_view key, std::string_view ns, const ObjectId& id) noexcept {
  auto ec = begin_element(element_type::dbpointer, key);
  if (ec) {
    return ec;
  }
  ec = append_string(ns);
  if (ec) {
    return ec;
  }
  append_bytes(bytes_view{id.bytes.data(), id.bytes.size()});
  return {};
}

std::error_code DocumentWriter::write_javascript(std::string_view key, std::string_view code) noexcept {
  auto ec = begin_element(element_type::javascript, key);
  if (ec) {
    return ec;
  }
  return append_string(code);
}

std::error_code DocumentWriter::write_symbol(std::string_view key, std::string_view v) noexcept {
  auto ec = begin_element(element_type::symbol, key);
  if (ec) {
    return ec;
  }
  return append_string(v);
}

std::error_code DocumentWriter::write_code_with_scope(std::string_view key, std::string_view code, bytes_view scope) noexcept {
  std::size_t scope_size = 0;
  auto ec = wire::document_span(scope, 0, scope_size);
  if (ec) {
    return ec;
  }
  if (scope_size != scope.size()) {
    return make_error_code(errc::malformed_document);
  }
  const auto total = 4 + 4 + code.size() + 1 + scope.size();
  if (total > wire::kMaxInt32) {
    return make_error_code(errc::length_overflow);
  }
  ec = begin_element(element_type::code_with_scope, key);
  if (ec) {
    return ec;
  }
  append_le<std::uint32_t>(static_cast<std::uint32_t>(total));
  ec = append_string(code);
  if (ec) {
    return ec;
  }
  append_bytes(scope);
  return {};
}

std::error_code DocumentWriter::write_int32(std::string_view key, std::int32_t v) noexcept {
  auto ec = begin_element(element_type::int32, key);
  if (ec) {
    return ec;
  }
  append_le<std::uint32_t>(static_cast<std::uint32_t>(v));
  return {};
}

std::error_code DocumentWriter::write_timestamp(std::string_view key, Timestamp v) noexcept {
  auto ec = begin_element(element_type::timestamp, key);
  if (ec) {
    return ec;
  }
  // 线上为 uint64：低 32 位 increment，高 32 位秒。
  append_le<std::uint32_t>(v.i);
  append_le<std::uint32_t>(v.t);
  return {};
}

std::error_code DocumentWriter::write_int64(std::string_view key, std::int64_t v) noexcept {
  auto ec = begin_element(element_type::int64, key);
  if (ec) {
    return ec;
  }
  append_le<std::uint64_t>(static_cast<std::uint64_t>(v));
  return {};
}

std::error_code DocumentWriter::write_decimal128(std::string_view key, Decimal128 v) noexcept {
  auto ec = begin_element(element_type::decimal128, key);
  if (ec) {
    return ec;
  }
  append_le<std::uint64_t>(v.low);
  append_le<std::uint64_t>(v.high);
  return {};
}

std::error_code DocumentWriter::write_min_key(std::string_view key) noexcept {
  return begin_element(element_type::min_key, key);
}

std::error_code DocumentWriter::write_max_key(std::string_view key) noexcept {
  return begin_element(element_type::max_key, key);
}

std::error_code DocumentWriter::write_value(std::string_view key, const Value& v) noexcept {
  return std::visit(
    [&](const auto& x) -> std::error_code {
      using T = std::decay_t<decltype(x)>;
      if constexpr (std::is_same_v<T, Null>) {
        return write_null(key);
      } else if constexpr (std::is_same_v<T, double>) {
        return write_double(key, x);
      } else if constexpr (std::is_same_v<T, std::string>) {
        return write_string(key, x);
      } else if constexpr (std::is_same_v<T, Document>) {
        return write_document(key, x);
      } else if constexpr (std::is_same_v<T, Array>) {
        auto ec = open_array(key);
        if (ec) {
          return ec;
        }
        for (std::size_t i = 0; i < x.size(); ++i) {
          const IndexKey index(i);
          ec = write_value(index.view(), x[i]);
          if (ec) {
            return ec;
          }
        }
        return close_document();
      } else if constexpr (std::is_same_v<T, Binary>) {
        return write_binary(key, x.subtype, bytes_view{x.data.data(), x.data.size()});
      } else if constexpr (std::is_same_v<T, Undefined>) {
        return write_undefined(key);
      } else if constexpr (std::is_same_v<T, ObjectId>) {
        return write_object_id(key, x);
      } else if constexpr (std::is_same_v<T, bool>) {
        return write_boolean(key, x);
      } else if constexpr (std::is_same_v<T, DateTime>) {
        return write_datetime(key, x.millis);
      } else if constexpr (std::is_same_v<T, Regex>) {
        return write_regex(key, x.pattern, x.options);
      } else if constexpr (std::is_same_v<T, DBPointer>) {
        return write_dbpointer(key, x.ns, x.id);
      } else if constexpr (std::is_same_v<T, JavaScript>) {
        return write_javascript(key, x.code);
      } else if constexpr (std::is_same_v<T, Symbol>) {
        return write_symbol(key, x.value);
      } else if constexpr (std::is_same_v<T, CodeWithScope>) {
        // scope 先独立编码成完整文档，再整体写入。
        std::vector<byte> scope;
        DocumentWriter scope_writer(scope);
        auto ec = scope_writer.write_document(x.scope);
        if (ec) {
          return ec;
        }
        return write_code_with_scope(key, x.code, bytes_view{scope.data(), scope.size()});
      } else if constexpr (std::is_same_v<T, std::int32_t>) {
        return write_int32(key, x);
      } else if constexpr (std::is_same_v<T, Timestamp>) {
        return write_timestamp(key, x);
      } else if constexpr (std::is_same_v<T, std::int64_t>) {
        return write_int64(key, x);
      } else if constexpr (std::is_same_v<T, Decimal128>) {
        return write_decimal128(key, x);
      } else if constexpr (std::is_same_v<T, MinKey>) {
        return write_min_key(key);
      } else {
        return write_max_key(key);
      }
    },
    v.storage());
}

std::error_code DocumentWriter::write_document(const Document& doc) noexcept {
  auto ec = open_document();
  if (ec) {
    return ec;
  }
  for (const auto& e : doc.elements) {
    ec = write_value(e.key, e.value);
    if (ec) {
      return ec;
    }
  }
  return close_document();
}

std::error_code DocumentWriter::write_document(std::string_view key, const Document& doc) noexcept {
  auto ec = open_document(key);
  if (ec) {
    return ec;
  }
  for (const auto& e : doc.elements) {
    ec = write_value(e.key, e.value);
    if (ec) {
      return ec;
    }
  }
  return close_document();
}

std::error_code DocumentWriter::write_raw_document(std::string_view key, bytes_view doc) noexcept {
  std::size_t size = 0;
  auto ec = wire::document_span(doc, 0, size);
  if (ec) {
    return ec;
  }
  if (size != doc.size()) {
    return make_error_code(errc::malformed_document);
  }
  ec = begin_element(element_type::document, key);
  if (ec) {
    return ec;
  }
  append_bytes(doc);
  return {};
}

std::error_code DocumentWriter::write_raw_document(bytes_view doc) noexcept {
  if (!stack_.empty()) {
    return make_error_code(errc::cursor_invariant);
  }
  std::size_t size = 0;
  auto ec = wire::document_span(doc, 0, size);
  if (ec) {
    return ec;
  }
  if (size != doc.size()) {
    return make_error_code(errc::malformed_document);
  }
  append_bytes(doc);
  return {};
}

std::error_code DocumentWriter::write_raw_value(std::string_view key, element_type type, bytes_view payload) noexcept {
  std::size_t size = 0;
  auto ec = wire::value_size(type, payload, 0, size);
  if (ec) {
    return ec;
  }
  if (size != payload.size()) {
    return make_error_code(errc::malformed_document);
  }
  ec = begin_element(type, key);
  if (ec) {
    return ec;
  }
  append_bytes(payload);
  return {};
}

ValueWriter DocumentWriter::element(std::string_view key) noexcept {
  return ValueWriter(*this, key);
}

// ValueWriter

ValueWriter::ValueWriter(DocumentWriter& w, std::string_view key) noexcept : w_(&w), key_(key) {}

ValueWriter::ValueWriter(DocumentWriter& w, std::string_view key, bool top_level) noexcept
  : w_(&w), key_(key), top_level_(top_level) {}

ValueWriter ValueWriter::top_level(DocumentWriter& w) noexcept {
  return ValueWriter(w, std::string_view{}, true);
}

std::error_code ValueWriter::reject_top_level() const noexcept {
  if (top_level_) {
    return make_error_code(errc::not_a_document);
  }
  return {};
}

std::error_code ValueWriter::open_document() noexcept {
  if (top_level_) {
    return w_->open_document();
  }
  return w_->open_document(key_);
}

std::error_code ValueWriter::open_array() noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->open_array(key_);
}

std::error_code ValueWriter::write_double(double v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_double(key_, v);
}

std::error_code ValueWriter::write_string(std::string_view v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_string(key_, v);
}

std::error_code ValueWriter::write_binary(std::uint8_t subtype, bytes_view data) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_binary(key_, subtype, data);
}

std::error_code ValueWriter::write_undefined() noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_undefined(key_);
}

std::error_code ValueWriter::write_object_id(const ObjectId& v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_object_id(key_, v);
}

std::error_code ValueWriter::write_boolean(bool v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_boolean(key_, v);
}

std::error_code ValueWriter::write_datetime(std::int64_t millis) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_datetime(key_, millis);
}

std::error_code ValueWriter::write_null() noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_null(key_);
}

std::error_code ValueWriter::write_regex(std::string_view pattern, std::string_view options) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_regex(key_, pattern, options);
}

std::error_code ValueWriter::write_dbpointer(std::string_view ns, const ObjectId& id) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_dbpointer(key_, ns, id);
}

std::error_code ValueWriter::write_javascript(std::string_view code) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_javascript(key_, code);
}

std::error_code ValueWriter::write_symbol(std::string_view v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_symbol(key_, v);
}

std::error_code ValueWriter::write_code_with_scope(std::string_view code, bytes_view scope) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_code_with_scope(key_, code, scope);
}

std::error_code ValueWriter::write_int32(std::int32_t v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_int32(key_, v);
}

std::error_code ValueWriter::write_timestamp(Timestamp v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_timestamp(key_, v);
}

std::error_code ValueWriter::write_int64(std::int64_t v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_int64(key_, v);
}

std::error_code ValueWriter::write_decimal128(Decimal128 v) noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_decimal128(key_, v);
}

std::error_code ValueWriter::write_min_key() noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_min_key(key_);
}

std::error_code ValueWriter::write_max_key() noexcept {
  if (auto ec = reject_top_level()) {
    return ec;
  }
  return w_->write_max_key(key_);
}

std::error_code ValueWriter::write_value(const Value& v) noexcept {
  if (top_level_) {
    // 顶层只接受文档。
    const auto* doc = v.get_if<Document>();
    if (doc == nullptr) {
      return make_error_code(errc::not_a_document);
    }
    return w_->write_document(*doc);
  }
  return w_->write_value(key_, v);
}

std::error_code ValueWriter::write_document(const Document& doc) noexcept {
  if (top_level_) {
    return w_->write_document(doc);
  }
  return w_->write_document(key_, doc);
}

std::error_code ValueWriter::write_raw_document(bytes_view doc) noexcept {
  if (top_level_) {
    return w_->write_raw_document(doc);
  }
  return w_->write_raw_document(key_, doc);
}

std::error_code ValueWriter::write_raw_value(element_type type, bytes_view payload) noexcept {
  if (top_level_) {
    if (type != element_type::document) {
      return make_error_code(errc::not_a_document);
    }
    return w_->write_raw_document(payload);
  }
  return w_->write_raw_value(key_, type, payload);
}

}  // namespace bsonc::bson
