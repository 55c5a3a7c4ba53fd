#include "bsonc/bson/reader.hpp"

#include "wire.hpp"

#include <algorithm>
#include <bit>
#include <utility>

namespace bsonc::bson {
namespace {

// 文档体：去掉结尾 0x00 后的部分，元素不允许越过结尾字节。
bytes_view body_of(bytes_view doc) noexcept { return doc.first(doc.size() - 1); }

std::error_code read_elements(DocumentReader& r, Document& out) {
  std::optional<ElementHeader> header;
  for (;;) {
    auto ec = r.next(header);
    if (ec) {
      return ec;
    }
    if (!header) {
      return {};
    }
    Value v;
    ec = r.read_value(v);
    if (ec) {
      return ec;
    }
    out.elements.push_back(Element{std::string(header->key), std::move(v)});
  }
}

std::error_code read_items(DocumentReader& r, Array& out) {
  std::optional<ElementHeader> header;
  for (;;) {
    auto ec = r.next(header);
    if (ec) {
      return ec;
    }
    if (!header) {
      return {};
    }
    Value v;
    ec = r.read_value(v);
    if (ec) {
      return ec;
    }
    out.push_back(std::move(v));
  }
}

}  // namespace

// ValueReader

ValueReader::ValueReader(element_type type, bytes_view payload, std::size_t offset, std::size_t depth) noexcept
  : type_(type), payload_(payload), offset_(offset), depth_(depth) {}

std::error_code ValueReader::make(
  element_type type,
  bytes_view payload,
  std::size_t offset,
  std::size_t depth,
  ValueReader& out) noexcept {
  if (depth > core::kMaxDocumentDepth) {
    return make_error_code(errc::depth_exceeded);
  }
  std::size_t size = 0;
  auto ec = wire::value_size(type, payload, 0, size);
  if (ec) {
    return ec;
  }
  if (size != payload.size()) {
    return make_error_code(errc::malformed_document);
  }
  out = ValueReader(type, payload, offset, depth);
  return {};
}

std::error_code ValueReader::from_document(bytes_view doc, ValueReader& out) noexcept {
  std::size_t size = 0;
  auto ec = wire::document_span(doc, 0, size);
  if (ec) {
    return ec;
  }
  if (size != doc.size()) {
    return make_error_code(errc::malformed_document);
  }
  out = ValueReader(element_type::document, doc, 0, 0);
  return {};
}

std::error_code ValueReader::expect(element_type t) const noexcept {
  if (type_ != t) {
    return make_error_code(errc::type_mismatch);
  }
  return {};
}

std::error_code ValueReader::read_double(double& out) const noexcept {
  if (auto ec = expect(element_type::double_)) {
    return ec;
  }
  out = std::bit_cast<double>(wire::load_le<std::uint64_t>(payload_.data()));
  return {};
}

std::error_code ValueReader::read_string_view(std::string_view& out) const noexcept {
  // string/javascript/symbol 的 payload 布局一致。
  if (type_ != element_type::string && type_ != element_type::javascript && type_ != element_type::symbol) {
    return make_error_code(errc::type_mismatch);
  }
  out = std::string_view(reinterpret_cast<const char*>(payload_.data() + 4), payload_.size() - 5);
  return {};
}

std::error_code ValueReader::read_string(std::string& out) const {
  if (auto ec = expect(element_type::string)) {
    return ec;
  }
  std::string_view v;
  auto ec = read_string_view(v);
  if (ec) {
    return ec;
  }
  out.assign(v);
  return {};
}

std::error_code ValueReader::read_binary_view(std::uint8_t& subtype, bytes_view& data) const noexcept {
  if (auto ec = expect(element_type::binary)) {
    return ec;
  }
  const auto len = static_cast<std::size_t>(wire::load_le<std::uint32_t>(payload_.data()));
  subtype = payload_[4];
  if (subtype == static_cast<std::uint8_t>(binary_subtype::binary_old)) {
    // 旧式子类型：payload 内还有一层长度，必须与外层长度一致。
    if (len < 4) {
      return make_error_code(errc::malformed_document);
    }
    const auto inner = static_cast<std::size_t>(wire::load_le<std::uint32_t>(payload_.data() + 5));
    if (inner != len - 4) {
      return make_error_code(errc::malformed_document);
    }
    data = payload_.subspan(9, inner);
    return {};
  }
  data = payload_.subspan(5, len);
  return {};
}

std::error_code ValueReader::read_binary(Binary& out) const {
  bytes_view data;
  std::uint8_t subtype = 0;
  auto ec = read_binary_view(subtype, data);
  if (ec) {
    return ec;
  }
  out.subtype = subtype;
  out.data.assign(data.begin(), data.end());
  return {};
}

std::error_code ValueReader::read_undefined() const noexcept { return expect(element_type::undefined); }

std::error_code ValueReader::read_object_id(ObjectId& out) const noexcept {
  if (auto ec = expect(element_type::object_id)) {
    return ec;
  }
  std::copy(payload_.begin(), payload_.end(), out.bytes.begin());
  return {};
}

std::error_code ValueReader::read_boolean(bool& out) const noexcept {
  if (auto ec = expect(element_type::boolean)) {
    return ec;
  }
  const auto b = payload_[0];
  if (b > 1) {
    return make_error_code(errc::malformed_document);
  }
  out = b == 1;
  return {};
}

std::error_code ValueReader::read_datetime(std::int64_t& millis) const noexcept {
  if (auto ec = expect(element_type::datetime)) {
    return ec;
  }
  millis = static_cast<std::int64_t>(wire::load_le<std::uint64_t>(payload_.data()));
  return {};
}

std::error_code ValueReader::read_null() const noexcept { return expect(element_type::null); }

std::error_code ValueReader::read_regex(Regex& out) const {
  if (auto ec = expect(element_type::regex)) {
    return ec;
  }
  std::size_t pattern_len = 0;
  auto ec = wire::scan_cstring(payload_, 0, pattern_len);
  if (ec) {
    return ec;
  }
  const auto* base = reinterpret_cast<const char*>(payload_.data());
  out.pattern.assign(base, pattern_len);
  // payload 末尾恰好是 options 的结尾 0x00。
  out.options.assign(base + pattern_len + 1, payload_.size() - pattern_len - 2);
  return {};
}

std::error_code ValueReader::read_dbpointer(DBPointer& out) const {
  if (auto ec = expect(element_type::dbpointer)) {
    return ec;
  }
  const auto ns_size = payload_.size() - 12;
  out.ns.assign(reinterpret_cast<const char*>(payload_.data() + 4), ns_size - 5);
  std::copy(payload_.begin() + static_cast<std::ptrdiff_t>(ns_size), payload_.end(), out.id.bytes.begin());
  return {};
}

std::error_code ValueReader::read_javascript(std::string& out) const {
  if (auto ec = expect(element_type::javascript)) {
    return ec;
  }
  std::string_view v;
  auto ec = read_string_view(v);
  if (ec) {
    return ec;
  }
  out.assign(v);
  return {};
}

std::error_code ValueReader::read_symbol(std::string& out) const {
  if (auto ec = expect(element_type::symbol)) {
    return ec;
  }
  std::string_view v;
  auto ec = read_string_view(v);
  if (ec) {
    return ec;
  }
  out.assign(v);
  return {};
}

std::error_code ValueReader::read_code_with_scope(std::string& code, bytes_view& scope) const {
  if (auto ec = expect(element_type::code_with_scope)) {
    return ec;
  }
  std::size_t code_size = 0;
  auto ec = wire::string_span(payload_, 4, code_size);
  if (ec) {
    return ec;
  }
  code.assign(reinterpret_cast<const char*>(payload_.data() + 8), code_size - 5);
  scope = payload_.subspan(4 + code_size);
  return {};
}

std::error_code ValueReader::read_int32(std::int32_t& out) const noexcept {
  if (auto ec = expect(element_type::int32)) {
    return ec;
  }
  out = static_cast<std::int32_t>(wire::load_le<std::uint32_t>(payload_.data()));
  return {};
}

std::error_code ValueReader::read_timestamp(Timestamp& out) const noexcept {
  if (auto ec = expect(element_type::timestamp)) {
    return ec;
  }
  out.i = wire::load_le<std::uint32_t>(payload_.data());
  out.t = wire::load_le<std::uint32_t>(payload_.data() + 4);
  return {};
}

std::error_code ValueReader::read_int64(std::int64_t& out) const noexcept {
  if (auto ec = expect(element_type::int64)) {
    return ec;
  }
  out = static_cast<std::int64_t>(wire::load_le<std::uint64_t>(payload_.data()));
  return {};
}

std::error_code ValueReader::read_decimal128(Decimal128& out) const noexcept {
  if (auto ec = expect(element_type::decimal128)) {
    return ec;
  }
  out.low = wire::load_le<std::uint64_t>(payload_.data());
  out.high = wire::load_le<std::uint64_t>(payload_.data() + 8);
  return {};
}

std::error_code ValueReader::read_min_key() const noexcept { return expect(element_type::min_key); }

std::error_code ValueReader::read_max_key() const noexcept { return expect(element_type::max_key); }

std::error_code ValueReader::read_document(DocumentReader& out) const noexcept {
  if (type_ != element_type::document && type_ != element_type::array) {
    return make_error_code(errc::type_mismatch);
  }
  return DocumentReader::open(payload_, offset_, depth_ + 1, out);
}

std::error_code ValueReader::read_raw_document(bytes_view& out) const noexcept {
  if (type_ != element_type::document && type_ != element_type::array) {
    return make_error_code(errc::type_mismatch);
  }
  out = payload_;
  return {};
}

std::error_code ValueReader::read_value(Value& out) const {
  std::error_code ec;
  switch (type_) {
    case element_type::double_: {
      double v = 0;
      ec = read_double(v);
      out = Value(v);
      return ec;
    }
    case element_type::string: {
      std::string v;
      ec = read_string(v);
      out = Value(std::move(v));
      return ec;
    }
    case element_type::document: {
      DocumentReader r;
      ec = read_document(r);
      if (ec) {
        return ec;
      }
      Document doc;
      ec = read_elements(r, doc);
      out = Value(std::move(doc));
      return ec;
    }
    case element_type::array: {
      DocumentReader r;
      ec = read_document(r);
      if (ec) {
        return ec;
      }
      Array arr;
      ec = read_items(r, arr);
      out = Value(std::move(arr));
      return ec;
    }
    case element_type::binary: {
      Binary v;
      ec = read_binary(v);
      out = Value(std::move(v));
      return ec;
    }
    case element_type::undefined:
      out = Value(Undefined{});
      return {};
    case element_type::object_id: {
      ObjectId v;
      ec = read_object_id(v);
      out = Value(v);
      return ec;
    }
    case element_type::boolean: {
      bool v = false;
      ec = read_boolean(v);
      out = Value(v);
      return ec;
    }
    case element_type::datetime: {
      std::int64_t v = 0;
      ec = read_datetime(v);
      out = Value(DateTime{v});
      return ec;
    }
    case element_type::null:
      out = Value(Null{});
      return {};
    case element_type::regex: {
      Regex v;
      ec = read_regex(v);
      out = Value(std::move(v));
      return ec;
    }
    case element_type::dbpointer: {
      DBPointer v;
      ec = read_dbpointer(v);
      out = Value(std::move(v));
      return ec;
    }
    case element_type::javascript: {
      JavaScript v;
      ec = read_javascript(v.code);
      out = Value(std::move(v));
      return ec;
    }
    case element_type::symbol: {
      Symbol v;
      ec = read_symbol(v.value);
      out = Value(std::move(v));
      return ec;
    }
    case element_type::code_with_scope: {
      CodeWithScope v;
      bytes_view scope;
      ec = read_code_with_scope(v.code, scope);
      if (ec) {
        return ec;
      }
      DocumentReader r;
      const auto scope_offset = offset_ + static_cast<std::size_t>(scope.data() - payload_.data());
      ec = DocumentReader::open(scope, scope_offset, depth_ + 1, r);
      if (ec) {
        return ec;
      }
      ec = read_elements(r, v.scope);
      out = Value(std::move(v));
      return ec;
    }
    case element_type::int32: {
      std::int32_t v = 0;
      ec = read_int32(v);
      out = Value(v);
      return ec;
    }
    case element_type::timestamp: {
      Timestamp v;
      ec = read_timestamp(v);
      out = Value(v);
      return ec;
    }
    case element_type::int64: {
      std::int64_t v = 0;
      ec = read_int64(v);
      out = Value(v);
      return ec;
    }
    case element_type::decimal128: {
      Decimal128 v;
      ec = read_decimal128(v);
      out = Value(v);
      return ec;
    }
    case element_type::min_key:
      out = Value(MinKey{});
      return {};
    case element_type::max_key:
      out = Value(MaxKey{});
      return {};
  }
  return make_error_code(errc::unknown_element_type);
}

// DocumentReader

std::error_code DocumentReader::open(bytes_view doc, DocumentReader& out) noexcept {
  return open(doc, 0, 0, out);
}

std::error_code DocumentReader::open(bytes_view doc, std::size_t base_offset, std::size_t depth, DocumentReader& out) noexcept {
  if (depth > core::kMaxDocumentDepth) {
    return make_error_code(errc::depth_exceeded);
  }
  std::size_t size = 0;
  auto ec = wire::document_span(doc, 0, size);
  if (ec) {
    return ec;
  }
  if (size != doc.size()) {
    return make_error_code(errc::malformed_document);
  }
  out.doc_ = doc;
  out.base_ = base_offset;
  out.pos_ = 4;
  out.depth_ = depth;
  out.pending_.reset();
  out.done_ = false;
  return {};
}

std::error_code DocumentReader::next(std::optional<ElementHeader>& out) noexcept {
  out.reset();
  if (pending_) {
    auto ec = skip_value();
    if (ec) {
      return ec;
    }
  }
  if (done_ || doc_.empty()) {
    return {};
  }
  if (pos_ >= doc_.size()) {
    return make_error_code(errc::truncated);
  }

  const auto tag = doc_[pos_];
  if (tag == 0) {
    // 0x00 只能出现在文档最后一个字节。
    if (pos_ != doc_.size() - 1) {
      return make_error_code(errc::malformed_document);
    }
    done_ = true;
    return {};
  }
  const auto type = element_type_from_byte(tag);
  if (!type) {
    return make_error_code(errc::unknown_element_type);
  }

  std::size_t key_len = 0;
  auto ec = wire::scan_cstring(body_of(doc_), pos_ + 1, key_len);
  if (ec) {
    return make_error_code(errc::malformed_document);
  }

  ElementHeader h;
  h.type = *type;
  h.key = std::string_view(reinterpret_cast<const char*>(doc_.data() + pos_ + 1), key_len);
  h.offset = base_ + pos_;
  pos_ += 1 + key_len + 1;
  pending_ = h;
  out = h;
  return {};
}

std::error_code DocumentReader::take_pending(ValueReader& out) noexcept {
  if (!pending_) {
    return make_error_code(errc::cursor_invariant);
  }
  std::size_t size = 0;
  auto ec = wire::value_size(pending_->type, body_of(doc_), pos_, size);
  if (ec) {
    return ec;
  }
  out = ValueReader(pending_->type, doc_.subspan(pos_, size), base_ + pos_, depth_);
  pos_ += size;
  pending_.reset();
  return {};
}

std::error_code DocumentReader::value_reader(ValueReader& out) noexcept { return take_pending(out); }

std::error_code DocumentReader::read_value(Value& out) {
  ValueReader v;
  auto ec = take_pending(v);
  if (ec) {
    return ec;
  }
  return v.read_value(out);
}

std::error_code DocumentReader::skip_value() noexcept {
  ValueReader ignored;
  return take_pending(ignored);
}

std::error_code DocumentReader::descend_into(DocumentReader& child) noexcept {
  ValueReader v;
  auto ec = take_pending(v);
  if (ec) {
    return ec;
  }
  return v.read_document(child);
}

std::error_code lookup(bytes_view doc, std::span<const std::string_view> path, ValueReader& out) noexcept {
  ValueReader cur;
  auto ec = ValueReader::from_document(doc, cur);
  if (ec) {
    return ec;
  }
  for (const auto key : path) {
    DocumentReader r;
    ec = cur.read_document(r);
    if (ec) {
      return ec;
    }
    bool found = false;
    std::optional<ElementHeader> header;
    for (;;) {
      ec = r.next(header);
      if (ec) {
        return ec;
      }
      if (!header) {
        break;
      }
      if (header->key == key) {
        ec = r.value_reader(cur);
        if (ec) {
          return ec;
        }
        found = true;
        break;
      }
    }
    if (!found) {
      return make_error_code(errc::key_not_found);
    }
  }
  out = cur;
  return {};
}

}  // namespace bsonc::bson
