#include "bsonc/codec/default_codecs.hpp"

#include "bsonc/codec/map_codec.hpp"
#include "bsonc/codec/struct_codec.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <utility>

namespace bsonc::codec {
namespace {

constexpr std::int64_t kInt32Min = std::numeric_limits<std::int32_t>::min();
constexpr std::int64_t kInt32Max = std::numeric_limits<std::int32_t>::max();
constexpr std::uint64_t kInt64Max = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

bool fits_int32(std::int64_t v) noexcept { return v >= kInt32Min && v <= kInt32Max; }

const reflect::NumericType& numeric(const reflect::Type& t) noexcept { return static_cast<const reflect::NumericType&>(t); }

/**
 * @brief 把 double 转为整数（目标为有符号/无符号 64 位中间值）。
 *
 * 带小数且未开启 truncate：precision_loss；超出 64 位范围：overflow。
 */
std::error_code double_to_integer(double d, bool truncate, bool to_unsigned, std::int64_t& si, std::uint64_t& ui) noexcept {
  if (!truncate && std::trunc(d) != d) {
    return make_error_code(errc::precision_loss);
  }
  if (to_unsigned) {
    if (!(d > -1.0 && d < 18446744073709551616.0)) {
      return make_error_code(errc::overflow);
    }
    ui = d <= 0.0 ? 0 : static_cast<std::uint64_t>(d);
    return {};
  }
  if (!(d >= -9223372036854775808.0 && d < 9223372036854775808.0)) {
    return make_error_code(errc::overflow);
  }
  si = static_cast<std::int64_t>(d);
  return {};
}

}  // namespace

// BooleanCodec

std::error_code BooleanCodec::encode_value(const EncodeContext&, bson::ValueWriter& w, ConstValueRef v) const {
  if (v.type->kind() != reflect::Kind::boolean) {
    return make_error_code(errc::incompatible_type);
  }
  return w.write_boolean(*static_cast<const bool*>(v.ptr));
}

std::error_code BooleanCodec::decode_value(const DecodeContext&, const bson::ValueReader& r, ValueRef v) const {
  if (v.type->kind() != reflect::Kind::boolean) {
    return make_error_code(errc::incompatible_type);
  }
  auto& out = *static_cast<bool*>(v.ptr);
  switch (r.type()) {
    case bson::element_type::boolean:
      return r.read_boolean(out);
    case bson::element_type::int32: {
      std::int32_t i = 0;
      auto ec = r.read_int32(i);
      out = i != 0;
      return ec;
    }
    case bson::element_type::int64: {
      std::int64_t i = 0;
      auto ec = r.read_int64(i);
      out = i != 0;
      return ec;
    }
    case bson::element_type::double_: {
      double d = 0;
      auto ec = r.read_double(d);
      out = d != 0;
      return ec;
    }
    case bson::element_type::null:
    case bson::element_type::undefined:
      out = false;
      return {};
    default:
      return make_error_code(errc::incompatible_type);
  }
}

// IntCodec

std::error_code IntCodec::encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const {
  const auto kind = v.type->kind();
  if (reflect::is_signed_integer(kind)) {
    const auto i = numeric(*v.type).load_signed(v.ptr);
    if (kind != reflect::Kind::int64 || (ctx.min_size && fits_int32(i))) {
      return w.write_int32(static_cast<std::int32_t>(i));
    }
    return w.write_int64(i);
  }
  if (!reflect::is_unsigned_integer(kind)) {
    return make_error_code(errc::incompatible_type);
  }

  const auto u = numeric(*v.type).load_unsigned(v.ptr);
  if (kind == reflect::Kind::uint8 || kind == reflect::Kind::uint16) {
    return w.write_int32(static_cast<std::int32_t>(u));
  }
  if (ctx.min_size && u <= static_cast<std::uint64_t>(kInt32Max)) {
    return w.write_int32(static_cast<std::int32_t>(u));
  }
  if (u > kInt64Max) {
    return make_error_code(errc::overflow);
  }
  return w.write_int64(static_cast<std::int64_t>(u));
}

std::error_code IntCodec::decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const {
  const auto kind = v.type->kind();
  const bool is_unsigned = reflect::is_unsigned_integer(kind);
  if (!is_unsigned && !reflect::is_signed_integer(kind)) {
    return make_error_code(errc::incompatible_type);
  }
  const auto& nt = numeric(*v.type);

  std::int64_t si = 0;
  std::uint64_t ui = 0;
  bool from_unsigned = false;
  std::error_code ec;
  switch (r.type()) {
    case bson::element_type::int32: {
      std::int32_t i = 0;
      ec = r.read_int32(i);
      si = i;
      break;
    }
    case bson::element_type::int64:
      ec = r.read_int64(si);
      break;
    case bson::element_type::double_: {
      double d = 0;
      ec = r.read_double(d);
      if (!ec) {
        ec = double_to_integer(d, ctx.truncate, is_unsigned, si, ui);
        from_unsigned = is_unsigned;
      }
      break;
    }
    case bson::element_type::boolean: {
      bool b = false;
      ec = r.read_boolean(b);
      si = b ? 1 : 0;
      break;
    }
    case bson::element_type::null:
    case bson::element_type::undefined:
      v.type->reset(v.ptr);
      return {};
    default:
      return make_error_code(errc::incompatible_type);
  }
  if (ec) {
    return ec;
  }

  if (is_unsigned) {
    if (!from_unsigned) {
      if (si < 0) {
        return make_error_code(errc::overflow);
      }
      ui = static_cast<std::uint64_t>(si);
    }
    if (ui > nt.max_unsigned()) {
      return make_error_code(errc::overflow);
    }
    nt.store_unsigned(v.ptr, ui);
    return {};
  }

  if (si < nt.min_signed() || si > static_cast<std::int64_t>(nt.max_unsigned())) {
    return make_error_code(errc::overflow);
  }
  nt.store_signed(v.ptr, si);
  return {};
}

// FloatCodec

std::error_code FloatCodec::encode_value(const EncodeContext&, bson::ValueWriter& w, ConstValueRef v) const {
  if (!reflect::is_float(v.type->kind())) {
    return make_error_code(errc::incompatible_type);
  }
  return w.write_double(numeric(*v.type).load_float(v.ptr));
}

std::error_code FloatCodec::decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const {
  const auto kind = v.type->kind();
  if (!reflect::is_float(kind)) {
    return make_error_code(errc::incompatible_type);
  }

  double d = 0;
  std::error_code ec;
  switch (r.type()) {
    case bson::element_type::double_:
      ec = r.read_double(d);
      break;
    case bson::element_type::int32: {
      std::int32_t i = 0;
      ec = r.read_int32(i);
      d = static_cast<double>(i);
      break;
    }
    case bson::element_type::int64: {
      std::int64_t i = 0;
      ec = r.read_int64(i);
      d = static_cast<double>(i);
      break;
    }
    case bson::element_type::boolean: {
      bool b = false;
      ec = r.read_boolean(b);
      d = b ? 1.0 : 0.0;
      break;
    }
    case bson::element_type::null:
    case bson::element_type::undefined:
      v.type->reset(v.ptr);
      return {};
    default:
      return make_error_code(errc::incompatible_type);
  }
  if (ec) {
    return ec;
  }

  // float 放不下（精度或范围）时需要 truncate。
  if (kind == reflect::Kind::float32 && !ctx.truncate && !std::isnan(d) &&
      static_cast<double>(static_cast<float>(d)) != d) {
    return make_error_code(errc::precision_loss);
  }
  numeric(*v.type).store_float(v.ptr, d);
  return {};
}

// StringCodec

std::error_code StringCodec::encode_value(const EncodeContext&, bson::ValueWriter& w, ConstValueRef v) const {
  if (v.type->kind() != reflect::Kind::string) {
    return make_error_code(errc::incompatible_type);
  }
  return w.write_string(*static_cast<const std::string*>(v.ptr));
}

std::error_code StringCodec::decode_value(const DecodeContext&, const bson::ValueReader& r, ValueRef v) const {
  if (v.type->kind() != reflect::Kind::string) {
    return make_error_code(errc::incompatible_type);
  }
  auto& out = *static_cast<std::string*>(v.ptr);
  switch (r.type()) {
    case bson::element_type::string:
    case bson::element_type::symbol:
    case bson::element_type::javascript: {
      std::string_view s;
      auto ec = r.read_string_view(s);
      if (ec) {
        return ec;
      }
      out.assign(s);
      return {};
    }
    case bson::element_type::null:
    case bson::element_type::undefined:
      out.clear();
      return {};
    default:
      return make_error_code(errc::incompatible_type);
  }
}

// SequenceCodec

std::error_code SequenceCodec::encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const {
  if (v.type->kind() != reflect::Kind::sequence) {
    return make_error_code(errc::incompatible_type);
  }
  const auto& st = static_cast<const reflect::SequenceType&>(*v.type);
  if (st.is_bytes()) {
    return w.write_binary(static_cast<std::uint8_t>(bson::binary_subtype::generic), st.bytes(v.ptr));
  }

  auto ec = w.open_array();
  if (ec) {
    return ec;
  }
  auto& dw = w.writer();
  const auto& element = st.element();
  const auto n = st.size(v.ptr);
  for (std::size_t i = 0; i < n; ++i) {
    const bson::IndexKey key(i);
    auto ew = dw.element(key.view());
    ec = encode_element(ctx, ew, ConstValueRef{&element, st.at(v.ptr, i)});
    if (ec) {
      return ec;
    }
  }
  return dw.close_document();
}

std::error_code SequenceCodec::decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const {
  if (v.type->kind() != reflect::Kind::sequence) {
    return make_error_code(errc::incompatible_type);
  }
  const auto& st = static_cast<const reflect::SequenceType&>(*v.type);
  if (r.is_null() || r.type() == bson::element_type::undefined) {
    st.reset(v.ptr);
    return {};
  }

  if (st.is_bytes() && r.type() == bson::element_type::binary) {
    std::uint8_t subtype = 0;
    bson::bytes_view data;
    auto ec = r.read_binary_view(subtype, data);
    if (ec) {
      return ec;
    }
    if (subtype != static_cast<std::uint8_t>(bson::binary_subtype::generic) &&
        subtype != static_cast<std::uint8_t>(bson::binary_subtype::binary_old)) {
      return make_error_code(errc::incompatible_type);
    }
    st.assign_bytes(v.ptr, data);
    return {};
  }
  if (r.type() != bson::element_type::array) {
    return make_error_code(errc::incompatible_type);
  }

  bson::DocumentReader dr;
  auto ec = r.read_document(dr);
  if (ec) {
    return ec;
  }
  st.reset(v.ptr);
  const auto& element = st.element();
  std::optional<bson::ElementHeader> header;
  for (;;) {
    ec = dr.next(header);
    if (ec) {
      return ec;
    }
    if (!header) {
      return {};
    }
    bson::ValueReader er;
    ec = dr.value_reader(er);
    if (ec) {
      return ec;
    }
    ec = decode_element(ctx, er, ValueRef{&element, st.emplace_back(v.ptr)});
    if (ec) {
      return ec;
    }
  }
}

// PointerCodec

std::error_code PointerCodec::encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const {
  if (v.type->kind() != reflect::Kind::pointer) {
    return make_error_code(errc::incompatible_type);
  }
  const auto& pt = static_cast<const reflect::PointerType&>(*v.type);
  const void* target = pt.get(v.ptr);
  if (target == nullptr) {
    return w.write_null();
  }
  return encode_element(ctx, w, ConstValueRef{&pt.pointee(), target});
}

std::error_code PointerCodec::decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const {
  if (v.type->kind() != reflect::Kind::pointer) {
    return make_error_code(errc::incompatible_type);
  }
  const auto& pt = static_cast<const reflect::PointerType&>(*v.type);
  if (r.is_null()) {
    pt.reset(v.ptr);
    return {};
  }
  return decode_element(ctx, r, ValueRef{&pt.pointee(), pt.ensure(v.ptr)});
}

// bson::Value / Document / Array / Raw

std::error_code BsonValueCodec::encode(const EncodeContext&, bson::ValueWriter& w, const bson::Value& v) const {
  return w.write_value(v);
}

std::error_code BsonValueCodec::decode(const DecodeContext&, const bson::ValueReader& r, bson::Value& v) const {
  return r.read_value(v);
}

std::error_code DocumentCodec::encode(const EncodeContext&, bson::ValueWriter& w, const bson::Document& v) const {
  return w.write_document(v);
}

std::error_code DocumentCodec::decode(const DecodeContext&, const bson::ValueReader& r, bson::Document& v) const {
  if (r.is_null()) {
    v.elements.clear();
    return {};
  }
  if (r.type() != bson::element_type::document) {
    return make_error_code(errc::incompatible_type);
  }
  bson::Value tmp;
  auto ec = r.read_value(tmp);
  if (ec) {
    return ec;
  }
  v = std::move(*tmp.get_if<bson::Document>());
  return {};
}

std::error_code ArrayCodec::encode(const EncodeContext&, bson::ValueWriter& w, const bson::Array& v) const {
  auto ec = w.open_array();
  if (ec) {
    return ec;
  }
  auto& dw = w.writer();
  for (std::size_t i = 0; i < v.size(); ++i) {
    const bson::IndexKey key(i);
    ec = dw.write_value(key.view(), v[i]);
    if (ec) {
      return ec;
    }
  }
  return dw.close_document();
}

std::error_code ArrayCodec::decode(const DecodeContext&, const bson::ValueReader& r, bson::Array& v) const {
  if (r.is_null()) {
    v.clear();
    return {};
  }
  if (r.type() != bson::element_type::array) {
    return make_error_code(errc::incompatible_type);
  }
  bson::Value tmp;
  auto ec = r.read_value(tmp);
  if (ec) {
    return ec;
  }
  v = std::move(*tmp.get_if<bson::Array>());
  return {};
}

std::error_code RawCodec::encode(const EncodeContext&, bson::ValueWriter& w, const bson::Raw& v) const {
  return w.write_raw_document(v.view());
}

std::error_code RawCodec::decode(const DecodeContext&, const bson::ValueReader& r, bson::Raw& v) const {
  if (r.is_null()) {
    v.bytes.clear();
    return {};
  }
  bson::bytes_view doc;
  auto ec = r.read_raw_document(doc);
  if (ec) {
    return make_error_code(errc::incompatible_type);
  }
  v.bytes.assign(doc.begin(), doc.end());
  return {};
}

// TimeCodec

std::error_code TimeCodec::encode(
  const EncodeContext&,
  bson::ValueWriter& w,
  const std::chrono::system_clock::time_point& v) const {
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(v.time_since_epoch()).count();
  return w.write_datetime(static_cast<std::int64_t>(millis));
}

std::error_code TimeCodec::decode(
  const DecodeContext&,
  const bson::ValueReader& r,
  std::chrono::system_clock::time_point& v) const {
  using std::chrono::system_clock;
  std::int64_t millis = 0;
  std::error_code ec;
  switch (r.type()) {
    case bson::element_type::datetime:
    case bson::element_type::int64:
      ec = r.type() == bson::element_type::datetime ? r.read_datetime(millis) : r.read_int64(millis);
      break;
    case bson::element_type::timestamp: {
      bson::Timestamp ts;
      ec = r.read_timestamp(ts);
      millis = static_cast<std::int64_t>(ts.t) * 1000;
      break;
    }
    case bson::element_type::null:
    case bson::element_type::undefined:
      v = system_clock::time_point{};
      return {};
    default:
      return make_error_code(errc::incompatible_type);
  }
  if (ec) {
    return ec;
  }
  v = system_clock::time_point(std::chrono::duration_cast<system_clock::duration>(std::chrono::milliseconds(millis)));
  return {};
}

// 钩子接口

std::error_code MarshalerCodec::encode(const EncodeContext&, bson::ValueWriter& w, const Marshaler& v) const {
  std::vector<bson::byte> doc;
  auto ec = v.marshal_bson(doc);
  if (ec) {
    return ec;
  }
  return w.write_raw_document(bson::bytes_view{doc.data(), doc.size()});
}

std::error_code UnmarshalerCodec::decode(const DecodeContext&, const bson::ValueReader& r, Unmarshaler& v, ValueRef whole)
  const {
  if (r.is_null()) {
    whole.type->reset(whole.ptr);
    return {};
  }
  bson::bytes_view doc;
  if (r.read_raw_document(doc)) {
    return make_error_code(errc::incompatible_type);
  }
  return v.unmarshal_bson(doc);
}

std::error_code ValueMarshalerCodec::encode(const EncodeContext&, bson::ValueWriter& w, const ValueMarshaler& v) const {
  auto type = bson::element_type::null;
  std::vector<bson::byte> payload;
  auto ec = v.marshal_bson_value(type, payload);
  if (ec) {
    return ec;
  }
  return w.write_raw_value(type, bson::bytes_view{payload.data(), payload.size()});
}

std::error_code ValueUnmarshalerCodec::decode(
  const DecodeContext&,
  const bson::ValueReader& r,
  ValueUnmarshaler& v,
  ValueRef /*whole*/) const {
  return v.unmarshal_bson_value(r.type(), r.payload());
}

void register_default_codecs(RegistryBuilder& builder) {
  const auto boolean = std::make_shared<const BooleanCodec>();
  const auto integer = std::make_shared<const IntCodec>();
  const auto floating = std::make_shared<const FloatCodec>();

  builder.register_kind(reflect::Kind::boolean, boolean)
    .register_kind(reflect::Kind::int8, integer)
    .register_kind(reflect::Kind::int16, integer)
    .register_kind(reflect::Kind::int32, integer)
    .register_kind(reflect::Kind::int64, integer)
    .register_kind(reflect::Kind::uint8, integer)
    .register_kind(reflect::Kind::uint16, integer)
    .register_kind(reflect::Kind::uint32, integer)
    .register_kind(reflect::Kind::uint64, integer)
    .register_kind(reflect::Kind::float32, floating)
    .register_kind(reflect::Kind::float64, floating)
    .register_kind(reflect::Kind::string, std::make_shared<const StringCodec>())
    .register_kind(reflect::Kind::sequence, std::make_shared<const SequenceCodec>())
    .register_kind(reflect::Kind::pointer, std::make_shared<const PointerCodec>())
    .set_default_struct_codec(std::make_shared<const StructCodec>(std::make_shared<const DefaultStructTagParser>()))
    .set_default_map_codec(std::make_shared<const MapCodec>());

  builder.register_type<bson::Value>(std::make_shared<const BsonValueCodec>())
    .register_type<bson::Document>(std::make_shared<const DocumentCodec>())
    .register_type<bson::Array>(std::make_shared<const ArrayCodec>())
    .register_type<bson::Raw>(std::make_shared<const RawCodec>())
    .register_type<bson::ObjectId>(std::make_shared<const PrimitiveCodec<bson::ObjectId>>())
    .register_type<bson::DateTime>(std::make_shared<const PrimitiveCodec<bson::DateTime>>())
    .register_type<bson::Timestamp>(std::make_shared<const PrimitiveCodec<bson::Timestamp>>())
    .register_type<bson::Decimal128>(std::make_shared<const PrimitiveCodec<bson::Decimal128>>())
    .register_type<bson::Binary>(std::make_shared<const PrimitiveCodec<bson::Binary>>())
    .register_type<bson::Regex>(std::make_shared<const PrimitiveCodec<bson::Regex>>())
    .register_type<bson::DBPointer>(std::make_shared<const PrimitiveCodec<bson::DBPointer>>())
    .register_type<bson::JavaScript>(std::make_shared<const PrimitiveCodec<bson::JavaScript>>())
    .register_type<bson::Symbol>(std::make_shared<const PrimitiveCodec<bson::Symbol>>())
    .register_type<bson::CodeWithScope>(std::make_shared<const PrimitiveCodec<bson::CodeWithScope>>())
    .register_type<bson::MinKey>(std::make_shared<const PrimitiveCodec<bson::MinKey>>())
    .register_type<bson::MaxKey>(std::make_shared<const PrimitiveCodec<bson::MaxKey>>())
    .register_type<bson::Null>(std::make_shared<const PrimitiveCodec<bson::Null>>())
    .register_type<bson::Undefined>(std::make_shared<const PrimitiveCodec<bson::Undefined>>())
    .register_type<std::chrono::system_clock::time_point>(std::make_shared<const TimeCodec>());

  builder.register_interface(interface_capability<ValueMarshaler>(), std::make_shared<const ValueMarshalerCodec>())
    .register_interface(interface_capability<ValueUnmarshaler>(), std::make_shared<const ValueUnmarshalerCodec>())
    .register_interface(interface_capability<Marshaler>(), std::make_shared<const MarshalerCodec>())
    .register_interface(interface_capability<Unmarshaler>(), std::make_shared<const UnmarshalerCodec>());
}

RegistryBuilder new_registry_builder() {
  RegistryBuilder builder;
  register_default_codecs(builder);
  return builder;
}

}  // namespace bsonc::codec
