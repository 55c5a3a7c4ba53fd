#include "bsonc/codec/map_codec.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

namespace bsonc::codec {

std::error_code MapCodec::encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const {
  if (v.type == nullptr || v.type->kind() != reflect::Kind::map) {
    return make_error_code(errc::incompatible_type);
  }
  const auto& mt = static_cast<const reflect::MapType&>(*v.type);
  if (!mt.key_supported()) {
    return make_error_code(errc::unsupported_key);
  }

  auto ec = w.open_document();
  if (ec) {
    return ec;
  }
  auto& dw = w.writer();
  const auto& value_type = mt.value();

  if (options_.key_order == KeyOrder::sorted) {
    std::vector<std::pair<std::string, const void*>> entries;
    entries.reserve(mt.size(v.ptr));
    ec = mt.for_each(v.ptr, [&](std::string_view key, const void* value) -> std::error_code {
      entries.emplace_back(std::string(key), value);
      return {};
    });
    if (ec) {
      return make_error_code(errc::unsupported_key);
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) { return a.first < b.first; });
    for (const auto& [key, value] : entries) {
      auto ew = dw.element(key);
      ec = encode_element(ctx, ew, ConstValueRef{&value_type, value});
      if (ec) {
        return ec;
      }
    }
  } else {
    ec = mt.for_each(v.ptr, [&](std::string_view key, const void* value) -> std::error_code {
      auto ew = dw.element(key);
      return encode_element(ctx, ew, ConstValueRef{&value_type, value});
    });
    if (ec) {
      return ec;
    }
  }

  return dw.close_document();
}

std::error_code MapCodec::decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const {
  if (v.type == nullptr || v.type->kind() != reflect::Kind::map) {
    return make_error_code(errc::incompatible_type);
  }
  const auto& mt = static_cast<const reflect::MapType&>(*v.type);
  if (!mt.key_supported()) {
    return make_error_code(errc::unsupported_key);
  }
  if (r.type() == bson::element_type::null) {
    mt.clear(v.ptr);
    return {};
  }
  if (r.type() != bson::element_type::document) {
    return make_error_code(errc::incompatible_type);
  }

  bson::DocumentReader dr;
  auto ec = r.read_document(dr);
  if (ec) {
    return ec;
  }
  mt.clear(v.ptr);

  std::optional<bson::ElementHeader> header;
  for (;;) {
    ec = dr.next(header);
    if (ec) {
      return ec;
    }
    if (!header) {
      return {};
    }
    void* slot = nullptr;
    if (mt.slot(v.ptr, header->key, slot)) {
      return make_error_code(errc::unsupported_key);
    }
    bson::ValueReader vr;
    ec = dr.value_reader(vr);
    if (ec) {
      return ec;
    }
    ec = decode_element(ctx, vr, ValueRef{&mt.value(), slot});
    if (ec) {
      return ec;
    }
  }
}

}  // namespace bsonc::codec
