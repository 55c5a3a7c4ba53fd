#pragma once

#include "bsonc/bson/types.hpp"
#include "bsonc/codec/codec.hpp"
#include "bsonc/codec/registry.hpp"

#include <system_error>
#include <vector>

namespace bsonc::codec {

struct EncodeOptions final {
  // 整数放得下时优先编码为 int32。
  bool min_size{false};
};

struct DecodeOptions final {
  bool truncate{false};
  bool strict{false};
  bool zero_structs{false};
};

/**
 * @brief 把 v 编码为一篇完整文档并追加到 out。
 *
 * 顶层值必须编码为文档（结构体、映射、bson::Document、Raw、Marshaler ...），
 * 否则返回 bson::errc::not_a_document。失败时 out 恢复为调用前的长度。
 */
std::error_code encode_document(const EncodeContext& ctx, ConstValueRef v, std::vector<bson::byte>& out);

/**
 * @brief 把 doc（恰好一篇完整文档）解码到 v。
 */
std::error_code decode_document(const DecodeContext& ctx, bson::bytes_view doc, ValueRef v);

template <class T>
std::error_code marshal_append_with_context(
  const Registry& registry,
  const EncodeOptions& options,
  const T& value,
  std::vector<bson::byte>& out) {
  const EncodeContext ctx{registry, options.min_size};
  return encode_document(ctx, reflect::make_ref(value), out);
}

template <class T>
std::error_code marshal_append(const Registry& registry, const T& value, std::vector<bson::byte>& out) {
  return marshal_append_with_context(registry, EncodeOptions{}, value, out);
}

template <class T>
std::error_code marshal_with_context(
  const Registry& registry,
  const EncodeOptions& options,
  const T& value,
  std::vector<bson::byte>& out) {
  out.clear();
  return marshal_append_with_context(registry, options, value, out);
}

// 编码到 out（先清空 out）。
template <class T>
std::error_code marshal(const Registry& registry, const T& value, std::vector<bson::byte>& out) {
  return marshal_with_context(registry, EncodeOptions{}, value, out);
}

template <class T>
std::error_code unmarshal_with_context(
  const Registry& registry,
  const DecodeOptions& options,
  bson::bytes_view doc,
  T& value) {
  const DecodeContext ctx{registry, options.truncate, options.strict, options.zero_structs};
  return decode_document(ctx, doc, reflect::make_ref(value));
}

template <class T>
std::error_code unmarshal(const Registry& registry, bson::bytes_view doc, T& value) {
  return unmarshal_with_context(registry, DecodeOptions{}, doc, value);
}

}  // namespace bsonc::codec
