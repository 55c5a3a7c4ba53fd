#pragma once

#include "bsonc/bson/value.hpp"
#include "bsonc/codec/codec.hpp"
#include "bsonc/codec/interfaces.hpp"
#include "bsonc/codec/registry.hpp"

#include <chrono>
#include <type_traits>
#include <vector>

namespace bsonc::codec {

/*
 * 默认 Codec。
 *
 * 按 Kind 注册（类型注册表的回退项）：
 * - BooleanCodec / IntCodec / FloatCodec / StringCodec；
 * - SequenceCodec：std::vector<E> <-> 数组；std::vector<std::uint8_t> <-> binary；
 * - PointerCodec：std::optional / std::unique_ptr / std::shared_ptr，空值 <-> null；
 * - StructCodec / MapCodec（见 struct_codec.hpp / map_codec.hpp）。
 *
 * 按具体类型注册：bson::Value / Document / Array / Raw、各元素类型、
 * std::chrono::system_clock::time_point（datetime）。
 *
 * 整数编码规则：
 * - int8/int16/int32、uint8/uint16 -> int32；
 * - int64 -> int64（minsize 且放得下时 int32）；
 * - uint32 -> int64（minsize 且放得下时 int32）；
 * - uint64 -> int64（minsize 且放得下时 int32；超过 int64 上限返回 overflow）。
 */

class BooleanCodec final : public ValueCodec {
 public:
  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const override;
  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const override;
};

class IntCodec final : public ValueCodec {
 public:
  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const override;
  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const override;
};

class FloatCodec final : public ValueCodec {
 public:
  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const override;
  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const override;
};

class StringCodec final : public ValueCodec {
 public:
  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const override;
  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const override;
};

class SequenceCodec final : public ValueCodec {
 public:
  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const override;
  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const override;
};

class PointerCodec final : public ValueCodec {
 public:
  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const override;
  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const override;
};

class BsonValueCodec final : public TypedCodec<bson::Value> {
 protected:
  std::error_code encode(const EncodeContext& ctx, bson::ValueWriter& w, const bson::Value& v) const override;
  std::error_code decode(const DecodeContext& ctx, const bson::ValueReader& r, bson::Value& v) const override;
};

class DocumentCodec final : public TypedCodec<bson::Document> {
 protected:
  std::error_code encode(const EncodeContext& ctx, bson::ValueWriter& w, const bson::Document& v) const override;
  std::error_code decode(const DecodeContext& ctx, const bson::ValueReader& r, bson::Document& v) const override;
};

class ArrayCodec final : public TypedCodec<bson::Array> {
 protected:
  std::error_code encode(const EncodeContext& ctx, bson::ValueWriter& w, const bson::Array& v) const override;
  std::error_code decode(const DecodeContext& ctx, const bson::ValueReader& r, bson::Array& v) const override;
};

class RawCodec final : public TypedCodec<bson::Raw> {
 protected:
  std::error_code encode(const EncodeContext& ctx, bson::ValueWriter& w, const bson::Raw& v) const override;
  std::error_code decode(const DecodeContext& ctx, const bson::ValueReader& r, bson::Raw& v) const override;
};

class TimeCodec final : public TypedCodec<std::chrono::system_clock::time_point> {
 protected:
  std::error_code encode(
    const EncodeContext& ctx,
    bson::ValueWriter& w,
    const std::chrono::system_clock::time_point& v) const override;
  std::error_code decode(
    const DecodeContext& ctx,
    const bson::ValueReader& r,
    std::chrono::system_clock::time_point& v) const override;
};

/**
 * @brief 各元素类型（ObjectId、DateTime、Binary、Regex ...）与同名元素之间的直接映射。
 *
 * 解码 null 得到零值；其它元素类型返回 incompatible_type。
 */
template <class T>
class PrimitiveCodec final : public TypedCodec<T> {
 protected:
  std::error_code encode(const EncodeContext&, bson::ValueWriter& w, const T& v) const override {
    if constexpr (std::is_same_v<T, bson::ObjectId>) {
      return w.write_object_id(v);
    } else if constexpr (std::is_same_v<T, bson::DateTime>) {
      return w.write_datetime(v.millis);
    } else if constexpr (std::is_same_v<T, bson::Timestamp>) {
      return w.write_timestamp(v);
    } else if constexpr (std::is_same_v<T, bson::Decimal128>) {
      return w.write_decimal128(v);
    } else if constexpr (std::is_same_v<T, bson::Binary>) {
      return w.write_binary(v.subtype, bson::bytes_view{v.data.data(), v.data.size()});
    } else if constexpr (std::is_same_v<T, bson::Regex>) {
      return w.write_regex(v.pattern, v.options);
    } else if constexpr (std::is_same_v<T, bson::DBPointer>) {
      return w.write_dbpointer(v.ns, v.id);
    } else if constexpr (std::is_same_v<T, bson::JavaScript>) {
      return w.write_javascript(v.code);
    } else if constexpr (std::is_same_v<T, bson::Symbol>) {
      return w.write_symbol(v.value);
    } else if constexpr (std::is_same_v<T, bson::CodeWithScope>) {
      std::vector<bson::byte> scope;
      bson::DocumentWriter sw(scope);
      auto ec = sw.write_document(v.scope);
      if (ec) {
        return ec;
      }
      return w.write_code_with_scope(v.code, bson::bytes_view{scope.data(), scope.size()});
    } else if constexpr (std::is_same_v<T, bson::MinKey>) {
      return w.write_min_key();
    } else if constexpr (std::is_same_v<T, bson::MaxKey>) {
      return w.write_max_key();
    } else if constexpr (std::is_same_v<T, bson::Undefined>) {
      return w.write_undefined();
    } else {
      static_assert(std::is_same_v<T, bson::Null>, "unsupported primitive type");
      return w.write_null();
    }
  }

  std::error_code decode(const DecodeContext&, const bson::ValueReader& r, T& v) const override {
    if (r.is_null()) {
      v = T{};
      return {};
    }
    bson::Value tmp;
    auto ec = r.read_value(tmp);
    if (ec) {
      return ec;
    }
    if (auto* p = tmp.get_if<T>()) {
      v = std::move(*p);
      return {};
    }
    return make_error_code(errc::incompatible_type);
  }
};

// 内置钩子接口对应的 Codec（单向：Marshaler 只编码，Unmarshaler 只解码）。

class MarshalerCodec final : public InterfaceCodec<Marshaler> {
 public:
  [[nodiscard]] bool supports(Direction dir) const noexcept override { return dir == Direction::encode; }

 protected:
  std::error_code encode(const EncodeContext& ctx, bson::ValueWriter& w, const Marshaler& v) const override;
};

class UnmarshalerCodec final : public InterfaceCodec<Unmarshaler> {
 public:
  [[nodiscard]] bool supports(Direction dir) const noexcept override { return dir == Direction::decode; }

 protected:
  std::error_code decode(const DecodeContext& ctx, const bson::ValueReader& r, Unmarshaler& v, ValueRef whole) const override;
};

class ValueMarshalerCodec final : public InterfaceCodec<ValueMarshaler> {
 public:
  [[nodiscard]] bool supports(Direction dir) const noexcept override { return dir == Direction::encode; }

 protected:
  std::error_code encode(const EncodeContext& ctx, bson::ValueWriter& w, const ValueMarshaler& v) const override;
};

class ValueUnmarshalerCodec final : public InterfaceCodec<ValueUnmarshaler> {
 public:
  [[nodiscard]] bool supports(Direction dir) const noexcept override { return dir == Direction::decode; }

 protected:
  std::error_code decode(const DecodeContext& ctx, const bson::ValueReader& r, ValueUnmarshaler& v, ValueRef whole)
    const override;
};

/**
 * @brief 把全部默认 Codec 注册到 builder（new_registry_builder() 使用它）。
 */
void register_default_codecs(RegistryBuilder& builder);

}  // namespace bsonc::codec
