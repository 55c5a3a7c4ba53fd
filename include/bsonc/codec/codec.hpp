#pragma once

#include "bsonc/bson/reader.hpp"
#include "bsonc/bson/writer.hpp"
#include "bsonc/codec/error.hpp"
#include "bsonc/reflect/type.hpp"

#include <cstdint>
#include <memory>
#include <system_error>
#include <typeinfo>

namespace bsonc::codec {

class Registry;

using reflect::ConstValueRef;
using reflect::ValueRef;

enum class Direction : std::uint8_t {
  encode = 0,
  decode = 1,
};

/**
 * @brief 单次编码调用的上下文。
 *
 * min_size：整数优先使用 int32（值放得下时）；结构体字段的 minsize 标签会在字段级打开它。
 */
struct EncodeContext final {
  const Registry& registry;
  bool min_size{false};
};

/**
 * @brief 单次解码调用的上下文。
 *
 * - truncate：允许 double -> float / 带小数的 double -> 整数 的精度损失；
 * - strict：未知 key 返回 unknown_field，不可访问字段返回 field_access_denied；
 * - zero_structs：解码结构体前先把目标重置为零值。
 */
struct DecodeContext final {
  const Registry& registry;
  bool truncate{false};
  bool strict{false};
  bool zero_structs{false};
};

/**
 * @brief 值编解码器：一个类型（或一类类型）与线上元素之间的双向转换。
 *
 * 约定：
 * - Codec 在调用之间无状态，配置在构造时确定，可被多个线程同时使用；
 * - encode_value 写完后写游标恰好位于该值之后；decode_value 只读取 reader 覆盖的那个值；
 * - 嵌套值通过 ctx.registry 递归查找 Codec（见 encode_element/decode_element）；
 * - supports() 声明支持的方向；单向 Codec 不会遮蔽另一方向上的其它 Codec。
 */
class ValueCodec {
 public:
  virtual ~ValueCodec() = default;

  virtual std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const = 0;
  virtual std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const = 0;

  [[nodiscard]] virtual bool supports(Direction) const noexcept { return true; }
};

using CodecPtr = std::shared_ptr<const ValueCodec>;

/**
 * @brief 针对具体类型 T 的 Codec 基类：去掉 ValueRef 的类型擦除样板代码。
 */
template <class T>
class TypedCodec : public ValueCodec {
 public:
  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const final {
    if (v.type == nullptr || v.type->key() != reflect::TypeKey(typeid(T))) {
      return make_error_code(errc::incompatible_type);
    }
    return encode(ctx, w, *static_cast<const T*>(v.ptr));
  }

  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const final {
    if (v.type == nullptr || v.type->key() != reflect::TypeKey(typeid(T))) {
      return make_error_code(errc::incompatible_type);
    }
    return decode(ctx, r, *static_cast<T*>(v.ptr));
  }

 protected:
  virtual std::error_code encode(const EncodeContext& ctx, bson::ValueWriter& w, const T& v) const = 0;
  virtual std::error_code decode(const DecodeContext& ctx, const bson::ValueReader& r, T& v) const = 0;
};

/**
 * @brief 针对接口 I 的 Codec 基类：通过类型描述把对象上转为 I 后再处理。
 *
 * 只实现一个方向时，覆盖对应的 encode/decode 与 supports() 即可；
 * 未覆盖的方向返回 errc::unregistered_type。
 */
template <class I>
class InterfaceCodec : public ValueCodec {
 public:
  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const final {
    const I* p = v.type ? v.type->template as<I>(v.ptr) : nullptr;
    if (p == nullptr) {
      return make_error_code(errc::incompatible_type);
    }
    return encode(ctx, w, *p);
  }

  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const final {
    I* p = v.type ? v.type->template as<I>(v.ptr) : nullptr;
    if (p == nullptr) {
      return make_error_code(errc::incompatible_type);
    }
    return decode(ctx, r, *p, v);
  }

 protected:
  virtual std::error_code encode(const EncodeContext&, bson::ValueWriter&, const I&) const {
    return make_error_code(errc::unregistered_type);
  }
  // whole 为完整目标对象（例如解码 null 时需要把整个对象重置为零值）。
  virtual std::error_code decode(const DecodeContext&, const bson::ValueReader&, I&, ValueRef /*whole*/) const {
    return make_error_code(errc::unregistered_type);
  }
};

/**
 * @brief 通过注册表查找 v.type 的编码 Codec 并编码（Codec 递归处理嵌套值的入口）。
 */
std::error_code encode_element(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v);
std::error_code decode_element(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v);

}  // namespace bsonc::codec
