#pragma once

#include "bsonc/bson/types.hpp"

#include <system_error>
#include <vector>

namespace bsonc::codec {

/**
 * @brief 内置钩子接口：类型继承它们即可接管自身的编解码。
 *
 * 说明：
 * - reflect::type_of<T>() 会自动识别 T 继承了哪些钩子接口；
 * - new_registry_builder() 把这些接口对应的 Codec 注册到接口注册表，
 *   因此它们优先于按具体类型注册的 Codec；
 * - 编码/解码方向相互独立：只实现 Marshaler 的类型，解码仍走普通的类型查找。
 */

// 把自身编码为一篇完整文档（含长度前缀与结尾 0x00），追加到 out。
class Marshaler {
 public:
  virtual ~Marshaler() = default;
  virtual std::error_code marshal_bson(std::vector<bson::byte>& out) const = 0;
};

// 从一篇完整文档解码自身。
class Unmarshaler {
 public:
  virtual ~Unmarshaler() = default;
  virtual std::error_code unmarshal_bson(bson::bytes_view doc) = 0;
};

// 把自身编码为任意类型的单个值：type 为元素类型，payload 为不含类型字节与 key 的值字节。
class ValueMarshaler {
 public:
  virtual ~ValueMarshaler() = default;
  virtual std::error_code marshal_bson_value(bson::element_type& type, std::vector<bson::byte>& payload) const = 0;
};

class ValueUnmarshaler {
 public:
  virtual ~ValueUnmarshaler() = default;
  virtual std::error_code unmarshal_bson_value(bson::element_type type, bson::bytes_view payload) = 0;
};

// omitempty 判定：实现该接口的类型自行决定“是否为空值”。
class Zeroer {
 public:
  virtual ~Zeroer() = default;
  [[nodiscard]] virtual bool is_zero() const = 0;
};

}  // namespace bsonc::codec
