#pragma once

#include "bsonc/codec/codec.hpp"
#include "bsonc/codec/map_codec.hpp"
#include "bsonc/codec/struct_codec.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bsonc::codec {

/**
 * @brief 能力（接口注册表的 key）：一个名字 + 一个针对类型描述的判定。
 */
class Capability {
 public:
  virtual ~Capability() = default;
  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
  [[nodiscard]] virtual bool satisfied_by(const reflect::Type& t) const = 0;
};

using CapabilityPtr = std::shared_ptr<const Capability>;

namespace detail {

class InterfaceCapability final : public Capability {
 public:
  explicit InterfaceCapability(std::type_index iface) : iface_(iface), name_(iface.name()) {}
  [[nodiscard]] std::string_view name() const noexcept override { return name_; }
  [[nodiscard]] bool satisfied_by(const reflect::Type& t) const override { return t.implements(iface_); }

 private:
  std::type_index iface_;
  std::string name_;
};

}  // namespace detail

// 类型继承了接口 I（内置钩子或 bson_interfaces 中声明的接口）。
template <class I>
CapabilityPtr interface_capability() {
  return std::make_shared<const detail::InterfaceCapability>(std::type_index(typeid(I)));
}

CapabilityPtr predicate_capability(std::string name, std::function<bool(const reflect::Type&)> pred);

/**
 * @brief 类型注册表：精确类型 -> Codec，以及按 Kind 的默认 Codec。
 */
class TypeRegistry final {
 public:
  void register_type(reflect::TypeKey key, CodecPtr codec);
  void register_kind(reflect::Kind kind, CodecPtr codec);

  // 先精确类型，再按 Kind 回退；都没有返回 nullptr。
  [[nodiscard]] const ValueCodec* lookup(const reflect::Type& t) const noexcept;
  [[nodiscard]] const ValueCodec* lookup(const reflect::Type& t, Direction dir) const noexcept;
  [[nodiscard]] CodecPtr kind_codec(reflect::Kind kind) const;

  [[nodiscard]] std::size_t type_count() const noexcept { return types_.size(); }
  [[nodiscard]] std::size_t kind_count() const noexcept { return kinds_.size(); }

 private:
  std::unordered_map<reflect::TypeKey, CodecPtr> types_;
  std::map<reflect::Kind, CodecPtr> kinds_;
};

/**
 * @brief 接口注册表：按注册顺序排列的 (Capability, Codec) 列表。
 *
 * 每处理一个值都会按顺序测试全部能力，注册的能力应尽量少。
 */
class InterfaceRegistry final {
 public:
  void register_interface(CapabilityPtr capability, CodecPtr codec);

  [[nodiscard]] const ValueCodec* resolve(const reflect::Type& t) const;
  [[nodiscard]] const ValueCodec* resolve(const reflect::Type& t, Direction dir) const;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

 private:
  std::vector<std::pair<CapabilityPtr, CodecPtr>> entries_;
};

/**
 * @brief 组合注册表：构建完成后只读，可被多个线程同时用于编解码。
 *
 * 查找顺序：
 * 1. 接口注册表（注册顺序，第一个满足的能力）；
 * 2. 类型注册表（精确类型，再按 Kind 回退，其中包括通用结构体/映射 Codec）；
 * 3. 都没有：errc::unregistered_type。
 */
class Registry final {
 public:
  Registry() = default;

  std::error_code lookup(const reflect::Type& t, const ValueCodec*& out) const;
  std::error_code lookup_encoder(const reflect::Type& t, const ValueCodec*& out) const;
  std::error_code lookup_decoder(const reflect::Type& t, const ValueCodec*& out) const;

  template <class T>
  std::error_code lookup(const ValueCodec*& out) const {
    return lookup(reflect::type_of<T>(), out);
  }

  [[nodiscard]] const TypeRegistry& types() const noexcept { return types_; }
  [[nodiscard]] const InterfaceRegistry& interfaces() const noexcept { return interfaces_; }

 private:
  friend class RegistryBuilder;

  std::error_code lookup_directed(const reflect::Type& t, Direction dir, const ValueCodec*& out) const;

  TypeRegistry types_;
  InterfaceRegistry interfaces_;
};

/**
 * @brief 注册表构建器：收集注册项，build() 一次性生成不可变的 Registry。
 *
 * 说明：
 * - 同一类型/Kind 重复注册时，后注册的覆盖先注册的；接口按注册顺序追加；
 * - register_struct<T>() 登记的结构体（及其可达结构体）在 build() 时预先计算描述，
 *   描述错误（tag_conflict）使 build() 失败；
 * - 只有上述结构体在 build() 时检查；未登记的结构体在每次编码/解码时按需描述，
 *   同样的描述错误会由那次 marshal/unmarshal 调用返回 tag_conflict；
 * - 注册空 Codec/Capability 在 build() 时返回 core::errc::invalid_argument。
 */
class RegistryBuilder final {
 public:
  RegistryBuilder() = default;

  RegistryBuilder& register_type(reflect::TypeKey key, CodecPtr codec);

  template <class T>
  RegistryBuilder& register_type(CodecPtr codec) {
    return register_type(reflect::TypeKey(typeid(T)), std::move(codec));
  }

  RegistryBuilder& register_kind(reflect::Kind kind, CodecPtr codec);
  RegistryBuilder& register_interface(CapabilityPtr capability, CodecPtr codec);
  RegistryBuilder& set_default_struct_codec(CodecPtr codec);
  RegistryBuilder& set_default_map_codec(CodecPtr codec);

  template <class T>
  RegistryBuilder& register_struct() {
    structs_.push_back(&reflect::type_of<T>());
    return *this;
  }

  std::error_code build(Registry& out) const;

 private:
  std::vector<std::pair<reflect::TypeKey, CodecPtr>> types_;
  std::vector<std::pair<reflect::Kind, CodecPtr>> kinds_;
  std::vector<std::pair<CapabilityPtr, CodecPtr>> interfaces_;
  std::vector<const reflect::Type*> structs_;
  bool invalid_{false};
};

/**
 * @brief 安装全部默认 Codec 的构建器：
 * - 标量/序列/指针/结构体/映射的 Kind 默认 Codec；
 * - bson::Value/Document/Array/Raw 与各元素类型、std::chrono::system_clock::time_point；
 * - 内置钩子接口（ValueMarshaler、ValueUnmarshaler、Marshaler、Unmarshaler）。
 */
RegistryBuilder new_registry_builder();

}  // namespace bsonc::codec
