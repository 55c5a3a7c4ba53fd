#pragma once

#include "bsonc/codec/interfaces.hpp"
#include "bsonc/core/error.hpp"

#include <charconv>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <tuple>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bsonc::reflect {

/**
 * @brief 运行期类型描述：为每个 C++ 类型提供一个不可变的 Type 对象。
 *
 * C++ 没有运行期反射，编解码所需的信息（字段列表、容器元素、指针指向、
 * 实现了哪些接口）由 type_of<T>() 在首次调用时按编译期特征生成，之后一直复用。
 *
 * 结构体需要声明自己的字段，两种方式任选其一：
 * @code
 * struct Person {
 *   std::string name;
 *   std::int64_t age{0};
 *   static std::vector<reflect::Field> bson_fields() {
 *     return {reflect::field("Name", &Person::name), reflect::field("Age", &Person::age, "age,minsize")};
 *   }
 * };
 *
 * // 或者（第三方类型）：
 * template <>
 * struct reflect::struct_fields<Point> {
 *   static std::vector<reflect::Field> get() { ... }
 * };
 * @endcode
 */

using TypeKey = std::type_index;

enum class Kind : std::uint8_t {
  boolean,
  int8,
  int16,
  int32,
  int64,
  uint8,
  uint16,
  uint32,
  uint64,
  float32,
  float64,
  string,
  sequence,
  map,
  structure,
  pointer,
  other,
};

[[nodiscard]] std::string_view to_string(Kind k) noexcept;
[[nodiscard]] bool is_signed_integer(Kind k) noexcept;
[[nodiscard]] bool is_unsigned_integer(Kind k) noexcept;
[[nodiscard]] bool is_float(Kind k) noexcept;

class Type;

template <class T>
const Type& type_of();

using TypeFn = const Type& (*)();

// 接口上转：把指向具体类型对象的指针转换为指向接口子对象的指针。
struct InterfaceEntry final {
  std::type_index iface;
  void* (*upcast)(void*);
  const void* (*const_upcast)(const void*);
};

class Type {
 public:
  virtual ~Type() = default;

  Type(const Type&) = delete;
  Type& operator=(const Type&) = delete;

  [[nodiscard]] TypeKey key() const noexcept { return key_; }
  [[nodiscard]] Kind kind() const noexcept { return kind_; }
  [[nodiscard]] std::string_view name() const noexcept { return name_; }

  // 是否为该类型的零值（不考虑 Zeroer 钩子）。
  [[nodiscard]] virtual bool is_zero(const void* p) const = 0;
  // 把对象重置为零值。
  virtual void reset(void* p) const = 0;

  [[nodiscard]] const std::vector<InterfaceEntry>& interfaces() const noexcept { return interfaces_; }
  [[nodiscard]] bool implements(std::type_index iface) const noexcept;

  template <class I>
  [[nodiscard]] bool implements() const noexcept {
    return implements(std::type_index(typeid(I)));
  }

  template <class I>
  [[nodiscard]] I* as(void* p) const noexcept {
    const auto* e = find_interface(std::type_index(typeid(I)));
    return e ? static_cast<I*>(e->upcast(p)) : nullptr;
  }

  template <class I>
  [[nodiscard]] const I* as(const void* p) const noexcept {
    const auto* e = find_interface(std::type_index(typeid(I)));
    return e ? static_cast<const I*>(e->const_upcast(p)) : nullptr;
  }

 protected:
  Type(TypeKey key, Kind kind, std::string name, std::vector<InterfaceEntry> interfaces);

 private:
  [[nodiscard]] const InterfaceEntry* find_interface(std::type_index iface) const noexcept;

  TypeKey key_;
  Kind kind_;
  std::string name_;
  std::vector<InterfaceEntry> interfaces_;
};

/**
 * @brief 对象引用：类型描述 + 对象地址。Codec 通过它访问任意类型的值。
 */
struct ValueRef final {
  const Type* type{nullptr};
  void* ptr{nullptr};
};

struct ConstValueRef final {
  const Type* type{nullptr};
  const void* ptr{nullptr};

  ConstValueRef() = default;
  ConstValueRef(const Type* t, const void* p) noexcept : type(t), ptr(p) {}
  ConstValueRef(ValueRef v) noexcept : type(v.type), ptr(v.ptr) {}
};

template <class T>
ValueRef make_ref(T& v) {
  return ValueRef{&type_of<T>(), static_cast<void*>(std::addressof(v))};
}

template <class T>
ConstValueRef make_ref(const T& v) {
  return ConstValueRef{&type_of<T>(), static_cast<const void*>(std::addressof(v))};
}

// ---------------------------------------------------------------------------
// 结构体字段
// ---------------------------------------------------------------------------

/**
 * @brief 结构体的一个字段：名字、标签文本、可见性、类型（惰性求值）与访问器。
 *
 * 字段类型以函数指针保存，直到第一次需要时才调用 type_of<M>()，
 * 因此自引用/互相引用的结构体（例如通过 std::unique_ptr 形成的链表）可以正常描述。
 */
class Field final {
 public:
  template <class C, class M>
  Field(std::string name, M C::*member, std::string tag, bool exported)
    : name_(std::move(name)),
      tag_(std::move(tag)),
      exported_(exported),
      type_(&type_of<M>),
      access_([member](void* obj) -> void* {
        return static_cast<void*>(std::addressof(static_cast<C*>(obj)->*member));
      }) {}

  [[nodiscard]] const std::string& name() const noexcept { return name_; }
  [[nodiscard]] const std::string& tag() const noexcept { return tag_; }
  // 不可访问的字段（hidden_field）：编解码时跳过。
  [[nodiscard]] bool exported() const noexcept { return exported_; }
  [[nodiscard]] const Type& type() const { return type_(); }

  [[nodiscard]] void* get(void* obj) const { return access_(obj); }
  [[nodiscard]] const void* get(const void* obj) const { return access_(const_cast<void*>(obj)); }

 private:
  std::string name_;
  std::string tag_;
  bool exported_{true};
  TypeFn type_;
  std::function<void*(void*)> access_;
};

template <class C, class M>
Field field(std::string name, M C::*member, std::string tag = {}) {
  return Field(std::move(name), member, std::move(tag), true);
}

template <class C, class M>
Field hidden_field(std::string name, M C::*member, std::string tag = {}) {
  return Field(std::move(name), member, std::move(tag), false);
}

// 第三方结构体的字段声明入口：特化并提供 static std::vector<Field> get()。
template <class T>
struct struct_fields {};

// ---------------------------------------------------------------------------
// 各类 Type
// ---------------------------------------------------------------------------

// bool / string / 其它不可再分的类型。
class ScalarType : public Type {
 public:
  using Type::Type;
};

/**
 * @brief 整数与浮点：统一以 int64/uint64/double 读写，Codec 不需要知道具体宽度。
 */
class NumericType : public Type {
 public:
  [[nodiscard]] virtual std::int64_t load_signed(const void* p) const noexcept = 0;
  [[nodiscard]] virtual std::uint64_t load_unsigned(const void* p) const noexcept = 0;
  [[nodiscard]] virtual double load_float(const void* p) const noexcept = 0;

  // 以下 store_* 不做范围检查，由调用方（Codec）先检查。
  virtual void store_signed(void* p, std::int64_t v) const noexcept = 0;
  virtual void store_unsigned(void* p, std::uint64_t v) const noexcept = 0;
  virtual void store_float(void* p, double v) const noexcept = 0;

  // 目标类型的取值范围。
  [[nodiscard]] virtual std::int64_t min_signed() const noexcept = 0;
  [[nodiscard]] virtual std::uint64_t max_unsigned() const noexcept = 0;

 protected:
  using Type::Type;
};

class StructType : public Type {
 public:
  [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }
  [[nodiscard]] bool is_zero(const void* p) const override;

 protected:
  StructType(TypeKey key, std::string name, std::vector<InterfaceEntry> interfaces, std::vector<Field> fields);

 private:
  std::vector<Field> fields_;
};

class SequenceType : public Type {
 public:
  [[nodiscard]] const Type& element() const { return element_(); }
  // std::vector<std::uint8_t>：按 binary 编码。
  [[nodiscard]] bool is_bytes() const noexcept { return is_bytes_; }

  [[nodiscard]] virtual std::size_t size(const void* p) const noexcept = 0;
  [[nodiscard]] virtual const void* at(const void* p, std::size_t i) const noexcept = 0;
  // 追加一个零值元素并返回其地址。
  virtual void* emplace_back(void* p) const = 0;
  // 仅 is_bytes() 时可用：连续字节视图/整体赋值。
  [[nodiscard]] virtual bson::bytes_view bytes(const void* p) const noexcept = 0;
  virtual void assign_bytes(void* p, bson::bytes_view data) const = 0;

 protected:
  SequenceType(TypeKey key, std::string name, std::vector<InterfaceEntry> interfaces, TypeFn element, bool is_bytes);

 private:
  TypeFn element_;
  bool is_bytes_{false};
};

/**
 * @brief 关联容器：key 统一以文本形式访问（整数 key 使用十进制文本）。
 */
class MapType : public Type {
 public:
  using visit_fn = std::function<std::error_code(std::string_view key, const void* value)>;

  [[nodiscard]] const Type& value() const { return value_(); }
  // key 是否为字符串或整数；其它 key 类型无法作为文档 key。
  [[nodiscard]] bool key_supported() const noexcept { return key_supported_; }
  [[nodiscard]] bool key_is_string() const noexcept { return key_is_string_; }

  [[nodiscard]] virtual std::size_t size(const void* p) const noexcept = 0;
  virtual void clear(void* p) const = 0;
  // 按容器自身顺序遍历；visit 返回错误时立即停止并返回该错误。
  virtual std::error_code for_each(const void* p, const visit_fn& visit) const = 0;
  // 取得（必要时插入零值）key 对应的值；key 文本无法转换时返回 core::errc::invalid_argument。
  virtual std::error_code slot(void* p, std::string_view key, void*& out) const = 0;

 protected:
  MapType(TypeKey key, std::string name, std::vector<InterfaceEntry> interfaces, TypeFn value, bool key_supported, bool key_is_string);

 private:
  TypeFn value_;
  bool key_supported_{false};
  bool key_is_string_{false};
};

// std::optional / std::unique_ptr / std::shared_ptr。
class PointerType : public Type {
 public:
  [[nodiscard]] const Type& pointee() const { return pointee_(); }

  // 为空时返回 nullptr。
  [[nodiscard]] virtual const void* get(const void* p) const noexcept = 0;
  // 为空时先构造一个零值对象，返回其地址。
  virtual void* ensure(void* p) const = 0;

 protected:
  PointerType(TypeKey key, std::string name, std::vector<InterfaceEntry> interfaces, TypeFn pointee);

 private:
  TypeFn pointee_;
};

// ---------------------------------------------------------------------------
// 编译期分类
// ---------------------------------------------------------------------------

namespace detail {

template <class T>
concept HasMemberFields = requires {
  { T::bson_fields() } -> std::convertible_to<std::vector<Field>>;
};

template <class T>
concept HasTraitFields = requires {
  { struct_fields<T>::get() } -> std::convertible_to<std::vector<Field>>;
};

template <class T>
concept HasDeclaredInterfaces = requires { typename T::bson_interfaces; };

template <class T>
struct is_vector : std::false_type {};
template <class E, class A>
struct is_vector<std::vector<E, A>> : std::bool_constant<!std::is_same_v<E, bool>> {};

template <class T>
struct is_map : std::false_type {};
template <class K, class V, class C, class A>
struct is_map<std::map<K, V, C, A>> : std::true_type {};
template <class K, class V, class H, class E, class A>
struct is_map<std::unordered_map<K, V, H, E, A>> : std::true_type {};

template <class T>
struct is_pointer_like : std::false_type {};
template <class P>
struct is_pointer_like<std::optional<P>> : std::true_type {};
template <class P, class D>
struct is_pointer_like<std::unique_ptr<P, D>> : std::true_type {};
template <class P>
struct is_pointer_like<std::shared_ptr<P>> : std::true_type {};

template <class T>
constexpr Kind kind_of() {
  if constexpr (std::is_same_v<T, bool>) {
    return Kind::boolean;
  } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
    if constexpr (sizeof(T) == 1) {
      return Kind::int8;
    } else if constexpr (sizeof(T) == 2) {
      return Kind::int16;
    } else if constexpr (sizeof(T) == 4) {
      return Kind::int32;
    } else {
      return Kind::int64;
    }
  } else if constexpr (std::is_integral_v<T>) {
    if constexpr (sizeof(T) == 1) {
      return Kind::uint8;
    } else if constexpr (sizeof(T) == 2) {
      return Kind::uint16;
    } else if constexpr (sizeof(T) == 4) {
      return Kind::uint32;
    } else {
      return Kind::uint64;
    }
  } else if constexpr (std::is_same_v<T, float>) {
    return Kind::float32;
  } else if constexpr (std::is_same_v<T, double>) {
    return Kind::float64;
  } else if constexpr (std::is_same_v<T, std::string>) {
    return Kind::string;
  } else if constexpr (is_vector<T>::value) {
    return Kind::sequence;
  } else if constexpr (is_map<T>::value) {
    return Kind::map;
  } else if constexpr (is_pointer_like<T>::value) {
    return Kind::pointer;
  } else if constexpr (HasMemberFields<T> || HasTraitFields<T>) {
    return Kind::structure;
  } else {
    return Kind::other;
  }
}

template <class T, class I>
InterfaceEntry make_interface_entry() {
  return InterfaceEntry{
    std::type_index(typeid(I)),
    [](void* p) -> void* { return static_cast<void*>(static_cast<I*>(static_cast<T*>(p))); },
    [](const void* p) -> const void* {
      return static_cast<const void*>(static_cast<const I*>(static_cast<const T*>(p)));
    },
  };
}

template <class T, class I>
void add_if_base(std::vector<InterfaceEntry>& out) {
  if constexpr (std::is_base_of_v<I, T>) {
    for (const auto& e : out) {
      if (e.iface == std::type_index(typeid(I))) {
        return;
      }
    }
    out.push_back(make_interface_entry<T, I>());
  }
}

template <class T, class Tuple>
struct declared_interfaces;

template <class T, class... Is>
struct declared_interfaces<T, std::tuple<Is...>> {
  static void add(std::vector<InterfaceEntry>& out) { (add_if_base<T, Is>(out), ...); }
};

template <class T>
std::vector<InterfaceEntry> interfaces_of() {
  std::vector<InterfaceEntry> out;
  if constexpr (std::is_class_v<T>) {
    add_if_base<T, codec::Marshaler>(out);
    add_if_base<T, codec::Unmarshaler>(out);
    add_if_base<T, codec::ValueMarshaler>(out);
    add_if_base<T, codec::ValueUnmarshaler>(out);
    add_if_base<T, codec::Zeroer>(out);
    if constexpr (HasDeclaredInterfaces<T>) {
      declared_interfaces<T, typename T::bson_interfaces>::add(out);
    }
  }
  return out;
}

template <class T>
void reset_value(void* p) {
  if constexpr (std::is_default_constructible_v<T> && std::is_move_assignable_v<T>) {
    *static_cast<T*>(p) = T{};
  }
}

template <class T>
bool equals_zero(const void* p) {
  if constexpr (std::is_default_constructible_v<T> && std::equality_comparable<T>) {
    return *static_cast<const T*>(p) == T{};
  } else {
    return false;
  }
}

template <class T>
class ScalarTypeImpl final : public ScalarType {
 public:
  ScalarTypeImpl() : ScalarType(TypeKey(typeid(T)), kind_of<T>(), typeid(T).name(), interfaces_of<T>()) {}

  [[nodiscard]] bool is_zero(const void* p) const override { return equals_zero<T>(p); }
  void reset(void* p) const override { reset_value<T>(p); }
};

template <class T>
class NumericTypeImpl final : public NumericType {
 public:
  NumericTypeImpl() : NumericType(TypeKey(typeid(T)), kind_of<T>(), typeid(T).name(), {}) {}

  [[nodiscard]] bool is_zero(const void* p) const override { return *static_cast<const T*>(p) == T{}; }
  void reset(void* p) const override { *static_cast<T*>(p) = T{}; }

  [[nodiscard]] std::int64_t load_signed(const void* p) const noexcept override {
    return static_cast<std::int64_t>(*static_cast<const T*>(p));
  }
  [[nodiscard]] std::uint64_t load_unsigned(const void* p) const noexcept override {
    return static_cast<std::uint64_t>(*static_cast<const T*>(p));
  }
  [[nodiscard]] double load_float(const void* p) const noexcept override {
    return static_cast<double>(*static_cast<const T*>(p));
  }
  void store_signed(void* p, std::int64_t v) const noexcept override { *static_cast<T*>(p) = static_cast<T>(v); }
  void store_unsigned(void* p, std::uint64_t v) const noexcept override { *static_cast<T*>(p) = static_cast<T>(v); }
  void store_float(void* p, double v) const noexcept override { *static_cast<T*>(p) = static_cast<T>(v); }

  [[nodiscard]] std::int64_t min_signed() const noexcept override {
    if constexpr (std::is_integral_v<T>) {
      return static_cast<std::int64_t>(std::numeric_limits<T>::min());
    } else {
      return std::numeric_limits<std::int64_t>::min();
    }
  }
  [[nodiscard]] std::uint64_t max_unsigned() const noexcept override {
    if constexpr (std::is_integral_v<T>) {
      return static_cast<std::uint64_t>(std::numeric_limits<T>::max());
    } else {
      return std::numeric_limits<std::uint64_t>::max();
    }
  }
};

template <class T>
std::vector<Field> fields_of() {
  if constexpr (HasMemberFields<T>) {
    return T::bson_fields();
  } else {
    return struct_fields<T>::get();
  }
}

template <class T>
class StructTypeImpl final : public StructType {
 public:
  StructTypeImpl() : StructType(TypeKey(typeid(T)), typeid(T).name(), interfaces_of<T>(), fields_of<T>()) {}

  [[nodiscard]] bool is_zero(const void* p) const override {
    if constexpr (std::is_default_constructible_v<T> && std::equality_comparable<T>) {
      return equals_zero<T>(p);
    } else {
      return StructType::is_zero(p);
    }
  }
  void reset(void* p) const override { reset_value<T>(p); }
};

template <class T>
class SequenceTypeImpl final : public SequenceType {
 public:
  using element_type = typename T::value_type;

  SequenceTypeImpl()
    : SequenceType(
        TypeKey(typeid(T)),
        typeid(T).name(),
        interfaces_of<T>(),
        &type_of<element_type>,
        std::is_same_v<element_type, std::uint8_t>) {}

  [[nodiscard]] bool is_zero(const void* p) const override { return static_cast<const T*>(p)->empty(); }
  void reset(void* p) const override { static_cast<T*>(p)->clear(); }

  [[nodiscard]] std::size_t size(const void* p) const noexcept override { return static_cast<const T*>(p)->size(); }
  [[nodiscard]] const void* at(const void* p, std::size_t i) const noexcept override {
    return static_cast<const void*>(std::addressof((*static_cast<const T*>(p))[i]));
  }
  void* emplace_back(void* p) const override {
    return static_cast<void*>(std::addressof(static_cast<T*>(p)->emplace_back()));
  }
  [[nodiscard]] bson::bytes_view bytes(const void* p) const noexcept override {
    if constexpr (std::is_same_v<element_type, std::uint8_t>) {
      const auto& v = *static_cast<const T*>(p);
      return bson::bytes_view{v.data(), v.size()};
    } else {
      return {};
    }
  }
  void assign_bytes(void* p, bson::bytes_view data) const override {
    if constexpr (std::is_same_v<element_type, std::uint8_t>) {
      static_cast<T*>(p)->assign(data.begin(), data.end());
    }
  }
};

template <class K>
constexpr bool is_supported_key_v = std::is_same_v<K, std::string> || (std::is_integral_v<K> && !std::is_same_v<K, bool>);

template <class T>
class MapTypeImpl final : public MapType {
 public:
  using key_type = typename T::key_type;
  using mapped_type = typename T::mapped_type;

  MapTypeImpl()
    : MapType(
        TypeKey(typeid(T)),
        typeid(T).name(),
        interfaces_of<T>(),
        &type_of<mapped_type>,
        is_supported_key_v<key_type>,
        std::is_same_v<key_type, std::string>) {}

  [[nodiscard]] bool is_zero(const void* p) const override { return static_cast<const T*>(p)->empty(); }
  void reset(void* p) const override { static_cast<T*>(p)->clear(); }

  [[nodiscard]] std::size_t size(const void* p) const noexcept override { return static_cast<const T*>(p)->size(); }
  void clear(void* p) const override { static_cast<T*>(p)->clear(); }

  std::error_code for_each(const void* p, const visit_fn& visit) const override {
    for (const auto& [k, v] : *static_cast<const T*>(p)) {
      std::error_code ec;
      if constexpr (std::is_same_v<key_type, std::string>) {
        ec = visit(k, static_cast<const void*>(std::addressof(v)));
      } else if constexpr (is_supported_key_v<key_type>) {
        char buf[24];
        const auto res = std::to_chars(buf, buf + sizeof(buf), k);
        ec = visit(std::string_view(buf, static_cast<std::size_t>(res.ptr - buf)), static_cast<const void*>(std::addressof(v)));
      } else {
        return core::make_error_code(core::errc::invalid_argument);
      }
      if (ec) {
        return ec;
      }
    }
    return {};
  }

  std::error_code slot(void* p, std::string_view key, void*& out) const override {
    auto& m = *static_cast<T*>(p);
    if constexpr (std::is_same_v<key_type, std::string>) {
      out = static_cast<void*>(std::addressof(m[std::string(key)]));
      return {};
    } else if constexpr (is_supported_key_v<key_type>) {
      key_type k{};
      const auto* end = key.data() + key.size();
      const auto res = std::from_chars(key.data(), end, k);
      if (res.ec != std::errc{} || res.ptr != end) {
        return core::make_error_code(core::errc::invalid_argument);
      }
      out = static_cast<void*>(std::addressof(m[k]));
      return {};
    } else {
      return core::make_error_code(core::errc::invalid_argument);
    }
  }
};

template <class T>
class PointerTypeImpl final : public PointerType {
 public:
  using pointee_type = std::remove_cvref_t<decltype(*std::declval<T&>())>;

  PointerTypeImpl() : PointerType(TypeKey(typeid(T)), typeid(T).name(), interfaces_of<T>(), &type_of<pointee_type>) {}

  [[nodiscard]] bool is_zero(const void* p) const override { return !static_cast<bool>(*static_cast<const T*>(p)); }
  void reset(void* p) const override { static_cast<T*>(p)->reset(); }

  [[nodiscard]] const void* get(const void* p) const noexcept override {
    const auto& v = *static_cast<const T*>(p);
    if (!v) {
      return nullptr;
    }
    return static_cast<const void*>(std::addressof(*v));
  }

  void* ensure(void* p) const override {
    auto& v = *static_cast<T*>(p);
    if (!v) {
      if constexpr (is_optional<T>::value) {
        v.emplace();
      } else if constexpr (is_shared<T>::value) {
        v = std::make_shared<pointee_type>();
      } else if constexpr (is_default_unique<T>::value) {
        v = std::make_unique<pointee_type>();
      } else {
        // 自定义删除器的 unique_ptr：按删除器约定用 new 分配
        v = T(new pointee_type());
      }
    }
    return static_cast<void*>(std::addressof(*v));
  }

 private:
  template <class U>
  struct is_optional : std::false_type {};
  template <class U>
  struct is_optional<std::optional<U>> : std::true_type {};
  template <class U>
  struct is_shared : std::false_type {};
  template <class U>
  struct is_shared<std::shared_ptr<U>> : std::true_type {};
  template <class U>
  struct is_default_unique : std::false_type {};
  template <class U>
  struct is_default_unique<std::unique_ptr<U, std::default_delete<U>>> : std::true_type {};
};

template <class T>
const Type& make_type() {
  constexpr Kind kind = kind_of<T>();
  if constexpr (kind == Kind::structure) {
    static const StructTypeImpl<T> instance;
    return instance;
  } else if constexpr (kind == Kind::sequence) {
    static const SequenceTypeImpl<T> instance;
    return instance;
  } else if constexpr (kind == Kind::map) {
    static const MapTypeImpl<T> instance;
    return instance;
  } else if constexpr (kind == Kind::pointer) {
    static const PointerTypeImpl<T> instance;
    return instance;
  } else if constexpr (kind == Kind::boolean || kind == Kind::string || kind == Kind::other) {
    static const ScalarTypeImpl<T> instance;
    return instance;
  } else {
    static const NumericTypeImpl<T> instance;
    return instance;
  }
}

}  // namespace detail

/**
 * @brief 取得 T 的类型描述（线程安全的惰性初始化，之后返回同一对象）。
 *
 * cv 限定会被去掉：const T 与 T 共享同一描述。
 */
template <class T>
const Type& type_of() {
  return detail::make_type<std::remove_cv_t<T>>();
}

}  // namespace bsonc::reflect
