#include "bsonc/reflect/type.hpp"

namespace bsonc::reflect {

std::string_view to_string(Kind k) noexcept {
  switch (k) {
    case Kind::boolean:
      return "bool";
    case Kind::int8:
      return "int8";
    case Kind::int16:
      return "int16";
    case Kind::int32:
      return "int32";
    case Kind::int64:
      return "int64";
    case Kind::uint8:
      return "uint8";
    case Kind::uint16:
      return "uint16";
    case Kind::uint32:
      return "uint32";
    case Kind::uint64:
      return "uint64";
    case Kind::float32:
      return "float32";
    case Kind::float64:
      return "float64";
    case Kind::string:
      return "string";
    case Kind::sequence:
      return "sequence";
    case Kind::map:
      return "map";
    case Kind::structure:
      return "struct";
    case Kind::pointer:
      return "pointer";
    case Kind::other:
      return "other";
  }
  return "unknown";
}

bool is_signed_integer(Kind k) noexcept {
  return k == Kind::int8 || k == Kind::int16 || k == Kind::int32 || k == Kind::int64;
}

bool is_unsigned_integer(Kind k) noexcept {
  return k == Kind::uint8 || k == Kind::uint16 || k == Kind::uint32 || k == Kind::uint64;
}

bool is_float(Kind k) noexcept { return k == Kind::float32 || k == Kind::float64; }

// Type

Type::Type(TypeKey key, Kind kind, std::string name, std::vector<InterfaceEntry> interfaces)
  : key_(key), kind_(kind), name_(std::move(name)), interfaces_(std::move(interfaces)) {}

const InterfaceEntry* Type::find_interface(std::type_index iface) const noexcept {
  for (const auto& e : interfaces_) {
    if (e.iface == iface) {
      return &e;
    }
  }
  return nullptr;
}

bool Type::implements(std::type_index iface) const noexcept { return find_interface(iface) != nullptr; }

// StructType

StructType::StructType(TypeKey key, std::string name, std::vector<InterfaceEntry> interfaces, std::vector<Field> fields)
  : Type(key, Kind::structure, std::move(name), std::move(interfaces)), fields_(std::move(fields)) {}

bool StructType::is_zero(const void* p) const {
  // 没有 operator== 的结构体：所有字段都是零值才算零值。
  for (const auto& f : fields_) {
    if (!f.type().is_zero(f.get(p))) {
      return false;
    }
  }
  return true;
}

SequenceType::SequenceType(TypeKey key, std::string name, std::vector<InterfaceEntry> interfaces, TypeFn element, bool is_bytes)
  : Type(key, Kind::sequence, std::move(name), std::move(interfaces)), element_(element), is_bytes_(is_bytes) {}

MapType::MapType(
  TypeKey key,
  std::string name,
  std::vector<InterfaceEntry> interfaces,
  TypeFn value,
  bool key_supported,
  bool key_is_string)
  : Type(key, Kind::map, std::move(name), std::move(interfaces)),
    value_(value),
    key_supported_(key_supported),
    key_is_string_(key_is_string) {}

PointerType::PointerType(TypeKey key, std::string name, std::vector<InterfaceEntry> interfaces, TypeFn pointee)
  : Type(key, Kind::pointer, std::move(name), std::move(interfaces)), pointee_(pointee) {}

}  // namespace bsonc::reflect
