#include "bsonc/codec/registry.hpp"

#include "bsonc/core/error.hpp"

#include <spdlog/spdlog.h>

namespace bsonc::codec {
namespace {

class PredicateCapability final : public Capability {
 public:
  PredicateCapability(std::string name, std::function<bool(const reflect::Type&)> pred)
    : name_(std::move(name)), pred_(std::move(pred)) {}

  [[nodiscard]] std::string_view name() const noexcept override { return name_; }
  [[nodiscard]] bool satisfied_by(const reflect::Type& t) const override { return pred_(t); }

 private:
  std::string name_;
  std::function<bool(const reflect::Type&)> pred_;
};

}  // namespace

CapabilityPtr predicate_capability(std::string name, std::function<bool(const reflect::Type&)> pred) {
  if (!pred) {
    return nullptr;
  }
  return std::make_shared<const PredicateCapability>(std::move(name), std::move(pred));
}

// TypeRegistry

void TypeRegistry::register_type(reflect::TypeKey key, CodecPtr codec) { types_.insert_or_assign(key, std::move(codec)); }

void TypeRegistry::register_kind(reflect::Kind kind, CodecPtr codec) { kinds_.insert_or_assign(kind, std::move(codec)); }

const ValueCodec* TypeRegistry::lookup(const reflect::Type& t) const noexcept {
  if (auto it = types_.find(t.key()); it != types_.end()) {
    return it->second.get();
  }
  if (auto it = kinds_.find(t.kind()); it != kinds_.end()) {
    return it->second.get();
  }
  return nullptr;
}

const ValueCodec* TypeRegistry::lookup(const reflect::Type& t, Direction dir) const noexcept {
  if (auto it = types_.find(t.key()); it != types_.end() && it->second->supports(dir)) {
    return it->second.get();
  }
  if (auto it = kinds_.find(t.kind()); it != kinds_.end() && it->second->supports(dir)) {
    return it->second.get();
  }
  return nullptr;
}

CodecPtr TypeRegistry::kind_codec(reflect::Kind kind) const {
  if (auto it = kinds_.find(kind); it != kinds_.end()) {
    return it->second;
  }
  return nullptr;
}

// InterfaceRegistry

void InterfaceRegistry::register_interface(CapabilityPtr capability, CodecPtr codec) {
  entries_.emplace_back(std::move(capability), std::move(codec));
}

const ValueCodec* InterfaceRegistry::resolve(const reflect::Type& t) const {
  for (const auto& [cap, codec] : entries_) {
    if (cap->satisfied_by(t)) {
      return codec.get();
    }
  }
  return nullptr;
}

const ValueCodec* InterfaceRegistry::resolve(const reflect::Type& t, Direction dir) const {
  for (const auto& [cap, codec] : entries_) {
    if (codec->supports(dir) && cap->satisfied_by(t)) {
      return codec.get();
    }
  }
  return nullptr;
}

// Registry

std::error_code Registry::lookup(const reflect::Type& t, const ValueCodec*& out) const {
  out = interfaces_.resolve(t);
  if (out == nullptr) {
    out = types_.lookup(t);
  }
  if (out == nullptr) {
    spdlog::debug("bsonc: no codec registered for {} (kind {})", t.name(), reflect::to_string(t.kind()));
    return make_error_code(errc::unregistered_type);
  }
  return {};
}

std::error_code Registry::lookup_directed(const reflect::Type& t, Direction dir, const ValueCodec*& out) const {
  out = interfaces_.resolve(t, dir);
  if (out == nullptr) {
    out = types_.lookup(t, dir);
  }
  if (out == nullptr) {
    spdlog::debug(
      "bsonc: no {} codec registered for {} (kind {})",
      dir == Direction::encode ? "encode" : "decode",
      t.name(),
      reflect::to_string(t.kind()));
    return make_error_code(errc::unregistered_type);
  }
  return {};
}

std::error_code Registry::lookup_encoder(const reflect::Type& t, const ValueCodec*& out) const {
  return lookup_directed(t, Direction::encode, out);
}

std::error_code Registry::lookup_decoder(const reflect::Type& t, const ValueCodec*& out) const {
  return lookup_directed(t, Direction::decode, out);
}

std::error_code encode_element(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) {
  if (v.type == nullptr) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  const ValueCodec* codec = nullptr;
  auto ec = ctx.registry.lookup_encoder(*v.type, codec);
  if (ec) {
    return ec;
  }
  return codec->encode_value(ctx, w, v);
}

std::error_code decode_element(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) {
  if (v.type == nullptr) {
    return core::make_error_code(core::errc::invalid_argument);
  }
  const ValueCodec* codec = nullptr;
  auto ec = ctx.registry.lookup_decoder(*v.type, codec);
  if (ec) {
    return ec;
  }
  return codec->decode_value(ctx, r, v);
}

// RegistryBuilder

RegistryBuilder& RegistryBuilder::register_type(reflect::TypeKey key, CodecPtr codec) {
  if (!codec) {
    invalid_ = true;
    return *this;
  }
  types_.emplace_back(key, std::move(codec));
  return *this;
}

RegistryBuilder& RegistryBuilder::register_kind(reflect::Kind kind, CodecPtr codec) {
  if (!codec) {
    invalid_ = true;
    return *this;
  }
  kinds_.emplace_back(kind, std::move(codec));
  return *this;
}

RegistryBuilder& RegistryBuilder::register_interface(CapabilityPtr capability, CodecPtr codec) {
  if (!capability || !codec) {
    invalid_ = true;
    return *this;
  }
  interfaces_.emplace_back(std::move(capability), std::move(codec));
  return *this;
}

RegistryBuilder& RegistryBuilder::set_default_struct_codec(CodecPtr codec) {
  return register_kind(reflect::Kind::structure, std::move(codec));
}

RegistryBuilder& RegistryBuilder::set_default_map_codec(CodecPtr codec) {
  return register_kind(reflect::Kind::map, std::move(codec));
}

std::error_code RegistryBuilder::build(Registry& out) const {
  if (invalid_) {
    return core::make_error_code(core::errc::invalid_argument);
  }

  Registry r;
  for (const auto& [key, codec] : types_) {
    r.types_.register_type(key, codec);
  }
  for (const auto& [kind, codec] : kinds_) {
    r.types_.register_kind(kind, codec);
  }
  for (const auto& [cap, codec] : interfaces_) {
    r.interfaces_.register_interface(cap, codec);
  }

  // 结构体描述预计算：生成携带缓存的新 StructCodec 替换 structure 的默认 Codec。
  std::size_t precompiled = 0;
  if (!structs_.empty()) {
    const auto current = r.types_.kind_codec(reflect::Kind::structure);
    if (const auto sc = std::dynamic_pointer_cast<const StructCodec>(current)) {
      std::shared_ptr<const StructCodec> compiled;
      auto ec = sc->precompile(structs_, compiled);
      if (ec) {
        spdlog::debug("bsonc: registry build failed: {}", ec.message());
        return ec;
      }
      precompiled = compiled->precompiled_count();
      r.types_.register_kind(reflect::Kind::structure, std::move(compiled));
    } else {
      spdlog::debug("bsonc: default struct codec is not a StructCodec, {} struct types left undescribed", structs_.size());
    }
  }

  spdlog::debug(
    "bsonc: registry built: {} type codecs, {} kind codecs, {} interface codecs, {} precompiled structs",
    r.types_.type_count(),
    r.types_.kind_count(),
    r.interfaces_.size(),
    precompiled);
  out = std::move(r);
  return {};
}

}  // namespace bsonc::codec
