#include "bsonc/codec/struct_codec.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <unordered_set>
#include <utility>

namespace bsonc::codec {
namespace {

std::string fold(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::error_code tag_conflict(const reflect::StructType& t, std::string_view what, std::string_view key) {
  spdlog::debug("bsonc: tag conflict in {}: {} '{}'", t.name(), what, key);
  return make_error_code(errc::tag_conflict);
}

// 收集 t 可达的全部结构体类型（经过字段、序列元素、映射值、指针指向）。
void collect_structs(
  const reflect::Type& t,
  std::unordered_set<reflect::TypeKey>& seen,
  std::vector<const reflect::StructType*>& out) {
  if (!seen.insert(t.key()).second) {
    return;
  }
  switch (t.kind()) {
    case reflect::Kind::structure: {
      const auto& st = static_cast<const reflect::StructType&>(t);
      out.push_back(&st);
      for (const auto& f : st.fields()) {
        collect_structs(f.type(), seen, out);
      }
      break;
    }
    case reflect::Kind::sequence:
      collect_structs(static_cast<const reflect::SequenceType&>(t).element(), seen, out);
      break;
    case reflect::Kind::map:
      collect_structs(static_cast<const reflect::MapType&>(t).value(), seen, out);
      break;
    case reflect::Kind::pointer:
      collect_structs(static_cast<const reflect::PointerType&>(t).pointee(), seen, out);
      break;
    default:
      break;
  }
}

}  // namespace

bool is_empty_value(ConstValueRef v) {
  if (const auto* z = v.type->as<Zeroer>(v.ptr)) {
    return z->is_zero();
  }
  return v.type->is_zero(v.ptr);
}

void* FieldDescription::locate(void* obj) const {
  void* p = obj;
  for (const auto* f : path) {
    p = f->get(p);
  }
  return p;
}

const void* FieldDescription::locate(const void* obj) const {
  const void* p = obj;
  for (const auto* f : path) {
    p = f->get(p);
  }
  return p;
}

const FieldDescription* StructDescription::find(std::string_view key) const {
  if (auto it = by_key.find(key); it != by_key.end()) {
    return &fields[it->second];
  }
  if (auto it = by_folded_key.find(fold(key)); it != by_folded_key.end()) {
    return &fields[it->second];
  }
  return nullptr;
}

// StructCodec

StructCodec::StructCodec(std::shared_ptr<const StructTagParser> parser, StructCodecOptions options)
  : StructCodec(std::move(parser), options, std::make_shared<const Cache>()) {}

StructCodec::StructCodec(
  std::shared_ptr<const StructTagParser> parser,
  StructCodecOptions options,
  std::shared_ptr<const Cache> cache)
  : parser_(parser ? std::move(parser) : std::make_shared<const DefaultStructTagParser>()),
    options_(options),
    cache_(std::move(cache)) {}

bool StructCodec::is_precompiled(const reflect::Type& t) const noexcept { return cache_->count(t.key()) != 0; }

std::size_t StructCodec::precompiled_count() const noexcept { return cache_->size(); }

std::error_code StructCodec::describe(const reflect::StructType& t, std::shared_ptr<const StructDescription>& out) const {
  if (auto it = cache_->find(t.key()); it != cache_->end()) {
    out = it->second;
    return {};
  }
  return build_description(t, out);
}

std::error_code StructCodec::flatten(
  const reflect::StructType& t,
  const std::vector<const reflect::Field*>& prefix,
  StructDescription& out) const {
  for (const auto& f : t.fields()) {
    StructTags tags;
    auto ec = parser_->parse(f.name(), f.tag(), tags);
    if (ec) {
      return ec;
    }
    if (tags.skip) {
      continue;
    }
    if (!f.exported()) {
      out.hidden_keys.insert(tags.name);
      continue;
    }

    auto path = prefix;
    path.push_back(&f);
    const auto& ft = f.type();

    if (tags.inline_) {
      if (ft.kind() == reflect::Kind::structure) {
        if (path.size() > core::kMaxDocumentDepth) {
          return tag_conflict(t, "inline nesting too deep at", f.name());
        }
        ec = flatten(static_cast<const reflect::StructType&>(ft), path, out);
        if (ec) {
          return ec;
        }
        continue;
      }
      if (ft.kind() == reflect::Kind::map) {
        if (out.inline_map) {
          return tag_conflict(t, "more than one inline map, second is", f.name());
        }
        if (!static_cast<const reflect::MapType&>(ft).key_is_string()) {
          return tag_conflict(t, "inline map must have string keys", f.name());
        }
        FieldDescription m;
        m.key = tags.name;
        m.name = f.name();
        m.path = std::move(path);
        m.type = &ft;
        out.inline_map = std::move(m);
        continue;
      }
      return tag_conflict(t, "inline on a field that is not a struct or map", f.name());
    }

    FieldDescription d;
    d.key = tags.name;
    d.name = f.name();
    d.path = std::move(path);
    d.type = &ft;
    d.omit_empty = tags.omit_empty;
    d.min_size = tags.min_size;
    d.truncate = tags.truncate;
    out.fields.push_back(std::move(d));
  }
  return {};
}

std::error_code StructCodec::build_description(const reflect::StructType& t, std::shared_ptr<const StructDescription>& out) const {
  auto d = std::make_shared<StructDescription>();
  d->type = &t;
  auto ec = flatten(t, {}, *d);
  if (ec) {
    return ec;
  }

  // key 冲突检查：允许覆盖时保留路径更短（更外层）的字段。
  std::vector<bool> dropped(d->fields.size(), false);
  std::map<std::string, std::size_t, std::less<>> seen;
  for (std::size_t i = 0; i < d->fields.size(); ++i) {
    const auto& f = d->fields[i];
    auto [it, inserted] = seen.emplace(f.key, i);
    if (inserted) {
      continue;
    }
    const auto& prev = d->fields[it->second];
    if (!options_.overwrite_duplicated_inline_fields || prev.path.size() == f.path.size()) {
      return tag_conflict(t, "duplicated key", f.key);
    }
    if (f.path.size() < prev.path.size()) {
      dropped[it->second] = true;
      it->second = i;
    } else {
      dropped[i] = true;
    }
  }

  std::vector<FieldDescription> kept;
  kept.reserve(d->fields.size());
  for (std::size_t i = 0; i < d->fields.size(); ++i) {
    if (!dropped[i]) {
      kept.push_back(std::move(d->fields[i]));
    }
  }
  d->fields = std::move(kept);

  for (std::size_t i = 0; i < d->fields.size(); ++i) {
    d->by_key.emplace(d->fields[i].key, i);
    d->by_folded_key.emplace(fold(d->fields[i].key), i);
  }
  out = std::move(d);
  return {};
}

std::error_code StructCodec::precompile(std::span<const reflect::Type* const> roots, std::shared_ptr<const StructCodec>& out) const {
  std::unordered_set<reflect::TypeKey> seen;
  std::vector<const reflect::StructType*> structs;
  for (const auto* root : roots) {
    if (root != nullptr) {
      collect_structs(*root, seen, structs);
    }
  }

  auto cache = std::make_shared<Cache>(*cache_);
  for (const auto* st : structs) {
    if (cache->count(st->key()) != 0) {
      continue;
    }
    std::shared_ptr<const StructDescription> d;
    auto ec = build_description(*st, d);
    if (ec) {
      return ec;
    }
    cache->emplace(st->key(), std::move(d));
  }

  // 构造函数私有，make_shared 无法访问
  out = std::shared_ptr<const StructCodec>(new StructCodec(parser_, options_, std::move(cache)));
  return {};
}

std::error_code StructCodec::encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const {
  if (v.type == nullptr || v.type->kind() != reflect::Kind::structure) {
    return make_error_code(errc::incompatible_type);
  }
  std::shared_ptr<const StructDescription> desc;
  auto ec = describe(static_cast<const reflect::StructType&>(*v.type), desc);
  if (ec) {
    return ec;
  }

  ec = w.open_document();
  if (ec) {
    return ec;
  }
  auto& dw = w.writer();

  for (const auto& f : desc->fields) {
    const ConstValueRef fv{f.type, f.locate(v.ptr)};
    if (f.omit_empty && is_empty_value(fv)) {
      continue;
    }
    EncodeContext fctx{ctx.registry, ctx.min_size || f.min_size};
    auto ew = dw.element(f.key);
    ec = encode_element(fctx, ew, fv);
    if (ec) {
      return ec;
    }
  }

  if (desc->inline_map) {
    const auto& mt = static_cast<const reflect::MapType&>(*desc->inline_map->type);
    const auto* map_ptr = desc->inline_map->locate(v.ptr);
    ec = mt.for_each(map_ptr, [&](std::string_view key, const void* value) -> std::error_code {
      if (desc->by_key.find(key) != desc->by_key.end()) {
        return make_error_code(errc::duplicate_key);
      }
      auto ew = dw.element(key);
      return encode_element(ctx, ew, ConstValueRef{&mt.value(), value});
    });
    if (ec) {
      return ec;
    }
  }

  return dw.close_document();
}

std::error_code StructCodec::decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const {
  if (v.type == nullptr || v.type->kind() != reflect::Kind::structure) {
    return make_error_code(errc::incompatible_type);
  }
  if (r.type() == bson::element_type::null) {
    v.type->reset(v.ptr);
    return {};
  }
  if (r.type() != bson::element_type::document) {
    return make_error_code(errc::incompatible_type);
  }

  std::shared_ptr<const StructDescription> desc;
  auto ec = describe(static_cast<const reflect::StructType&>(*v.type), desc);
  if (ec) {
    return ec;
  }
  if (ctx.zero_structs || options_.decode_zero_struct) {
    v.type->reset(v.ptr);
  }

  bson::DocumentReader dr;
  ec = r.read_document(dr);
  if (ec) {
    return ec;
  }

  std::optional<bson::ElementHeader> header;
  for (;;) {
    ec = dr.next(header);
    if (ec) {
      return ec;
    }
    if (!header) {
      return {};
    }

    if (const auto* f = desc->find(header->key)) {
      bson::ValueReader vr;
      ec = dr.value_reader(vr);
      if (ec) {
        return ec;
      }
      DecodeContext fctx{ctx.registry, ctx.truncate || f->truncate, ctx.strict, ctx.zero_structs};
      ec = decode_element(fctx, vr, ValueRef{f->type, f->locate(v.ptr)});
      if (ec) {
        return ec;
      }
      continue;
    }

    if (desc->hidden_keys.find(header->key) != desc->hidden_keys.end()) {
      if (ctx.strict) {
        return make_error_code(errc::field_access_denied);
      }
      continue;
    }

    if (desc->inline_map) {
      const auto& mt = static_cast<const reflect::MapType&>(*desc->inline_map->type);
      void* slot = nullptr;
      if (mt.slot(desc->inline_map->locate(v.ptr), header->key, slot)) {
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
      continue;
    }

    if (ctx.strict) {
      spdlog::debug("bsonc: unknown field '{}' for {}", header->key, v.type->name());
      return make_error_code(errc::unknown_field);
    }
    // 未消费的值由下一次 next() 自动跳过。
  }
}

}  // namespace bsonc::codec
