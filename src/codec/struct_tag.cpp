#include "bsonc/codec/struct_tag.hpp"

#include <cctype>

namespace bsonc::codec {
namespace {

std::string to_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

}  // namespace

std::optional<std::string> lookup_tag(std::string_view tag, std::string_view key) {
  std::size_t i = 0;
  while (i < tag.size()) {
    while (i < tag.size() && tag[i] == ' ') {
      ++i;
    }
    if (i >= tag.size()) {
      break;
    }

    // name：到 ':' 为止，不允许空白、引号与控制字符。
    const auto name_begin = i;
    while (i < tag.size() && tag[i] > ' ' && tag[i] != ':' && tag[i] != '"' && tag[i] != 0x7F) {
      ++i;
    }
    if (i == name_begin || i + 1 >= tag.size() || tag[i] != ':' || tag[i + 1] != '"') {
      return std::nullopt;
    }
    const auto name = tag.substr(name_begin, i - name_begin);
    i += 2;

    std::string value;
    bool closed = false;
    while (i < tag.size()) {
      const char c = tag[i];
      if (c == '\\' && i + 1 < tag.size()) {
        value.push_back(tag[i + 1]);
        i += 2;
        continue;
      }
      if (c == '"') {
        closed = true;
        ++i;
        break;
      }
      value.push_back(c);
      ++i;
    }
    if (!closed) {
      return std::nullopt;
    }
    if (name == key) {
      return value;
    }
  }
  return std::nullopt;
}

void apply_tag_value(std::string_view field_name, std::string_view value, StructTags& out) {
  out = StructTags{};
  if (value == "-") {
    out.skip = true;
    return;
  }

  std::size_t pos = value.find(',');
  const auto key = value.substr(0, pos);
  out.name = key.empty() ? to_lower(field_name) : std::string(key);

  while (pos != std::string_view::npos) {
    const auto begin = pos + 1;
    pos = value.find(',', begin);
    const auto directive = value.substr(begin, pos == std::string_view::npos ? std::string_view::npos : pos - begin);
    if (directive == "omitempty") {
      out.omit_empty = true;
    } else if (directive == "minsize") {
      out.min_size = true;
    } else if (directive == "truncate") {
      out.truncate = true;
    } else if (directive == "inline") {
      out.inline_ = true;
    }
    // 其它指令忽略。
  }
}

std::error_code DefaultStructTagParser::parse(std::string_view field_name, std::string_view tag, StructTags& out) const {
  if (auto v = lookup_tag(tag, "bson")) {
    apply_tag_value(field_name, *v, out);
    return {};
  }
  if (!tag.empty() && tag.find(':') == std::string_view::npos) {
    apply_tag_value(field_name, tag, out);
    return {};
  }
  apply_tag_value(field_name, {}, out);
  return {};
}

std::error_code JsonFallbackStructTagParser::parse(std::string_view field_name, std::string_view tag, StructTags& out) const {
  if (!lookup_tag(tag, "bson")) {
    if (auto v = lookup_tag(tag, "json")) {
      apply_tag_value(field_name, *v, out);
      return {};
    }
  }
  return DefaultStructTagParser::parse(field_name, tag, out);
}

}  // namespace bsonc::codec
