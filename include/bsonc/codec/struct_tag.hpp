#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace bsonc::codec {

/**
 * @brief 一个字段解析后的编解码指令。
 *
 * 标签写法与常见的结构体标签一致：`bson:"name,omitempty"`，逗号后为指令：
 * - inline：把结构体字段展开到父文档；映射字段接收父文档中没有匹配字段的 key；
 * - omitempty：值为零值/空容器时不编码；
 * - minsize：整数放得下时以 int32 编码；
 * - truncate：解码时允许精度损失（double -> float，带小数的 double -> 整数）。
 */
struct StructTags final {
  std::string name;
  bool skip{false};
  bool omit_empty{false};
  bool min_size{false};
  bool truncate{false};
  bool inline_{false};
};

/**
 * @brief 结构体标签解析器（可替换）。
 */
class StructTagParser {
 public:
  virtual ~StructTagParser() = default;
  virtual std::error_code parse(std::string_view field_name, std::string_view tag, StructTags& out) const = 0;
};

/**
 * @brief 默认解析器：读取 `bson:"..."`；整个标签不含 ':' 时，把它整体当作 bson 标签。
 */
class DefaultStructTagParser : public StructTagParser {
 public:
  std::error_code parse(std::string_view field_name, std::string_view tag, StructTags& out) const override;
};

/**
 * @brief 在没有 bson 标签时回退读取 `json:"..."` 的解析器。
 */
class JsonFallbackStructTagParser final : public DefaultStructTagParser {
 public:
  std::error_code parse(std::string_view field_name, std::string_view tag, StructTags& out) const override;
};

/**
 * @brief 在 `key:"value" key2:"value2"` 形式的标签文本中查找 key 对应的值。
 *
 * 值中的 `\"` 与 `\\` 会被反转义；格式不合法时停止扫描并返回 std::nullopt。
 */
[[nodiscard]] std::optional<std::string> lookup_tag(std::string_view tag, std::string_view key);

// 按逗号拆分的指令应用到 out（第一段为 key，空则取小写字段名）。
void apply_tag_value(std::string_view field_name, std::string_view value, StructTags& out);

}  // namespace bsonc::codec
