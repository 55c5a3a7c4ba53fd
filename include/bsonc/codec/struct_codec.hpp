#pragma once

#include "bsonc/codec/codec.hpp"
#include "bsonc/codec/struct_tag.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace bsonc::codec {

/**
 * @brief 结构体展开后的一个待编解码字段。
 *
 * path 为从外层结构体到该字段的访问路径：普通字段长度为 1，
 * 内联（inline）结构体中的字段依次经过每一层内联字段。
 */
struct FieldDescription final {
  std::string key;
  std::string name;
  std::vector<const reflect::Field*> path;
  const reflect::Type* type{nullptr};
  bool omit_empty{false};
  bool min_size{false};
  bool truncate{false};

  [[nodiscard]] void* locate(void* obj) const;
  [[nodiscard]] const void* locate(const void* obj) const;
};

/**
 * @brief 结构体的编解码描述（字段顺序、key 索引、内联映射）。
 */
struct StructDescription final {
  const reflect::StructType* type{nullptr};
  std::vector<FieldDescription> fields;
  // 至多一个内联映射（key 必须为字符串）。
  std::optional<FieldDescription> inline_map;
  std::map<std::string, std::size_t, std::less<>> by_key;
  // 小写 key -> 第一个匹配字段，用于大小写不敏感匹配。
  std::map<std::string, std::size_t, std::less<>> by_folded_key;
  // 不可访问字段对应的 key。
  std::set<std::string, std::less<>> hidden_keys;

  // 先精确匹配，再大小写不敏感匹配；找不到返回 nullptr。
  [[nodiscard]] const FieldDescription* find(std::string_view key) const;
};

struct StructCodecOptions final {
  // 解码前总是把目标结构体重置为零值（等价于每次调用都设置 DecodeContext::zero_structs）。
  bool decode_zero_struct{false};
  // 内联展开后 key 冲突时，较外层的字段覆盖内层字段，而不是报 tag_conflict。
  bool overwrite_duplicated_inline_fields{false};
};

/**
 * @brief 通用结构体 Codec：按字段标签把结构体映射为文档。
 *
 * 说明：
 * - 结构体描述在注册表构建时为 register_struct<T>() 登记的类型（及其可达的结构体）
 *   预先计算，存放在 precompile() 返回的新实例中；其它结构体在每次调用时临时计算；
 * - 编码：按展开后的声明顺序写出字段，内联映射最后写出，与字段 key 冲突时返回 duplicate_key；
 * - 解码：key 先精确后大小写不敏感匹配；未匹配的 key 进入内联映射，否则丢弃
 *   （strict 模式返回 unknown_field）；null 解码为零值。
 */
class StructCodec final : public ValueCodec {
 public:
  explicit StructCodec(std::shared_ptr<const StructTagParser> parser, StructCodecOptions options = {});

  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const override;
  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const override;

  /**
   * @brief 取得结构体描述（命中预计算缓存时直接返回）。
   *
   * 内联目标不是结构体/映射、多个内联映射、内联映射的 key 不是字符串、展开后 key 冲突，
   * 都返回 errc::tag_conflict。
   */
  std::error_code describe(const reflect::StructType& t, std::shared_ptr<const StructDescription>& out) const;

  /**
   * @brief 为 roots 及其可达的全部结构体计算描述，返回携带这些描述的新 Codec。
   *
   * 当前实例不被修改；任何一个结构体描述失败都会中止并返回错误。
   */
  std::error_code precompile(std::span<const reflect::Type* const> roots, std::shared_ptr<const StructCodec>& out) const;

  [[nodiscard]] bool is_precompiled(const reflect::Type& t) const noexcept;
  [[nodiscard]] std::size_t precompiled_count() const noexcept;
  [[nodiscard]] const StructCodecOptions& options() const noexcept { return options_; }

 private:
  using Cache = std::unordered_map<reflect::TypeKey, std::shared_ptr<const StructDescription>>;

  StructCodec(std::shared_ptr<const StructTagParser> parser, StructCodecOptions options, std::shared_ptr<const Cache> cache);

  std::error_code build_description(const reflect::StructType& t, std::shared_ptr<const StructDescription>& out) const;
  std::error_code flatten(
    const reflect::StructType& t,
    const std::vector<const reflect::Field*>& prefix,
    StructDescription& out) const;

  std::shared_ptr<const StructTagParser> parser_;
  StructCodecOptions options_;
  std::shared_ptr<const Cache> cache_;
};

// omitempty 判定：实现 Zeroer 的类型由自身决定，否则使用类型描述的零值判定。
[[nodiscard]] bool is_empty_value(ConstValueRef v);

}  // namespace bsonc::codec
