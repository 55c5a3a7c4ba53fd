#pragma once

#include "bsonc/codec/codec.hpp"

#include <cstdint>

namespace bsonc::codec {

enum class KeyOrder : std::uint8_t {
  // 容器自身的遍历顺序（std::map 有序，std::unordered_map 不确定）。
  container = 0,
  // 按 key 文本的字节序排序后写出。
  sorted = 1,
};

struct MapCodecOptions final {
  KeyOrder key_order{KeyOrder::container};
};

/**
 * @brief 通用映射 Codec：std::map / std::unordered_map <-> 文档。
 *
 * key 必须为字符串或整数（整数以十进制文本作为文档 key），否则返回 unsupported_key。
 * 解码时先清空目标；null 解码为空映射。
 */
class MapCodec final : public ValueCodec {
 public:
  explicit MapCodec(MapCodecOptions options = {}) noexcept : options_(options) {}

  std::error_code encode_value(const EncodeContext& ctx, bson::ValueWriter& w, ConstValueRef v) const override;
  std::error_code decode_value(const DecodeContext& ctx, const bson::ValueReader& r, ValueRef v) const override;

  [[nodiscard]] const MapCodecOptions& options() const noexcept { return options_; }

 private:
  MapCodecOptions options_;
};

}  // namespace bsonc::codec
