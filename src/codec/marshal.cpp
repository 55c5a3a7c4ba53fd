#include "bsonc/codec/marshal.hpp"

#include "bsonc/bson/error.hpp"
#include "bsonc/bson/reader.hpp"
#include "bsonc/bson/writer.hpp"

namespace bsonc::codec {

std::error_code encode_document(const EncodeContext& ctx, ConstValueRef v, std::vector<bson::byte>& out) {
  const auto mark = out.size();
  bson::DocumentWriter dw(out);
  auto w = bson::ValueWriter::top_level(dw);

  auto ec = encode_element(ctx, w, v);
  if (!ec && dw.depth() != 0) {
    // 自定义 Codec 打开了文档却没有关闭。
    ec = bson::make_error_code(bson::errc::cursor_invariant);
  }
  if (!ec && out.size() == mark) {
    ec = bson::make_error_code(bson::errc::not_a_document);
  }
  if (ec) {
    out.resize(mark);
  }
  return ec;
}

std::error_code decode_document(const DecodeContext& ctx, bson::bytes_view doc, ValueRef v) {
  bson::ValueReader r;
  auto ec = bson::ValueReader::from_document(doc, r);
  if (ec) {
    return ec;
  }
  return decode_element(ctx, r, v);
}

}  // namespace bsonc::codec
