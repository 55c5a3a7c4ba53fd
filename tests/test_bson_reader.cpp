#include "bsonc/bson/reader.hpp"
#include "bsonc/bson/writer.hpp"
#include "bsonc/utils/hex.hpp"

#include "test_main.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace {

using bsonc::bson::byte;
using bsonc::bson::bytes_view;
using bsonc::bson::DocumentReader;
using bsonc::bson::DocumentWriter;
using bsonc::bson::ElementHeader;
using bsonc::bson::ValueReader;
using bsonc::bson::element_type;
using bsonc::bson::errc;

std::vector<byte> hex(std::string_view text) {
  std::vector<byte> out;
  TEST_EXPECT_OK(bsonc::utils::parse_hex(text, out));
  return out;
}

bytes_view view(const std::vector<byte>& v) { return bytes_view{v.data(), v.size()}; }

// { n: { x: { y: { z: 1 } } }, after: true }
std::vector<byte> nested_doc() {
  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_OK(w.open_document("n"));
  TEST_EXPECT_OK(w.open_document("x"));
  TEST_EXPECT_OK(w.open_document("y"));
  TEST_EXPECT_OK(w.write_int32("z", 1));
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_OK(w.write_boolean("after", true));
  TEST_EXPECT_OK(w.close_document());
  return out;
}

void test_iterate_elements() {
  const auto doc = hex("19000000 10 6100 01000000 02 6200 02000000 7800 08 6300 01 00");
  DocumentReader r;
  TEST_EXPECT_OK(DocumentReader::open(view(doc), r));

  std::optional<ElementHeader> h;
  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT(h.has_value());
  TEST_EXPECT_EQ(h->key, std::string_view("a"));
  TEST_EXPECT(h->type == element_type::int32);
  TEST_EXPECT_EQ(h->offset, std::size_t{4});

  ValueReader v;
  TEST_EXPECT_OK(r.value_reader(v));
  std::int32_t i = 0;
  TEST_EXPECT_OK(v.read_int32(i));
  TEST_EXPECT_EQ(i, 1);
  std::string s;
  TEST_EXPECT_EQ(v.read_string(s), std::error_code(errc::type_mismatch));

  // 不取值直接 next()：上一个值被自动跳过。
  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT_EQ(h->key, std::string_view("b"));
  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT_EQ(h->key, std::string_view("c"));
  TEST_EXPECT_OK(r.value_reader(v));
  bool b = false;
  TEST_EXPECT_OK(v.read_boolean(b));
  TEST_EXPECT(b);

  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT(!h.has_value());
  // 结束后再次调用仍然返回空。
  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT(!h.has_value());
}

void test_skip_nested_value() {
  const auto doc = nested_doc();
  DocumentReader r;
  TEST_EXPECT_OK(DocumentReader::open(view(doc), r));

  std::optional<ElementHeader> h;
  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT_EQ(h->key, std::string_view("n"));
  const std::size_t n_offset = h->offset;
  TEST_EXPECT_OK(r.skip_value());

  // n 的子文档：{x:{y:{z:1}}} 长度为 4 + (3 + (4 + (3 + 12) + 1)) + 1 = 28。
  const std::size_t n_end = n_offset + 3 + 28;
  TEST_EXPECT_EQ(r.offset(), n_end);
  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT_EQ(h->key, std::string_view("after"));
  TEST_EXPECT_EQ(h->offset, n_end);

  ValueReader extra;
  TEST_EXPECT_OK(r.skip_value());
  TEST_EXPECT_EQ(r.skip_value(), std::error_code(errc::cursor_invariant));
  TEST_EXPECT_EQ(r.value_reader(extra), std::error_code(errc::cursor_invariant));
}

void test_descend_into_shares_buffer() {
  const auto doc = nested_doc();
  DocumentReader r;
  TEST_EXPECT_OK(DocumentReader::open(view(doc), r));

  std::optional<ElementHeader> h;
  TEST_EXPECT_OK(r.next(h));
  DocumentReader n;
  TEST_EXPECT_OK(r.descend_into(n));
  TEST_EXPECT_EQ(n.depth(), std::size_t{1});
  TEST_EXPECT(n.bytes().data() >= doc.data() && n.bytes().data() < doc.data() + doc.size());

  std::optional<ElementHeader> nh;
  TEST_EXPECT_OK(n.next(nh));
  TEST_EXPECT_EQ(nh->key, std::string_view("x"));
  // 子游标的 offset 是相对最外层输入的绝对偏移。
  TEST_EXPECT_EQ(nh->offset, h->offset + 3 + 4);

  // 父游标不受子游标影响，继续读取下一个兄弟元素。
  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT_EQ(h->key, std::string_view("after"));
}

void test_read_value_into_document() {
  const auto doc = nested_doc();
  ValueReader top;
  TEST_EXPECT_OK(ValueReader::from_document(view(doc), top));
  bsonc::bson::Value v;
  TEST_EXPECT_OK(top.read_value(v));
  const auto* d = v.get_if<bsonc::bson::Document>();
  TEST_EXPECT(d != nullptr);
  if (d == nullptr) {
    return;
  }
  TEST_EXPECT_EQ(d->size(), std::size_t{2});
  const auto* after = d->find("after");
  TEST_EXPECT(after != nullptr && after->get_if<bool>() != nullptr && *after->get_if<bool>());

  // 写回得到相同字节。
  std::vector<byte> again;
  DocumentWriter w(again);
  TEST_EXPECT_OK(w.write_document(*d));
  TEST_EXPECT_EQ(again, doc);
}

void test_lookup_path() {
  const auto doc = nested_doc();
  ValueReader v;
  TEST_EXPECT_OK(bsonc::bson::lookup(view(doc), {"n", "x", "y", "z"}, v));
  std::int32_t z = 0;
  TEST_EXPECT_OK(v.read_int32(z));
  TEST_EXPECT_EQ(z, 1);

  TEST_EXPECT_EQ(bsonc::bson::lookup(view(doc), {"n", "missing"}, v), std::error_code(errc::key_not_found));
  TEST_EXPECT_EQ(bsonc::bson::lookup(view(doc), {"after", "x"}, v), std::error_code(errc::type_mismatch));

  TEST_EXPECT_OK(bsonc::bson::lookup(view(doc), std::span<const std::string_view>{}, v));
  TEST_EXPECT(v.type() == element_type::document);
}

void test_lookup_array_index() {
  std::vector<byte> doc;
  DocumentWriter w(doc);
  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_OK(w.open_array("a"));
  TEST_EXPECT_OK(w.write_string("0", "zero"));
  TEST_EXPECT_OK(w.write_string("1", "one"));
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_OK(w.close_document());

  ValueReader v;
  TEST_EXPECT_OK(bsonc::bson::lookup(view(doc), {"a", "1"}, v));
  std::string s;
  TEST_EXPECT_OK(v.read_string(s));
  TEST_EXPECT_EQ(s, "one");
}

void test_malformed_input() {
  DocumentReader r;

  // 长度前缀超过实际字节数。
  const auto truncated = hex("10000000 10 6100 01000000 00");
  TEST_EXPECT_EQ(DocumentReader::open(view(truncated), r), std::error_code(errc::truncated));

  // 长度前缀小于 5。
  const auto tiny = hex("04000000 00");
  TEST_EXPECT_EQ(DocumentReader::open(view(tiny), r), std::error_code(errc::malformed_document));

  // 缺少结尾 0x00。
  const auto no_terminator = hex("05000000 01");
  TEST_EXPECT_EQ(DocumentReader::open(view(no_terminator), r), std::error_code(errc::malformed_document));

  // 未知元素类型 0x20。
  const auto unknown = hex("08000000 20 6100 00");
  TEST_EXPECT_OK(DocumentReader::open(view(unknown), r));
  std::optional<ElementHeader> h;
  TEST_EXPECT_EQ(r.next(h), std::error_code(errc::unknown_element_type));

  // 值越过文档末尾：int32 需要 4 字节。
  const auto short_value = hex("0a000000 10 6100 0100 00");
  TEST_EXPECT_OK(DocumentReader::open(view(short_value), r));
  TEST_EXPECT_OK(r.next(h));
  ValueReader v;
  TEST_EXPECT_EQ(r.value_reader(v), std::error_code(errc::truncated));

  // boolean 只能是 0 或 1。
  const auto bad_bool = hex("09000000 08 6200 02 00");
  TEST_EXPECT_OK(DocumentReader::open(view(bad_bool), r));
  TEST_EXPECT_OK(r.next(h));
  TEST_EXPECT_OK(r.value_reader(v));
  bool b = false;
  TEST_EXPECT_EQ(v.read_boolean(b), std::error_code(errc::malformed_document));

  // 顶层 from_document 要求恰好一个文档。
  auto trailing = hex("05000000 00 ff");
  TEST_EXPECT_EQ(ValueReader::from_document(view(trailing), v), std::error_code(errc::malformed_document));
}

void test_make_value_reader_checks_payload() {
  ValueReader v;

  // string 的 payload 只有 2 字节：连长度前缀都不完整。
  const std::vector<byte> short_string{0x01, 0x02};
  TEST_EXPECT_EQ(ValueReader::make(element_type::string, view(short_string), 0, 0, v),
                 std::error_code(errc::truncated));
  TEST_EXPECT_EQ(v.type(), element_type::null);

  // double 需要 8 字节。
  TEST_EXPECT_EQ(ValueReader::make(element_type::double_, bytes_view{}, 0, 0, v), std::error_code(errc::truncated));

  // payload 比值本身长。
  const auto padded = hex("01000000 00 ff");
  TEST_EXPECT_EQ(ValueReader::make(element_type::int32, view(padded), 0, 0, v),
                 std::error_code(errc::malformed_document));
  TEST_EXPECT_EQ(ValueReader::make(element_type::string, view(padded), 0, 0, v),
                 std::error_code(errc::malformed_document));

  TEST_EXPECT_EQ(ValueReader::make(static_cast<element_type>(0x20), bytes_view{}, 0, 0, v),
                 std::error_code(errc::unknown_element_type));
  TEST_EXPECT_EQ(ValueReader::make(element_type::null, bytes_view{}, 0, bsonc::core::kMaxDocumentDepth + 1, v),
                 std::error_code(errc::depth_exceeded));

  // 合法 payload：与 DocumentReader 得到的一样可读。
  const auto hi = hex("03000000 6869 00");
  TEST_EXPECT_OK(ValueReader::make(element_type::string, view(hi), 7, 1, v));
  std::string s;
  TEST_EXPECT_OK(v.read_string(s));
  TEST_EXPECT_EQ(s, "hi");
  TEST_EXPECT_EQ(v.offset(), std::size_t{7});

  const auto num = hex("2a000000");
  TEST_EXPECT_OK(ValueReader::make(element_type::int32, view(num), 0, 0, v));
  std::int32_t n = 0;
  TEST_EXPECT_OK(v.read_int32(n));
  TEST_EXPECT_EQ(n, 42);
}

void test_depth_limit_on_read() {
  std::vector<byte> doc;
  DocumentWriter w(doc);
  TEST_EXPECT_OK(w.open_document());
  for (std::size_t i = 1; i < bsonc::core::kMaxDocumentDepth; ++i) {
    TEST_EXPECT_OK(w.open_document("d"));
  }
  for (std::size_t i = 0; i < bsonc::core::kMaxDocumentDepth; ++i) {
    TEST_EXPECT_OK(w.close_document());
  }

  ValueReader top;
  TEST_EXPECT_OK(ValueReader::from_document(view(doc), top));
  bsonc::bson::Value v;
  TEST_EXPECT_OK(top.read_value(v));
}

}  // namespace

int main() {
  test_iterate_elements();
  test_skip_nested_value();
  test_descend_into_shares_buffer();
  test_read_value_into_document();
  test_lookup_path();
  test_lookup_array_index();
  test_malformed_input();
  test_make_value_reader_checks_payload();
  test_depth_limit_on_read();
  return ::bsonc::tests::run_and_report();
}
