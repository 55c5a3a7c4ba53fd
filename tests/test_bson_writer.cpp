#include "bsonc/bson/writer.hpp"
#include "bsonc/utils/hex.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

using bsonc::bson::byte;
using bsonc::bson::DocumentWriter;
using bsonc::bson::ValueWriter;
using bsonc::bson::errc;

std::vector<byte> hex(std::string_view text) {
  std::vector<byte> out;
  TEST_EXPECT_OK(bsonc::utils::parse_hex(text, out));
  return out;
}

void test_single_int32_element() {
  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_OK(w.write_int32("a", 1));
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_EQ(out, hex("0c000000 10 6100 01000000 00"));
  TEST_EXPECT_EQ(w.depth(), std::size_t{0});
}

void test_nested_lengths_are_backfilled() {
  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_OK(w.open_document("x"));
  TEST_EXPECT_OK(w.write_boolean("y", true));
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_EQ(out, hex("11000000 03 7800 09000000 08 7900 01 00 00"));
}

void test_array_and_index_keys() {
  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_OK(w.open_array("v"));
  TEST_EXPECT(w.in_array());
  for (std::size_t i = 0; i < 2; ++i) {
    const bsonc::bson::IndexKey key(i);
    TEST_EXPECT_OK(w.write_string(key.view(), "ab"));
  }
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_EQ(out,
                 hex("21000000 04 7600"
                     "19000000"
                     "02 3000 03000000 616200"
                     "02 3100 03000000 616200"
                     "00 00"));

  TEST_EXPECT_EQ(bsonc::bson::IndexKey(0).view(), std::string_view("0"));
  TEST_EXPECT_EQ(bsonc::bson::IndexKey(1234).view(), std::string_view("1234"));
}

void test_scalar_layouts() {
  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_OK(w.write_double("d", 1.0));
  TEST_EXPECT_OK(w.write_int64("l", -2));
  TEST_EXPECT_OK(w.write_null("n"));
  TEST_EXPECT_OK(w.write_binary("b", 0x80, bsonc::bson::bytes_view{}));
  TEST_EXPECT_OK(w.write_timestamp("t", bsonc::bson::Timestamp{7, 1}));
  TEST_EXPECT_OK(w.write_regex("r", "a", "i"));
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_EQ(out,
                 hex("38000000"
                     "01 6400 000000000000f03f"
                     "12 6c00 feffffffffffffff"
                     "0a 6e00"
                     "05 6200 00000000 80"
                     "11 7400 01000000 07000000"
                     "0b 7200 6100 6900"
                     "00"));
}

void test_binary_old_subtype_has_inner_length() {
  std::vector<byte> out;
  DocumentWriter w(out);
  const std::vector<byte> data{0xAA, 0xBB};
  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_OK(w.write_binary("b", 0x02, bsonc::bson::bytes_view{data.data(), data.size()}));
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_EQ(out, hex("13000000 05 6200 06000000 02 02000000 aabb 00"));
}

void test_cursor_invariants() {
  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_EQ(w.write_int32("a", 1), std::error_code(errc::cursor_invariant));
  TEST_EXPECT_EQ(w.close_document(), std::error_code(errc::cursor_invariant));

  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_EQ(w.open_document(), std::error_code(errc::cursor_invariant));
  TEST_EXPECT_EQ(w.write_int32(std::string_view("a\0b", 3), 1), std::error_code(errc::invalid_key));
  TEST_EXPECT_OK(w.close_document());
}

void test_depth_limit() {
  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_OK(w.open_document());
  for (std::size_t i = 1; i < bsonc::core::kMaxDocumentDepth; ++i) {
    TEST_EXPECT_OK(w.open_document("d"));
  }
  TEST_EXPECT_EQ(w.open_document("d"), std::error_code(errc::depth_exceeded));
}

void test_value_writer_top_level() {
  std::vector<byte> out;
  DocumentWriter w(out);
  auto top = ValueWriter::top_level(w);
  TEST_EXPECT(top.is_top_level());
  TEST_EXPECT_EQ(top.write_int32(5), std::error_code(errc::not_a_document));
  TEST_EXPECT_EQ(top.open_array(), std::error_code(errc::not_a_document));
  TEST_EXPECT(out.empty());

  bsonc::bson::Document doc;
  doc.append("k", bsonc::bson::Value::string("v"));
  TEST_EXPECT_OK(top.write_document(doc));
  TEST_EXPECT_EQ(out, hex("0e000000 02 6b00 02000000 7600 00"));
}

void test_raw_document_is_validated() {
  std::vector<byte> out;
  DocumentWriter w(out);
  const auto good = hex("05000000 00");
  const auto bad = hex("06000000 00");
  TEST_EXPECT_OK(w.open_document());
  TEST_EXPECT_OK(w.write_raw_document("e", bsonc::bson::bytes_view{good.data(), good.size()}));
  TEST_EXPECT(static_cast<bool>(w.write_raw_document("f", bsonc::bson::bytes_view{bad.data(), bad.size()})));
  TEST_EXPECT_OK(w.close_document());
  TEST_EXPECT_EQ(out, hex("0d000000 03 6500 05000000 00 00"));
}

void test_write_value_recurses() {
  bsonc::bson::Document inner;
  inner.append("n", bsonc::bson::Value(bsonc::bson::Null{}));
  bsonc::bson::Array arr;
  arr.emplace_back(std::int32_t{1});
  bsonc::bson::Document doc;
  doc.append("i", bsonc::bson::Value::document(inner));
  doc.append("a", bsonc::bson::Value::array(arr));

  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_OK(w.write_document(doc));
  TEST_EXPECT_EQ(out,
                 hex("1f000000"
                     "03 6900 08000000 0a 6e00 00"
                     "04 6100 0c000000 10 3000 01000000 00"
                     "00"));
}

}  // namespace

int main() {
  test_single_int32_element();
  test_nested_lengths_are_backfilled();
  test_array_and_index_keys();
  test_scalar_layouts();
  test_binary_old_subtype_has_inner_length();
  test_cursor_invariants();
  test_depth_limit();
  test_value_writer_top_level();
  test_raw_document_is_validated();
  test_write_value_recurses();
  return ::bsonc::tests::run_and_report();
}
