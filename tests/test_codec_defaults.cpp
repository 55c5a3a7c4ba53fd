#include "bsonc/bson/reader.hpp"
#include "bsonc/bson/writer.hpp"
#include "bsonc/codec/default_codecs.hpp"
#include "bsonc/codec/map_codec.hpp"
#include "bsonc/codec/marshal.hpp"
#include "bsonc/codec/registry.hpp"

#include "test_main.hpp"

#include <chrono>
#include <cstdint>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace {

using bsonc::bson::byte;
using bsonc::bson::bytes_view;
using bsonc::bson::DocumentWriter;
using bsonc::bson::element_type;
using bsonc::codec::Registry;
using bsonc::codec::errc;
namespace bson = bsonc::bson;
namespace codec = bsonc::codec;
namespace reflect = bsonc::reflect;

// 单字段包装：顶层值必须是文档。
template <class T>
struct Box {
  T v{};
  static std::vector<reflect::Field> bson_fields() { return {reflect::field("V", &Box::v, "v")}; }
};

bytes_view view(const std::vector<byte>& v) { return bytes_view{v.data(), v.size()}; }

int g_counted_deletes = 0;

struct CountingDelete {
  void operator()(std::string* p) const {
    ++g_counted_deletes;
    delete p;
  }
};

Registry default_registry() {
  Registry r;
  TEST_EXPECT_OK(codec::new_registry_builder().build(r));
  return r;
}

template <class F>
std::vector<byte> doc_with(F&& write) {
  std::vector<byte> out;
  DocumentWriter w(out);
  TEST_EXPECT_OK(w.open_document());
  write(w);
  TEST_EXPECT_OK(w.close_document());
  return out;
}

template <class T>
std::error_code encode_box(const Registry& r, const T& v, std::vector<byte>& out, codec::EncodeOptions opts = {}) {
  return codec::marshal_with_context(r, opts, Box<T>{v}, out);
}

template <class T>
std::error_code decode_box(const Registry& r, const std::vector<byte>& doc, T& out, codec::DecodeOptions opts = {}) {
  Box<T> b;
  auto ec = codec::unmarshal_with_context(r, opts, view(doc), b);
  if (!ec) {
    out = std::move(b.v);
  }
  return ec;
}

element_type type_of_v(const std::vector<byte>& doc) {
  bson::ValueReader v;
  TEST_EXPECT_OK(bson::lookup(view(doc), {"v"}, v));
  return v.type();
}

void test_integer_encoding() {
  const auto r = default_registry();
  std::vector<byte> out;

  TEST_EXPECT_OK(encode_box(r, std::int8_t{-3}, out));
  TEST_EXPECT(type_of_v(out) == element_type::int32);
  TEST_EXPECT_OK(encode_box(r, std::uint16_t{65535}, out));
  TEST_EXPECT(type_of_v(out) == element_type::int32);
  TEST_EXPECT_OK(encode_box(r, std::int64_t{1}, out));
  TEST_EXPECT(type_of_v(out) == element_type::int64);

  TEST_EXPECT_OK(encode_box(r, std::uint32_t{7}, out));
  TEST_EXPECT(type_of_v(out) == element_type::int64);
  codec::EncodeOptions min_size;
  min_size.min_size = true;
  TEST_EXPECT_OK(encode_box(r, std::uint32_t{7}, out, min_size));
  TEST_EXPECT(type_of_v(out) == element_type::int32);
  TEST_EXPECT_OK(encode_box(r, std::uint32_t{4000000000u}, out, min_size));
  TEST_EXPECT(type_of_v(out) == element_type::int64);

  TEST_EXPECT_OK(encode_box(r, std::uint64_t{9223372036854775807ull}, out));
  TEST_EXPECT(type_of_v(out) == element_type::int64);
  TEST_EXPECT_EQ(encode_box(r, std::numeric_limits<std::uint64_t>::max(), out), std::error_code(errc::overflow));
  TEST_EXPECT(out.empty());
}

void test_integer_decoding() {
  const auto r = default_registry();

  const auto big = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_int32("v", 300)); });
  std::uint8_t u8 = 0;
  TEST_EXPECT_EQ(decode_box(r, big, u8), std::error_code(errc::overflow));
  std::int16_t i16 = 0;
  TEST_EXPECT_OK(decode_box(r, big, i16));
  TEST_EXPECT_EQ(i16, std::int16_t{300});

  const auto negative = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_int64("v", -1)); });
  std::uint64_t u64 = 0;
  TEST_EXPECT_EQ(decode_box(r, negative, u64), std::error_code(errc::overflow));

  const auto whole = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_double("v", 42.0)); });
  std::int32_t i32 = 0;
  TEST_EXPECT_OK(decode_box(r, whole, i32));
  TEST_EXPECT_EQ(i32, 42);

  const auto flag = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_boolean("v", true)); });
  TEST_EXPECT_OK(decode_box(r, flag, i32));
  TEST_EXPECT_EQ(i32, 1);

  const auto null = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_null("v")); });
  i32 = 5;
  TEST_EXPECT_OK(decode_box(r, null, i32));
  TEST_EXPECT_EQ(i32, 0);

  const auto text = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_string("v", "1")); });
  TEST_EXPECT_EQ(decode_box(r, text, i32), std::error_code(errc::incompatible_type));
}

void test_floats_and_booleans() {
  const auto r = default_registry();
  std::vector<byte> out;

  TEST_EXPECT_OK(encode_box(r, 2.25, out));
  TEST_EXPECT(type_of_v(out) == element_type::double_);
  double d = 0;
  TEST_EXPECT_OK(decode_box(r, out, d));
  TEST_EXPECT_EQ(d, 2.25);

  const auto int_doc = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_int32("v", 3)); });
  float f = 0;
  TEST_EXPECT_OK(decode_box(r, int_doc, f));
  TEST_EXPECT_EQ(f, 3.0f);

  bool b = false;
  TEST_EXPECT_OK(decode_box(r, int_doc, b));
  TEST_EXPECT(b);
  const auto zero = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_double("v", 0.0)); });
  TEST_EXPECT_OK(decode_box(r, zero, b));
  TEST_EXPECT(!b);

  const auto text = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_string("v", "true")); });
  TEST_EXPECT_EQ(decode_box(r, text, b), std::error_code(errc::incompatible_type));

  TEST_EXPECT_OK(encode_box(r, true, out));
  TEST_EXPECT(type_of_v(out) == element_type::boolean);
}

void test_strings() {
  const auto r = default_registry();
  const auto symbol = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_symbol("v", "sym")); });
  std::string s;
  TEST_EXPECT_OK(decode_box(r, symbol, s));
  TEST_EXPECT_EQ(s, "sym");

  const auto null = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_null("v")); });
  TEST_EXPECT_OK(decode_box(r, null, s));
  TEST_EXPECT(s.empty());

  const auto number = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_int32("v", 1)); });
  TEST_EXPECT_EQ(decode_box(r, number, s), std::error_code(errc::incompatible_type));
}

void test_sequences() {
  const auto r = default_registry();
  std::vector<byte> out;

  const std::vector<std::int32_t> ints{1, 2, 3};
  TEST_EXPECT_OK(encode_box(r, ints, out));
  TEST_EXPECT(type_of_v(out) == element_type::array);
  bson::ValueReader v;
  TEST_EXPECT_OK(bson::lookup(view(out), {"v", "2"}, v));
  std::int32_t third = 0;
  TEST_EXPECT_OK(v.read_int32(third));
  TEST_EXPECT_EQ(third, 3);

  std::vector<std::int32_t> back{9, 9, 9, 9};
  TEST_EXPECT_OK(decode_box(r, out, back));
  TEST_EXPECT_EQ(back, ints);

  // 字节序列编码为 generic binary。
  const std::vector<std::uint8_t> bytes{0xDE, 0xAD};
  TEST_EXPECT_OK(encode_box(r, bytes, out));
  TEST_EXPECT(type_of_v(out) == element_type::binary);
  std::vector<std::uint8_t> bytes_back;
  TEST_EXPECT_OK(decode_box(r, out, bytes_back));
  TEST_EXPECT_EQ(bytes_back, bytes);

  const auto uuid = doc_with([&](DocumentWriter& w) {
    TEST_EXPECT_OK(w.write_binary("v", static_cast<std::uint8_t>(bson::binary_subtype::uuid), view(bytes)));
  });
  TEST_EXPECT_EQ(decode_box(r, uuid, bytes_back), std::error_code(errc::incompatible_type));

  const auto null = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_null("v")); });
  TEST_EXPECT_OK(decode_box(r, null, back));
  TEST_EXPECT(back.empty());

  // 元素类型不匹配时整体失败。
  const auto mixed = doc_with([](DocumentWriter& w) {
    TEST_EXPECT_OK(w.open_array("v"));
    TEST_EXPECT_OK(w.write_int32("0", 1));
    TEST_EXPECT_OK(w.write_string("1", "x"));
    TEST_EXPECT_OK(w.close_document());
  });
  TEST_EXPECT_EQ(decode_box(r, mixed, back), std::error_code(errc::incompatible_type));
}

void test_pointers() {
  const auto r = default_registry();
  std::vector<byte> out;

  TEST_EXPECT_OK(encode_box(r, std::optional<std::int32_t>{}, out));
  TEST_EXPECT(type_of_v(out) == element_type::null);
  TEST_EXPECT_OK(encode_box(r, std::optional<std::int32_t>{7}, out));
  TEST_EXPECT(type_of_v(out) == element_type::int32);

  std::optional<std::int32_t> opt;
  TEST_EXPECT_OK(decode_box(r, out, opt));
  TEST_EXPECT(opt.has_value() && *opt == 7);

  const auto null = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_null("v")); });
  TEST_EXPECT_OK(decode_box(r, null, opt));
  TEST_EXPECT(!opt.has_value());

  Box<std::unique_ptr<std::string>> unique;
  const auto text = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_string("v", "hi")); });
  TEST_EXPECT_OK(codec::unmarshal(r, view(text), unique));
  TEST_EXPECT(unique.v != nullptr && *unique.v == "hi");
  TEST_EXPECT_OK(codec::marshal(r, unique, out));
  TEST_EXPECT(type_of_v(out) == element_type::string);

  // 自定义删除器：解码分配的对象由该删除器释放。
  g_counted_deletes = 0;
  {
    Box<std::unique_ptr<std::string, CountingDelete>> counted;
    TEST_EXPECT_OK(codec::unmarshal(r, view(text), counted));
    TEST_EXPECT(counted.v != nullptr && *counted.v == "hi");
    TEST_EXPECT_OK(codec::unmarshal(r, view(null), counted));
    TEST_EXPECT(counted.v == nullptr);
    TEST_EXPECT_EQ(g_counted_deletes, 1);
    TEST_EXPECT_OK(codec::unmarshal(r, view(text), counted));
  }
  TEST_EXPECT_EQ(g_counted_deletes, 2);

  std::shared_ptr<std::string> shared = std::make_shared<std::string>("x");
  TEST_EXPECT_OK(decode_box(r, null, shared));
  TEST_EXPECT(shared == nullptr);
  TEST_EXPECT_OK(decode_box(r, text, shared));
  TEST_EXPECT(shared != nullptr && *shared == "hi");
}

void test_maps() {
  const auto r = default_registry();
  std::vector<byte> out;

  // 整数 key 以十进制文本写出。
  std::map<std::int32_t, std::string> by_id{{2, "b"}, {10, "c"}, {1, "a"}};
  TEST_EXPECT_OK(codec::marshal(r, by_id, out));
  bson::ValueReader v;
  TEST_EXPECT_OK(bson::lookup(view(out), {"10"}, v));
  std::map<std::int32_t, std::string> back{{99, "stale"}};
  TEST_EXPECT_OK(codec::unmarshal(r, view(out), back));
  TEST_EXPECT_EQ(back, by_id);

  const auto bad_key = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_string("x", "y")); });
  TEST_EXPECT_EQ(codec::unmarshal(r, view(bad_key), back), std::error_code(errc::unsupported_key));

  std::map<double, int> unsupported{{1.5, 1}};
  TEST_EXPECT_EQ(codec::marshal(r, unsupported, out), std::error_code(errc::unsupported_key));

  // 排序选项：unordered_map 输出稳定的字节序。
  codec::MapCodecOptions sorted;
  sorted.key_order = codec::KeyOrder::sorted;
  Registry sorted_registry;
  TEST_EXPECT_OK(codec::new_registry_builder()
                   .set_default_map_codec(std::make_shared<const codec::MapCodec>(sorted))
                   .build(sorted_registry));
  std::unordered_map<std::string, std::int32_t> m{{"zeta", 1}, {"alpha", 2}, {"mid", 3}, {"Beta", 4}};
  TEST_EXPECT_OK(codec::marshal(sorted_registry, m, out));

  std::vector<std::string> keys;
  bson::DocumentReader dr;
  TEST_EXPECT_OK(bson::DocumentReader::open(view(out), dr));
  std::optional<bson::ElementHeader> h;
  for (;;) {
    TEST_EXPECT_OK(dr.next(h));
    if (!h) {
      break;
    }
    keys.emplace_back(h->key);
  }
  const std::vector<std::string> expected{"Beta", "alpha", "mid", "zeta"};
  TEST_EXPECT_EQ(keys, expected);
}

void test_time_point() {
  using std::chrono::system_clock;
  const auto r = default_registry();
  std::vector<byte> out;

  const auto tp = system_clock::time_point(std::chrono::milliseconds(1700000000123));
  TEST_EXPECT_OK(encode_box(r, tp, out));
  TEST_EXPECT(type_of_v(out) == element_type::datetime);
  system_clock::time_point back;
  TEST_EXPECT_OK(decode_box(r, out, back));
  TEST_EXPECT(back == tp);

  const auto ts = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_timestamp("v", bson::Timestamp{5, 1})); });
  TEST_EXPECT_OK(decode_box(r, ts, back));
  TEST_EXPECT(back == system_clock::time_point(std::chrono::seconds(5)));
}

struct Record {
  bson::ObjectId id;
  bson::Regex pattern;
  bson::Decimal128 amount;
  bson::Document meta;
  bson::Raw raw;
  bson::Value any;

  static std::vector<reflect::Field> bson_fields() {
    return {
      reflect::field("ID", &Record::id, "_id"),
      reflect::field("Pattern", &Record::pattern),
      reflect::field("Amount", &Record::amount),
      reflect::field("Meta", &Record::meta),
      reflect::field("Raw", &Record::raw),
      reflect::field("Any", &Record::any),
    };
  }
};

void test_element_types() {
  const auto r = default_registry();

  Record rec;
  TEST_EXPECT_OK(bson::ObjectId::from_hex("5f1d7a0e2b3c4d5e6f708192", rec.id));
  rec.pattern = bson::Regex{"^a", "i"};
  rec.amount = bson::Decimal128{1, 2};
  rec.meta.append("k", bson::Value::int32(1));
  rec.raw.bytes = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_boolean("ok", true)); });
  rec.any = bson::Value::string("loose");

  std::vector<byte> out;
  TEST_EXPECT_OK(codec::marshal(r, rec, out));

  Record back;
  TEST_EXPECT_OK(codec::unmarshal(r, view(out), back));
  TEST_EXPECT(back.id == rec.id);
  TEST_EXPECT(back.pattern == rec.pattern);
  TEST_EXPECT(back.amount == rec.amount);
  TEST_EXPECT(back.meta == rec.meta);
  TEST_EXPECT(back.raw == rec.raw);
  TEST_EXPECT(back.any == rec.any);

  // 元素类型不符。
  const auto wrong = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_string("_id", "nope")); });
  TEST_EXPECT_EQ(codec::unmarshal(r, view(wrong), back), std::error_code(errc::incompatible_type));
}

void test_top_level_values() {
  const auto r = default_registry();
  std::vector<byte> out;

  bson::Document doc;
  doc.append("a", bson::Value::int64(1));
  TEST_EXPECT_OK(codec::marshal(r, doc, out));
  const auto single = out.size();
  bson::Document back;
  TEST_EXPECT_OK(codec::unmarshal(r, view(out), back));
  TEST_EXPECT(back == doc);

  const std::vector<std::int32_t> seq{1};
  TEST_EXPECT_EQ(codec::marshal(r, seq, out), std::error_code(bson::errc::not_a_document));
  TEST_EXPECT_EQ(codec::marshal(r, std::int32_t{1}, out), std::error_code(bson::errc::not_a_document));
  TEST_EXPECT(out.empty());

  // marshal_append 追加在已有内容之后。
  std::vector<byte> joined;
  TEST_EXPECT_OK(codec::marshal_append(r, doc, joined));
  TEST_EXPECT_OK(codec::marshal_append(r, doc, joined));
  TEST_EXPECT_EQ(joined.size(), single * 2);
}

// 整体接管编解码的类型：编码为 {"body": ...}。
class Envelope final : public codec::Marshaler, public codec::Unmarshaler {
 public:
  Envelope() = default;
  explicit Envelope(std::string body) : body_(std::move(body)) {}

  std::error_code marshal_bson(std::vector<byte>& out) const override {
    DocumentWriter w(out);
    if (auto ec = w.open_document()) {
      return ec;
    }
    if (auto ec = w.write_string("body", body_)) {
      return ec;
    }
    return w.close_document();
  }

  std::error_code unmarshal_bson(bytes_view doc) override {
    bson::ValueReader v;
    if (auto ec = bson::lookup(doc, {"body"}, v)) {
      return ec;
    }
    return v.read_string(body_);
  }

  [[nodiscard]] const std::string& body() const noexcept { return body_; }

 private:
  std::string body_;
};

// 单值钩子：等级编码为字符串 "L<n>"。
class Level final : public codec::ValueMarshaler, public codec::ValueUnmarshaler {
 public:
  Level() = default;
  explicit Level(int n) : n_(n) {}

  std::error_code marshal_bson_value(element_type& type, std::vector<byte>& payload) const override {
    const std::string text = "L" + std::to_string(n_);
    const auto len = static_cast<std::uint32_t>(text.size() + 1);
    type = element_type::string;
    payload.clear();
    for (int i = 0; i < 4; ++i) {
      payload.push_back(static_cast<byte>((len >> (8 * i)) & 0xFF));
    }
    payload.insert(payload.end(), text.begin(), text.end());
    payload.push_back(0);
    return {};
  }

  std::error_code unmarshal_bson_value(element_type type, bytes_view payload) override {
    if (type != element_type::string || payload.size() < 7 || payload[4] != 'L') {
      return std::error_code(errc::incompatible_type);
    }
    n_ = 0;
    for (std::size_t i = 5; i + 1 < payload.size(); ++i) {
      n_ = n_ * 10 + (payload[i] - '0');
    }
    return {};
  }

  [[nodiscard]] int n() const noexcept { return n_; }

 private:
  int n_{0};
};

// 自定义零值判定：区间为空即视为零值。
class Window final : public codec::Zeroer {
 public:
  std::int32_t lo{0};
  std::int32_t hi{0};

  Window() = default;
  Window(std::int32_t l, std::int32_t h) : lo(l), hi(h) {}

  [[nodiscard]] bool is_zero() const override { return lo >= hi; }

  static std::vector<reflect::Field> bson_fields() {
    return {reflect::field("Lo", &Window::lo, "lo"), reflect::field("Hi", &Window::hi, "hi")};
  }
};

struct Hooked {
  Envelope envelope;
  Level level;
  Window window;

  static std::vector<reflect::Field> bson_fields() {
    return {
      reflect::field("Envelope", &Hooked::envelope, "env"),
      reflect::field("Level", &Hooked::level, "lvl"),
      reflect::field("Window", &Hooked::window, "win,omitempty"),
    };
  }
};

void test_hooks() {
  const auto r = default_registry();
  std::vector<byte> out;

  Hooked h;
  h.envelope = Envelope("payload");
  h.level = Level(12);
  h.window = Window(3, 3);
  TEST_EXPECT_OK(codec::marshal(r, h, out));

  bson::ValueReader v;
  TEST_EXPECT_OK(bson::lookup(view(out), {"env", "body"}, v));
  std::string s;
  TEST_EXPECT_OK(v.read_string(s));
  TEST_EXPECT_EQ(s, "payload");
  TEST_EXPECT_OK(bson::lookup(view(out), {"lvl"}, v));
  TEST_EXPECT_OK(v.read_string(s));
  TEST_EXPECT_EQ(s, "L12");
  // Zeroer 判定为空：省略。
  TEST_EXPECT_EQ(bson::lookup(view(out), {"win"}, v), std::error_code(bson::errc::key_not_found));

  Hooked back;
  TEST_EXPECT_OK(codec::unmarshal(r, view(out), back));
  TEST_EXPECT_EQ(back.envelope.body(), "payload");
  TEST_EXPECT_EQ(back.level.n(), 12);

  h.window = Window(1, 4);
  TEST_EXPECT_OK(codec::marshal(r, h, out));
  TEST_EXPECT_OK(bson::lookup(view(out), {"win", "hi"}, v));

  // 顶层 Marshaler。
  TEST_EXPECT_OK(codec::marshal(r, Envelope("top"), out));
  Envelope top;
  TEST_EXPECT_OK(codec::unmarshal(r, view(out), top));
  TEST_EXPECT_EQ(top.body(), "top");

  // Unmarshaler 收到非文档值。
  const auto wrong = doc_with([](DocumentWriter& w) { TEST_EXPECT_OK(w.write_int32("env", 1)); });
  TEST_EXPECT_EQ(codec::unmarshal(r, view(wrong), back), std::error_code(errc::incompatible_type));
}

}  // namespace

int main() {
  test_integer_encoding();
  test_integer_decoding();
  test_floats_and_booleans();
  test_strings();
  test_sequences();
  test_pointers();
  test_maps();
  test_time_point();
  test_element_types();
  test_top_level_values();
  test_hooks();
  return ::bsonc::tests::run_and_report();
}
