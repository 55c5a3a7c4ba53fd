#include "bsonc/bson/error.hpp"
#include "bsonc/codec/default_codecs.hpp"
#include "bsonc/core/error.hpp"
#include "bsonc/io/decoder.hpp"
#include "bsonc/io/encoder.hpp"
#include "bsonc/io/error.hpp"
#include "bsonc/io/stream.hpp"
#include "bsonc/utils/hex.hpp"

#include "test_main.hpp"

#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace {

using bsonc::core::byte;
using bsonc::core::bytes_view;
using bsonc::io::Decoder;
using bsonc::io::DecoderOptions;
using bsonc::io::Encoder;
using bsonc::io::MemoryStream;

namespace bson = bsonc::bson;
namespace codec = bsonc::codec;
namespace io = bsonc::io;
namespace reflect = bsonc::reflect;

struct Reading {
    std::string sensor;
    double value{0};
    std::int64_t seq{0};

    static std::vector<reflect::Field> bson_fields() {
        return {
            reflect::field("Sensor", &Reading::sensor),
            reflect::field("Value", &Reading::value),
            reflect::field("Seq", &Reading::seq),
        };
    }

    friend bool operator==(const Reading &, const Reading &) = default;
};

codec::Registry default_registry() {
    codec::Registry r;
    TEST_EXPECT_OK(codec::new_registry_builder().register_struct<Reading>().build(r));
    return r;
}

std::vector<byte> hex(std::string_view text) {
    std::vector<byte> out;
    TEST_EXPECT_OK(bsonc::utils::parse_hex(text, out));
    return out;
}

// 每次最多返回 1 字节，模拟被拆得很碎的传输。
class TrickleStream final : public bsonc::io::Stream {
public:
    explicit TrickleStream(std::vector<byte> data) : inner_(std::move(data)) {}

    [[nodiscard]] bool is_open() const noexcept override { return inner_.is_open(); }
    void close() noexcept override { inner_.close(); }

    std::error_code read_some(bsonc::core::mutable_bytes_view dst, std::size_t &n) override {
        return inner_.read_some(dst.first(std::min<std::size_t>(dst.size(), 1)), n);
    }
    std::error_code write_all(bytes_view src) override { return inner_.write_all(src); }

private:
    MemoryStream inner_;
};

void test_memory_stream_roundtrip() {
    const auto registry = default_registry();
    const std::vector<Reading> readings{{"t1", 20.5, 1}, {"t2", -3.0, 2}, {"", 0, 3}};

    MemoryStream out;
    Encoder encoder(out, registry);
    for (const auto &r : readings) {
        TEST_EXPECT_OK(encoder.encode(r));
    }
    TEST_EXPECT_EQ(encoder.documents_written(), std::size_t{3});

    MemoryStream in(out.output());
    Decoder decoder(in, registry);
    for (const auto &expected : readings) {
        Reading got;
        TEST_EXPECT_OK(decoder.decode(got));
        TEST_EXPECT(got == expected);
    }
    Reading extra;
    TEST_EXPECT_ERR(decoder.decode(extra), io::errc::end_of_stream);
    TEST_EXPECT_EQ(decoder.documents_read(), std::size_t{3});
    TEST_EXPECT_EQ(in.remaining(), std::size_t{0});
}

void test_encoder_failure_writes_nothing() {
    const auto registry = default_registry();
    MemoryStream out;
    Encoder encoder(out, registry);

    const std::int32_t scalar = 1;
    TEST_EXPECT_ERR(encoder.encode(scalar), bson::errc::not_a_document);
    TEST_EXPECT(out.output().empty());
    TEST_EXPECT_EQ(encoder.documents_written(), std::size_t{0});

    out.close();
    TEST_EXPECT_ERR(encoder.encode(Reading{"x", 1, 1}),
                    bsonc::core::errc::invalid_argument);
}

void test_framing_errors() {
    const auto registry = default_registry();
    Reading r;

    {
        // 长度前缀只有 2 字节。
        MemoryStream in(hex("0c00"));
        Decoder decoder(in, registry);
        TEST_EXPECT_ERR(decoder.decode(r), bson::errc::truncated);
    }
    {
        // 文档中途结束。
        MemoryStream in(hex("0c000000 10 61"));
        Decoder decoder(in, registry);
        TEST_EXPECT_ERR(decoder.decode(r), bson::errc::truncated);
    }
    {
        MemoryStream in(hex("04000000 00"));
        Decoder decoder(in, registry);
        TEST_EXPECT_ERR(decoder.decode(r), bson::errc::malformed_document);
    }
    {
        // 长度前缀按 int32 解释为负数：格式错误，即使上限放得再宽。
        DecoderOptions options;
        options.max_document_size = static_cast<std::size_t>(1) << 40U;
        MemoryStream in(hex("00000080 00"));
        Decoder decoder(in, registry, options);
        TEST_EXPECT_ERR(decoder.decode(r), bson::errc::malformed_document);

        MemoryStream in_default(hex("ffffffff 00"));
        Decoder decoder_default(in_default, registry);
        TEST_EXPECT_ERR(decoder_default.decode(r), bson::errc::malformed_document);
    }
    {
        DecoderOptions options;
        options.max_document_size = 8;
        MemoryStream in(hex("0c000000 10 6100 01000000 00"));
        Decoder decoder(in, registry, options);
        TEST_EXPECT_ERR(decoder.decode(r), io::errc::document_too_large);
    }
    {
        // 空流：直接结束。
        MemoryStream in;
        Decoder decoder(in, registry);
        TEST_EXPECT_ERR(decoder.decode(r), io::errc::end_of_stream);
    }
}

void test_decode_error_keeps_framing() {
    const auto registry = default_registry();

    // 第一篇 sensor 为 int32（类型不符），第二篇正常。
    MemoryStream in(hex("11000000 10 73656e736f7200 01000000 00"
                        "14000000 02 73656e736f7200 03000000 6f6b00 00"));
    Decoder decoder(in, registry);

    Reading r;
    TEST_EXPECT_ERR(decoder.decode(r), codec::errc::incompatible_type);
    TEST_EXPECT_OK(decoder.decode(r));
    TEST_EXPECT_EQ(r.sensor, "ok");
    TEST_EXPECT_EQ(decoder.documents_read(), std::size_t{1});
}

void test_strict_decoder_options() {
    const auto registry = default_registry();
    const auto doc = hex("0c000000 10 7a00 01000000 00");

    MemoryStream lenient_in(doc);
    Decoder lenient(lenient_in, registry);
    Reading r;
    TEST_EXPECT_OK(lenient.decode(r));

    DecoderOptions options;
    options.decode.strict = true;
    MemoryStream strict_in(doc);
    Decoder strict(strict_in, registry, options);
    TEST_EXPECT_ERR(strict.decode(r), codec::errc::unknown_field);
}

void test_read_document_and_trickle() {
    const auto registry = default_registry();

    MemoryStream out;
    Encoder encoder(out, registry);
    TEST_EXPECT_OK(encoder.encode(Reading{"slow", 1.25, 42}));

    TrickleStream in(out.output());
    Decoder decoder(in, registry);
    std::vector<byte> raw;
    TEST_EXPECT_OK(decoder.read_document(raw));
    TEST_EXPECT_EQ(raw, out.output());
    TEST_EXPECT_ERR(decoder.read_document(raw), io::errc::end_of_stream);
}

void test_pipe_descriptor_stream() {
    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0) {
        TEST_FAIL("pipe() 失败");
        return;
    }

    asio::io_context ioc;
    const auto registry = default_registry();

    {
        io::DescriptorStream writer(asio::posix::stream_descriptor(ioc, fds[1]));
        Encoder encoder(writer, registry);
        TEST_EXPECT_OK(encoder.encode(Reading{"pipe", 1.0, 1}));
        TEST_EXPECT_OK(encoder.encode(Reading{"pipe", 2.0, 2}));
        // 析构时关闭写端，读端随后读到 EOF。
    }

    io::DescriptorStream reader(asio::posix::stream_descriptor(ioc, fds[0]));
    TEST_EXPECT(reader.is_open());
    Decoder decoder(reader, registry);
    Reading r;
    TEST_EXPECT_OK(decoder.decode(r));
    TEST_EXPECT(r == (Reading{"pipe", 1.0, 1}));
    TEST_EXPECT_OK(decoder.decode(r));
    TEST_EXPECT_EQ(r.seq, std::int64_t{2});
    TEST_EXPECT_ERR(decoder.decode(r), io::errc::end_of_stream);

    reader.close();
    TEST_EXPECT(!reader.is_open());
}

} // namespace

int main() {
    test_memory_stream_roundtrip();
    test_encoder_failure_writes_nothing();
    test_framing_errors();
    test_decode_error_keeps_framing();
    test_strict_decoder_options();
    test_read_document_and_trickle();
    test_pipe_descriptor_stream();
    return ::bsonc::tests::run_and_report();
}
