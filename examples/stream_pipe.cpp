/**
 * @file stream_pipe.cpp
 * @brief 通过 stdin/stdout 传输连续的 BSON 文档流。
 *
 * 用法：
 *   ./stream_pipe produce [count] | ./stream_pipe consume
 *
 * 说明：
 * - produce：把 count 条 Reading 编码为文档，依次写到 stdout；
 * - consume：从 stdin 逐篇读出文档，解码为 Reading 并打印；单篇解码失败时跳过该篇继续；
 * - stdout 只承载二进制文档，日志全部输出到 stderr；
 * - 环境变量 BSONC_LOG_LEVEL（如 debug）调整库内日志级别。
 */

#include "bsonc/codec/default_codecs.hpp"
#include "bsonc/codec/error.hpp"
#include "bsonc/codec/registry.hpp"
#include "bsonc/core/log.hpp"
#include "bsonc/io/decoder.hpp"
#include "bsonc/io/encoder.hpp"
#include "bsonc/io/error.hpp"
#include "bsonc/io/stream.hpp"

#include <asio/io_context.hpp>
#include <asio/posix/stream_descriptor.hpp>

#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

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
};

int produce(asio::io_context &ioc, const codec::Registry &registry, int count) {
    io::DescriptorStream out(asio::posix::stream_descriptor(ioc, ::dup(STDOUT_FILENO)));
    io::Encoder encoder(out, registry);

    for (int i = 0; i < count; ++i) {
        const Reading r{"sensor-" + std::to_string(i % 3), 20.0 + 0.5 * i, i};
        const auto ec = encoder.encode(r);
        if (ec) {
            std::cerr << "[produce] encode 失败: " << ec.message() << "\n";
            return 1;
        }
    }
    std::cerr << "[produce] 写出 " << encoder.documents_written() << " 篇文档\n";
    return 0;
}

int consume(asio::io_context &ioc, const codec::Registry &registry) {
    io::DescriptorStream in(asio::posix::stream_descriptor(ioc, ::dup(STDIN_FILENO)));
    io::Decoder decoder(in, registry);

    std::size_t failed = 0;
    for (;;) {
        Reading r;
        const auto ec = decoder.decode(r);
        if (ec == io::errc::end_of_stream) {
            break;
        }
        // codec 层错误只影响当前这一篇，分帧仍然完好
        if (ec && ec.category() == codec::error_category()) {
            std::cerr << "[consume] 跳过一篇文档: " << ec.message() << "\n";
            ++failed;
            continue;
        }
        if (ec) {
            std::cerr << "[consume] 读取失败: " << ec.message() << "\n";
            return 1;
        }
        std::cerr << "[consume] #" << r.seq << " " << r.sensor << " = " << r.value
                  << "\n";
    }
    std::cerr << "[consume] 读取 " << decoder.documents_read() << " 篇，失败 "
              << failed << " 篇\n";
    return 0;
}

} // namespace

int main(int argc, char **argv) {
    if (argc < 2) {
        std::cerr << "用法: " << argv[0] << " produce [count] | " << argv[0]
                  << " consume\n";
        return 2;
    }

    if (const char *env = std::getenv("BSONC_LOG_LEVEL"); env != nullptr) {
        bsonc::core::LogLevel level{};
        if (bsonc::core::parse_log_level(env, level)) {
            std::cerr << "忽略无法识别的 BSONC_LOG_LEVEL: " << env << "\n";
        } else {
            bsonc::core::set_log_level(level);
        }
    }

    codec::Registry registry;
    if (const auto ec =
            codec::new_registry_builder().register_struct<Reading>().build(registry);
        ec) {
        std::cerr << "注册表构建失败: " << ec.message() << "\n";
        return 1;
    }

    asio::io_context ioc;
    const std::string_view mode = argv[1];
    if (mode == "produce") {
        const int count = argc >= 3 ? std::atoi(argv[2]) : 5;
        return produce(ioc, registry, count);
    }
    if (mode == "consume") {
        return consume(ioc, registry);
    }

    std::cerr << "未知模式: " << mode << "\n";
    return 2;
}
