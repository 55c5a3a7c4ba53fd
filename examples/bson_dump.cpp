/**
 * @file bson_dump.cpp
 * @brief 把一段十六进制文本解析为 BSON 文档并以可读格式输出
 *
 * 典型用途：从日志或抓包里复制一段十六进制字符串，快速查看文档结构；
 * 输入损坏时会输出已解析的前缀以及出错偏移。
 *
 * 运行：
 * - 无参数：输出一个内置示例文档
 * - ./build/examples/bson_dump "<hex>" [--no-hex] [--no-color] [--single-line]
 */

#include <bsonc/bson/types.hpp>
#include <bsonc/bson/writer.hpp>
#include <bsonc/utils/document_dump.hpp>
#include <bsonc/utils/hex.hpp>

#include <cstdint>
#include <iostream>
#include <string_view>
#include <vector>

using namespace bsonc;

namespace {

[[nodiscard]] bool has_flag(int argc, char **argv, std::string_view flag) {
    for (int i = 0; i < argc; ++i) {
        if (argv[i] == flag) {
            return true;
        }
    }
    return false;
}

void print_usage(const char *argv0) {
    std::cout << "用法:\n";
    std::cout << "  " << argv0 << "\n";
    std::cout << "  " << argv0
              << " \"<hex>\" [--no-hex] [--no-color] [--single-line]\n";
}

int dump_bytes(bson::bytes_view bytes, bool include_hex, bool enable_color,
               bool multiline) {
    if (include_hex) {
        utils::HexDumpOptions hex_opt;
        hex_opt.show_ascii = true;
        std::cout << utils::hex_dump(bytes, hex_opt) << "\n";
    }

    utils::DumpOptions opt;
    opt.enable_color = enable_color;
    opt.multiline = multiline;
    std::cout << utils::dump_document(bytes, opt) << "\n";
    return 0;
}

[[nodiscard]] std::error_code build_demo(std::vector<bson::byte> &out) {
    bson::DocumentWriter w(out);
    const std::vector<bson::byte> blob{0xDE, 0xAD, 0xBE, 0xEF};
    std::error_code ec;
    if ((ec = w.open_document())) return ec;
    if ((ec = w.write_string("name", "sensor-7"))) return ec;
    if ((ec = w.write_int32("count", 3))) return ec;
    if ((ec = w.open_array("values"))) return ec;
    if ((ec = w.write_double("0", 1.5))) return ec;
    if ((ec = w.write_double("1", -2.25))) return ec;
    if ((ec = w.close_document())) return ec;
    if ((ec = w.open_document("meta"))) return ec;
    if ((ec = w.write_boolean("active", true))) return ec;
    if ((ec = w.write_binary("raw", 0x00, bson::bytes_view{blob.data(), blob.size()}))) return ec;
    if ((ec = w.close_document())) return ec;
    return w.close_document();
}

} // namespace

int main(int argc, char **argv) {
    const bool include_hex = !has_flag(argc, argv, "--no-hex");
    const bool enable_color = !has_flag(argc, argv, "--no-color");
    const bool multiline = !has_flag(argc, argv, "--single-line");

    if (argc >= 2 && argv[1][0] != '-') {
        std::vector<bson::byte> bytes;
        const auto ec = utils::parse_hex(argv[1], bytes);
        if (ec) {
            std::cerr << "hex 解析失败: " << ec.message() << "\n";
            print_usage(argv[0]);
            return 2;
        }
        return dump_bytes(bson::bytes_view{bytes.data(), bytes.size()},
                          include_hex, enable_color, multiline);
    }

    if (argc >= 2 && !has_flag(argc, argv, "--no-hex") &&
        !has_flag(argc, argv, "--no-color") &&
        !has_flag(argc, argv, "--single-line")) {
        print_usage(argv[0]);
        return 2;
    }

    std::cout << "=== bsonc 文档 dump 示例 ===\n";
    std::vector<bson::byte> demo;
    if (const auto ec = build_demo(demo); ec) {
        std::cerr << "构造示例文档失败: " << ec.message() << "\n";
        return 1;
    }
    dump_bytes(bson::bytes_view{demo.data(), demo.size()}, include_hex,
               enable_color, multiline);

    std::cout << "\n提示：也可以把十六进制字符串直接传给本程序。\n";
    std::cout << "例如：\n";
    std::cout << "  " << argv[0] << " \"0c000000 10 6100 01000000 00\"\n";
    return 0;
}
