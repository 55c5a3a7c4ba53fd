#include "bsonc/utils/document_dump.hpp"

#include "bsonc/bson/reader.hpp"
#include "bsonc/bson/types.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string_view>

namespace bsonc::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *type = "\033[1;35m";
    static constexpr const char *key = "\033[1;36m";
    static constexpr const char *string = "\033[1;32m";
    static constexpr const char *value = "\033[1;33m";
    static constexpr const char *dim = "\033[2m";
    static constexpr const char *error = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

struct DumpContext final {
    std::ostringstream oss;
    DumpOptions options{};
};

[[nodiscard]] std::string indent_(std::size_t depth, std::size_t spaces) {
    return std::string(depth * spaces, ' ');
}

void append_escaped_(DumpContext &ctx, std::string_view s) {
    const auto &opt = ctx.options;
    const auto *reset = ansi_(opt.enable_color, Ansi::reset);
    const auto *string = ansi_(opt.enable_color, Ansi::string);

    const std::size_t total = s.size();
    const std::size_t n =
        (opt.max_payload_bytes == 0 ? total
                                    : std::min(total, opt.max_payload_bytes));

    ctx.oss << string << '"';
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c == '\\') {
            ctx.oss << "\\\\";
        } else if (c == '"') {
            ctx.oss << "\\\"";
        } else if (c >= 0x20 && c <= 0x7E) {
            ctx.oss << static_cast<char>(c);
        } else {
            // 非可打印字符（包括 UTF-8 多字节序列）：\xHH。
            ctx.oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                    << static_cast<int>(c) << std::dec;
        }
    }
    if (opt.max_payload_bytes != 0 && total > opt.max_payload_bytes) {
        ctx.oss << "...";
    }
    ctx.oss << '"' << reset;
}

void append_bytes_(DumpContext &ctx, bsonc::core::bytes_view bytes) {
    const auto &opt = ctx.options;
    const auto *reset = ansi_(opt.enable_color, Ansi::reset);
    const auto *value = ansi_(opt.enable_color, Ansi::value);
    const auto *dim = ansi_(opt.enable_color, Ansi::dim);

    const std::size_t total = bytes.size();
    const std::size_t n =
        (opt.max_payload_bytes == 0 ? total
                                    : std::min(total, opt.max_payload_bytes));
    ctx.oss << value;
    for (std::size_t i = 0; i < n; ++i) {
        ctx.oss << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(bytes[i]) << std::dec;
    }
    ctx.oss << reset;
    if (opt.max_payload_bytes != 0 && total > opt.max_payload_bytes) {
        ctx.oss << ' ' << dim << "..." << reset;
    }
}

void append_error_(DumpContext &ctx, const std::error_code &ec, std::size_t offset) {
    const auto *reset = ansi_(ctx.options.enable_color, Ansi::reset);
    const auto *error = ansi_(ctx.options.enable_color, Ansi::error);
    ctx.oss << error << "<error: " << ec.message() << " at offset " << offset
            << '>' << reset;
}

void append_document_(DumpContext &ctx,
                      bsonc::bson::DocumentReader &reader,
                      bool array,
                      std::size_t depth);

void append_value_(DumpContext &ctx,
                   const bsonc::bson::ValueReader &r,
                   std::size_t depth) {
    using bsonc::bson::element_type;

    const bool color = ctx.options.enable_color;
    const auto *reset = ansi_(color, Ansi::reset);
    const auto *type = ansi_(color, Ansi::type);
    const auto *value = ansi_(color, Ansi::value);

    std::error_code ec;
    switch (r.type()) {
    case element_type::document:
    case element_type::array: {
        bsonc::bson::DocumentReader child;
        ec = r.read_document(child);
        if (!ec) {
            append_document_(ctx, child, r.type() == element_type::array, depth + 1);
        }
        break;
    }
    case element_type::double_: {
        double d = 0;
        ec = r.read_double(d);
        ctx.oss << type << "double " << reset << value << std::setprecision(17)
                << d << reset;
        break;
    }
    case element_type::string:
    case element_type::javascript:
    case element_type::symbol: {
        std::string_view s;
        ec = r.read_string_view(s);
        ctx.oss << type << bsonc::bson::to_string(r.type()) << ' ' << reset;
        append_escaped_(ctx, s);
        break;
    }
    case element_type::binary: {
        std::uint8_t subtype = 0;
        bsonc::core::bytes_view data;
        ec = r.read_binary_view(subtype, data);
        ctx.oss << type << "binary(" << static_cast<int>(subtype) << ")["
                << data.size() << "] " << reset;
        append_bytes_(ctx, data);
        break;
    }
    case element_type::object_id: {
        bsonc::bson::ObjectId oid;
        ec = r.read_object_id(oid);
        ctx.oss << type << "ObjectId " << reset << value << oid.to_hex() << reset;
        break;
    }
    case element_type::boolean: {
        bool b = false;
        ec = r.read_boolean(b);
        ctx.oss << type << "bool " << reset << value << (b ? "true" : "false")
                << reset;
        break;
    }
    case element_type::datetime: {
        std::int64_t millis = 0;
        ec = r.read_datetime(millis);
        ctx.oss << type << "datetime " << reset << value << millis << reset;
        break;
    }
    case element_type::regex: {
        bsonc::bson::Regex re;
        ec = r.read_regex(re);
        ctx.oss << type << "regex " << reset << value << '/' << re.pattern << '/'
                << re.options << reset;
        break;
    }
    case element_type::dbpointer: {
        bsonc::bson::DBPointer p;
        ec = r.read_dbpointer(p);
        ctx.oss << type << "dbpointer " << reset;
        append_escaped_(ctx, p.ns);
        ctx.oss << ' ' << value << p.id.to_hex() << reset;
        break;
    }
    case element_type::code_with_scope: {
        std::string code;
        bsonc::core::bytes_view scope;
        ec = r.read_code_with_scope(code, scope);
        ctx.oss << type << "code_with_scope " << reset;
        append_escaped_(ctx, code);
        if (!ec) {
            bsonc::bson::DocumentReader child;
            ec = bsonc::bson::DocumentReader::open(scope, r.offset(), r.depth() + 1,
                                                  child);
            if (!ec) {
                ctx.oss << ' ';
                append_document_(ctx, child, false, depth + 1);
            }
        }
        break;
    }
    case element_type::int32: {
        std::int32_t i = 0;
        ec = r.read_int32(i);
        ctx.oss << type << "int32 " << reset << value << i << reset;
        break;
    }
    case element_type::timestamp: {
        bsonc::bson::Timestamp ts;
        ec = r.read_timestamp(ts);
        ctx.oss << type << "timestamp " << reset << value << ts.t << ':' << ts.i
                << reset;
        break;
    }
    case element_type::int64: {
        std::int64_t i = 0;
        ec = r.read_int64(i);
        ctx.oss << type << "int64 " << reset << value << i << reset;
        break;
    }
    case element_type::decimal128: {
        bsonc::bson::Decimal128 d;
        ec = r.read_decimal128(d);
        ctx.oss << type << "decimal128 " << reset << value << std::hex
                << std::setw(16) << std::setfill('0') << d.high << std::setw(16)
                << d.low << std::dec << reset;
        break;
    }
    default:
        // undefined / null / min_key / max_key：没有 payload。
        ctx.oss << type << bsonc::bson::to_string(r.type()) << reset;
        break;
    }
    if (ec) {
        ctx.oss << ' ';
        append_error_(ctx, ec, r.offset());
    }
}

void append_document_(DumpContext &ctx,
                      bsonc::bson::DocumentReader &reader,
                      bool array,
                      std::size_t depth) {
    const auto &opt = ctx.options;
    const bool color = opt.enable_color;
    const auto *reset = ansi_(color, Ansi::reset);
    const auto *key_color = ansi_(color, Ansi::key);
    const auto *dim = ansi_(color, Ansi::dim);
    const char open = array ? '[' : '{';
    const char close = array ? ']' : '}';

    if (depth > opt.max_depth) {
        ctx.oss << open << ' ' << dim << "..." << reset << ' ' << close;
        return;
    }

    ctx.oss << open;
    std::size_t count = 0;
    std::optional<bsonc::bson::ElementHeader> header;
    for (;;) {
        auto ec = reader.next(header);
        if (ec) {
            ctx.oss << (opt.multiline ? "\n" + indent_(depth + 1, opt.indent_spaces)
                                      : std::string(" "));
            append_error_(ctx, ec, reader.offset());
            break;
        }
        if (!header) {
            break;
        }
        if (opt.max_elements != 0 && count == opt.max_elements) {
            ctx.oss << (opt.multiline ? "\n" + indent_(depth + 1, opt.indent_spaces)
                                      : std::string(" "))
                    << dim << "..." << reset;
            break;
        }
        if (count != 0) {
            ctx.oss << ',';
        }
        if (opt.multiline) {
            ctx.oss << '\n' << indent_(depth + 1, opt.indent_spaces);
        } else {
            ctx.oss << ' ';
        }
        if (!array) {
            ctx.oss << key_color << '"' << header->key << '"' << reset << ": ";
        }

        bsonc::bson::ValueReader vr;
        ec = reader.value_reader(vr);
        if (ec) {
            append_error_(ctx, ec, header->offset);
            break;
        }
        append_value_(ctx, vr, depth);
        ++count;
    }
    if (count != 0) {
        if (opt.multiline) {
            ctx.oss << '\n' << indent_(depth, opt.indent_spaces);
        } else {
            ctx.oss << ' ';
        }
    }
    ctx.oss << close;
}

} // namespace

std::string dump_document(bsonc::core::bytes_view doc, DumpOptions options) {
    DumpContext ctx;
    ctx.options = options;

    bsonc::bson::DocumentReader reader;
    auto ec = bsonc::bson::DocumentReader::open(doc, reader);
    if (ec) {
        append_error_(ctx, ec, 0);
        return ctx.oss.str();
    }
    append_document_(ctx, reader, false, 0);
    return ctx.oss.str();
}

} // namespace bsonc::utils
