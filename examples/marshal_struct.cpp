#include <bsonc/codec/default_codecs.hpp>
#include <bsonc/codec/marshal.hpp>
#include <bsonc/codec/registry.hpp>
#include <bsonc/core/log.hpp>
#include <bsonc/utils/document_dump.hpp>
#include <bsonc/utils/hex.hpp>

#include <cstdint>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace bsonc;

namespace {

struct Address {
    std::string city;
    std::string zip;

    static std::vector<reflect::Field> bson_fields() {
        return {
            reflect::field("City", &Address::city),
            reflect::field("Zip", &Address::zip, "zip,omitempty"),
        };
    }
};

struct User {
    std::string name;
    std::int64_t age{0};
    Address address;
    std::map<std::string, std::string> extra;

    static std::vector<reflect::Field> bson_fields() {
        return {
            reflect::field("Name", &User::name),
            reflect::field("Age", &User::age, "age,minsize"),
            reflect::field("Address", &User::address, ",inline"),
            reflect::field("Extra", &User::extra, ",inline"),
        };
    }
};

} // namespace

int main() {
    std::cout << "=== BSON 结构体编解码示例 ===\n\n";

    core::set_log_level(core::LogLevel::debug);

    codec::Registry registry;
    auto ec = codec::new_registry_builder().register_struct<User>().build(registry);
    if (ec) {
        std::cerr << "注册表构建失败: " << ec.message() << "\n";
        return 1;
    }

    User user;
    user.name = "alice";
    user.age = 30;
    user.address = Address{"Berlin", ""};
    user.extra = {{"team", "storage"}};

    std::vector<bson::byte> encoded;
    ec = codec::marshal(registry, user, encoded);
    if (ec) {
        std::cerr << "编码失败: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "编码成功: " << encoded.size() << " 字节\n";
    std::cout << utils::hex_dump(bson::bytes_view{encoded.data(), encoded.size()}) << "\n";
    std::cout << utils::dump_document(bson::bytes_view{encoded.data(), encoded.size()}) << "\n\n";

    User decoded;
    ec = codec::unmarshal(registry, bson::bytes_view{encoded.data(), encoded.size()}, decoded);
    if (ec) {
        std::cerr << "解码失败: " << ec.message() << "\n";
        return 1;
    }

    std::cout << "解码成功: name=" << decoded.name << " age=" << decoded.age
              << " city=" << decoded.address.city
              << " team=" << decoded.extra["team"] << "\n";
    return 0;
}
