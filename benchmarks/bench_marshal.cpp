#include "bench_main.hpp"
#include "bsonc/bson/reader.hpp"
#include "bsonc/codec/default_codecs.hpp"
#include "bsonc/codec/marshal.hpp"
#include "bsonc/codec/registry.hpp"
#include "bsonc/utils/document_dump.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace bsonc;

namespace {

struct Sample {
  std::int64_t ts{0};
  double value{0};
  std::string unit;

  static std::vector<reflect::Field> bson_fields() {
    return {
      reflect::field("Ts", &Sample::ts, "ts"),
      reflect::field("Value", &Sample::value, "v"),
      reflect::field("Unit", &Sample::unit, "unit,omitempty"),
    };
  }
};

struct Series {
  std::string name;
  std::map<std::string, std::string> labels;
  std::vector<Sample> samples;
  std::optional<std::int32_t> retention;

  static std::vector<reflect::Field> bson_fields() {
    return {
      reflect::field("Name", &Series::name),
      reflect::field("Labels", &Series::labels),
      reflect::field("Samples", &Series::samples),
      reflect::field("Retention", &Series::retention, "retention,omitempty"),
    };
  }
};

Series make_series(std::size_t n) {
  Series s;
  s.name = "cpu.load";
  s.labels = {{"host", "node-1"}, {"dc", "east"}};
  s.samples.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    s.samples.push_back(Sample{static_cast<std::int64_t>(1'700'000'000'000 + i),
                               0.5 * static_cast<double>(i), i % 2 ? "pct" : ""});
  }
  return s;
}

codec::Registry build_registry() {
  codec::Registry registry;
  const auto ec = codec::new_registry_builder().register_struct<Series>().build(registry);
  if (ec) {
    std::cerr << "Registry build failed: " << ec.message() << "\n";
  }
  return registry;
}

void bench_struct_roundtrip(const codec::Registry& registry, std::size_t n) {
  const Series series = make_series(n);
  std::vector<bson::byte> encoded;
  if (auto ec = codec::marshal(registry, series, encoded); ec) {
    std::cerr << "Marshal failed: " << ec.message() << "\n";
    return;
  }
  const auto size = encoded.size();
  const std::string suffix = " (" + std::to_string(n) + " samples)";

  std::vector<bson::byte> out;
  out.reserve(size);
  BENCH_RUN("Codec: marshal struct" + suffix, size, 50, {
    auto ec = codec::marshal(registry, series, out);
    if (ec) {
      std::cerr << "Marshal failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN("Codec: unmarshal struct" + suffix, size, 50, {
    Series decoded;
    auto ec = codec::unmarshal(registry, bson::bytes_view{encoded.data(), encoded.size()}, decoded);
    if (ec) {
      std::cerr << "Unmarshal failed: " << ec.message() << "\n";
    }
  });

  BENCH_RUN("Codec: unmarshal into bson::Document" + suffix, size, 50, {
    bson::Document doc;
    auto ec = codec::unmarshal(registry, bson::bytes_view{encoded.data(), encoded.size()}, doc);
    if (ec) {
      std::cerr << "Unmarshal failed: " << ec.message() << "\n";
    }
  });
}

// 只走读取器：逐个元素跳过，不做任何物化
std::error_code walk(bson::DocumentReader& reader, std::size_t& count) {
  std::optional<bson::ElementHeader> header;
  for (;;) {
    if (auto ec = reader.next(header); ec) {
      return ec;
    }
    if (!header) {
      return {};
    }
    ++count;
    if (header->type == bson::element_type::document || header->type == bson::element_type::array) {
      bson::DocumentReader child;
      if (auto ec = reader.descend_into(child); ec) {
        return ec;
      }
      if (auto ec = walk(child, count); ec) {
        return ec;
      }
    }
  }
}

void bench_reader_walk(const codec::Registry& registry, std::size_t n) {
  std::vector<bson::byte> encoded;
  if (auto ec = codec::marshal(registry, make_series(n), encoded); ec) {
    std::cerr << "Marshal failed: " << ec.message() << "\n";
    return;
  }

  std::size_t elements = 0;
  BENCH_RUN("Reader: walk all elements (" + std::to_string(n) + " samples)", encoded.size(), 50, {
    bson::DocumentReader reader;
    elements = 0;
    auto ec = bson::DocumentReader::open(bson::bytes_view{encoded.data(), encoded.size()}, reader);
    if (!ec) {
      ec = walk(reader, elements);
    }
    if (ec) {
      std::cerr << "Walk failed: " << ec.message() << "\n";
    }
  });
}

void bench_dump(const codec::Registry& registry) {
  std::vector<bson::byte> encoded;
  if (auto ec = codec::marshal(registry, make_series(100), encoded); ec) {
    std::cerr << "Marshal failed: " << ec.message() << "\n";
    return;
  }

  utils::DumpOptions options;
  options.max_elements = 0;
  std::size_t chars = 0;
  BENCH_RUN("Utils: dump_document (100 samples)", encoded.size(), 20, {
    chars = utils::dump_document(bson::bytes_view{encoded.data(), encoded.size()}, options).size();
  });
  (void)chars;
}

}  // namespace

int main() {
  const auto registry = build_registry();

  bench_struct_roundtrip(registry, 10);
  bench_struct_roundtrip(registry, 1000);
  bench_reader_walk(registry, 1000);
  bench_dump(registry);

  benchmarks::print_results();
  return 0;
}
