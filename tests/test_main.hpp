#pragma once

#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>

namespace bsonc::tests {

struct Stats {
  int checks{0};
  int failures{0};
};

inline Stats& stats() {
  static Stats s;
  return s;
}

inline void record_failure(const char* file, int line, std::string_view message) {
  ++stats().failures;
  std::cerr << file << ":" << line << ": " << message << "\n";
}

template <class T>
concept Printable = requires(std::ostream& os, const T& v) { os << v; };

// 能输出的值直接打印；error_code 打印 [category] message；其余只给出表达式。
template <class T>
void describe(std::ostream& os, const T& v) {
  if constexpr (std::is_same_v<T, std::error_code>) {
    os << "[" << v.category().name() << "] " << v.message();
  } else if constexpr (std::is_enum_v<T>) {
    os << static_cast<long long>(static_cast<std::underlying_type_t<T>>(v));
  } else if constexpr (std::is_same_v<T, unsigned char> || std::is_same_v<T, signed char>) {
    os << static_cast<int>(v);
  } else if constexpr (Printable<T>) {
    os << v;
  } else {
    os << "<?>";
  }
}

inline void expect_true(bool value, const char* expr, const char* file, int line) {
  ++stats().checks;
  if (value) {
    return;
  }
  record_failure(file, line, std::string("EXPECT failed: ") + expr);
}

template <class L, class R>
void expect_eq(const L& lhs, const R& rhs, const char* lhs_expr, const char* rhs_expr, const char* file, int line) {
  ++stats().checks;
  if (lhs == rhs) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_EQ failed: (" << lhs_expr << ") != (" << rhs_expr << ")\n  lhs: ";
  describe(oss, lhs);
  oss << "\n  rhs: ";
  describe(oss, rhs);
  record_failure(file, line, oss.str());
}

inline void expect_ok(const std::error_code& ec, const char* expr, const char* file, int line) {
  ++stats().checks;
  if (!ec) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_OK failed: " << expr << " -> ";
  describe(oss, ec);
  record_failure(file, line, oss.str());
}

// 期望得到某个具体错误码（任意模块的 errc 枚举均可）。
template <class E>
void expect_err(const std::error_code& ec, E expected, const char* expr, const char* file, int line) {
  ++stats().checks;
  const std::error_code want(expected);
  if (ec == want) {
    return;
  }
  std::ostringstream oss;
  oss << "EXPECT_ERR failed: " << expr << "\n  got:  ";
  describe(oss, ec);
  oss << "\n  want: ";
  describe(oss, want);
  record_failure(file, line, oss.str());
}

inline int run_and_report() {
  const auto& s = stats();
  if (s.failures == 0) {
    std::cerr << "OK: " << s.checks << " checks\n";
    return 0;
  }
  std::cerr << "FAILED: " << s.failures << " of " << s.checks << " checks\n";
  return 1;
}

}  // namespace bsonc::tests

#define TEST_EXPECT(expr) ::bsonc::tests::expect_true(static_cast<bool>(expr), #expr, __FILE__, __LINE__)
#define TEST_EXPECT_EQ(a, b) ::bsonc::tests::expect_eq((a), (b), #a, #b, __FILE__, __LINE__)
#define TEST_EXPECT_OK(...) ::bsonc::tests::expect_ok((__VA_ARGS__), #__VA_ARGS__, __FILE__, __LINE__)
#define TEST_EXPECT_ERR(ec, code) ::bsonc::tests::expect_err((ec), (code), #ec, __FILE__, __LINE__)
#define TEST_FAIL(msg) ::bsonc::tests::record_failure(__FILE__, __LINE__, (msg))
