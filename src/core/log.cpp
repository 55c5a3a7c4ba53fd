#include "bsonc/core/log.hpp"

#include "bsonc/core/error.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cctype>

namespace bsonc::core {
namespace {

struct LevelEntry {
    LogLevel level;
    spdlog::level::level_enum spd;
    std::string_view name;
};

constexpr std::array<LevelEntry, 7> kLevels{{
    {LogLevel::trace, spdlog::level::trace, "trace"},
    {LogLevel::debug, spdlog::level::debug, "debug"},
    {LogLevel::info, spdlog::level::info, "info"},
    {LogLevel::warn, spdlog::level::warn, "warn"},
    {LogLevel::error, spdlog::level::err, "error"},
    {LogLevel::critical, spdlog::level::critical, "critical"},
    {LogLevel::off, spdlog::level::off, "off"},
}};

[[nodiscard]] bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::tolower(ca) != std::tolower(cb)) {
            return false;
        }
    }
    return true;
}

} // namespace

void set_log_level(LogLevel level) noexcept {
    for (const auto &e : kLevels) {
        if (e.level == level) {
            spdlog::set_level(e.spd);
            return;
        }
    }
    spdlog::set_level(spdlog::level::off);
}

LogLevel log_level() noexcept {
    const auto current = spdlog::get_level();
    for (const auto &e : kLevels) {
        if (e.spd == current) {
            return e.level;
        }
    }
    return LogLevel::off;
}

std::string_view to_string(LogLevel level) noexcept {
    for (const auto &e : kLevels) {
        if (e.level == level) {
            return e.name;
        }
    }
    return "off";
}

std::error_code parse_log_level(std::string_view text, LogLevel &out) noexcept {
    if (iequals(text, "warning")) {
        out = LogLevel::warn;
        return {};
    }
    for (const auto &e : kLevels) {
        if (iequals(text, e.name)) {
            out = e.level;
            return {};
        }
    }
    return make_error_code(errc::invalid_argument);
}

} // namespace bsonc::core
