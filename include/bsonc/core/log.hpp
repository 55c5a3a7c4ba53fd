#pragma once

#include <cstdint>
#include <string_view>
#include <system_error>

namespace bsonc::core {

/**
 * @brief 日志级别（控制库内 spdlog 诊断日志）。
 *
 * 说明：
 * - 库内部通过 spdlog 默认 logger 输出，public headers 不暴露 spdlog 类型；
 * - 注册表构建、查找失败、标签冲突、流分帧错误只在 debug 级别记录；
 * - sink 与格式由使用方自行配置，这里只管全局级别。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

// 级别名：trace/debug/info/warn/error/critical/off
[[nodiscard]] std::string_view to_string(LogLevel level) noexcept;

/**
 * @brief 解析级别名（大小写不敏感，另接受 "warning"）。
 *
 * 无法识别时返回 errc::invalid_argument，out 保持不变。
 */
std::error_code parse_log_level(std::string_view text, LogLevel &out) noexcept;

} // namespace bsonc::core
