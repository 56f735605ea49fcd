// include/logger.hpp

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <format>
#include <functional>
#include <string>
#include <string_view>

namespace stun {

enum class LogLevel { Debug = 0, Info, Warning, Error };

using LogCallback = std::function<void(LogLevel, const std::string &)>;

void set_log_level(LogLevel level);
LogLevel get_log_level();

// 콜백이 설정되면 stdout 대신 콜백으로 전달된다. nullptr 로 해제.
void set_log_callback(LogCallback callback);

std::string log_level_to_string(LogLevel lvl);

namespace detail {
void write_log(LogLevel lvl, const std::string &msg);
}

template <typename... Args>
void log(LogLevel lvl, std::string_view msg_template, const Args &...args) {
    if (static_cast<int>(lvl) < static_cast<int>(get_log_level())) {
        return;
    }
    std::string formatted_msg = std::vformat(msg_template, std::make_format_args(args...));
    detail::write_log(lvl, formatted_msg);
}

}  // namespace stun

#endif  // LOGGER_HPP
