// src/logger.cpp

#include "logger.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace stun {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::Info};
std::mutex g_log_mutex;
LogCallback g_log_callback;

}  // namespace

void set_log_level(LogLevel level) { g_log_level.store(level); }

LogLevel get_log_level() { return g_log_level.load(); }

void set_log_callback(LogCallback callback) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_callback = std::move(callback);
}

std::string log_level_to_string(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warning:
            return "WARNING";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "UNKNOWN";
    }
}

namespace detail {

void write_log(LogLevel lvl, const std::string &msg) {
    LogCallback callback;
    {
        std::lock_guard<std::mutex> lock(g_log_mutex);
        callback = g_log_callback;
    }

    // 콜백은 잠금 밖에서 호출한다 (콜백 안에서 다시 log() 를 불러도 된다)
    if (callback) {
        callback(lvl, msg);
        return;
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cout << "[StunCodec][" << log_level_to_string(lvl) << "] " << msg << std::endl;
}

}  // namespace detail

}  // namespace stun
