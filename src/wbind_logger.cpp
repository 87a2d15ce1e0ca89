#include "../include/wbind_logger.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

WbindLogger& WbindLogger::get() noexcept {
    static WbindLogger instance;
    return instance;
}

WbindLogger::~WbindLogger() {
    if (ofs_.is_open()) ofs_.close();
}

void WbindLogger::configure(const WbindEnv& env) noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    try {
        std::string file = env.get_log_file();
        if (file != file_ && ofs_.is_open()) ofs_.close();
        file_ = file;
    } catch (const std::exception&) {
        dropped_++;
    }
    level_.store(static_cast<int>(env.get_log_level()));
}

void WbindLogger::load_from_env() noexcept {
    std::lock_guard<std::mutex> lock(mtx_);
    if (level_.load() >= 0) return;
    try {
        const WbindEnv& env = WbindEnv::get();
        file_ = env.get_log_file();
        level_.store(static_cast<int>(env.get_log_level()));
    } catch (const std::exception&) {
        // Malformed WBIND_* values are reported by whoever loads the config
        file_.clear();
        level_.store(static_cast<int>(LogLevel::ERROR));
    }
}

bool WbindLogger::enabled(LogLevel level) noexcept {
    if (level_.load() < 0) load_from_env();
    return static_cast<int>(level) <= level_.load();
}

void WbindLogger::log(LogLevel level, const char* action, const void* ptr, size_t size, const std::string& extra) noexcept {
    if (!enabled(level)) return;

    std::lock_guard<std::mutex> lock(mtx_);
    try {
        if (!ofs_.is_open() && !file_.empty()) {
            ofs_.open(file_, std::ios::out | std::ios::app);
        }
        std::ostream& out = ofs_.is_open() ? ofs_ : std::cerr;

        auto now = std::chrono::system_clock::now();
        std::time_t t_c = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm local = {};
        localtime_r(&t_c, &local);

        // [TIME] [LEVEL] [ACTION] Ptr=... Size=... Extra
        out << "[" << std::put_time(&local, "%H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ') << "] "
            << "[" << level_tag(level) << "] "
            << "[" << action << "] "
            << "Ptr=" << ptr << " "
            << "Size=" << size;

        if (!extra.empty()) out << " " << extra;
        out << std::endl;
        if (!out) {
            out.clear();
            dropped_++;
        }
    } catch (const std::exception&) {
        dropped_++;
    }
}

const char* WbindLogger::level_tag(LogLevel l) noexcept {
    switch (l) {
        case LogLevel::ERROR: return "ERR";
        case LogLevel::INFO:  return "INF";
        case LogLevel::DEBUG: return "DBG";
    }
    return "UNK";
}
