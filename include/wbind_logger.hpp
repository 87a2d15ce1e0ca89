#pragma once
#include "wbind_env.hpp"
#include <atomic>
#include <cstddef>
#include <exception>
#include <fstream>
#include <mutex>
#include <string>

// Process-wide log sink. Reachable from inside the VM's reallocate callback,
// so nothing here may throw.
class WbindLogger {
public:
    static WbindLogger& get() noexcept;

    // Takes level and file from env. Without this, the first log call pulls
    // them from WbindEnv::get(), falling back to ERROR on stderr if the
    // environment cannot be parsed.
    void configure(const WbindEnv& env) noexcept;

    bool enabled(LogLevel level) noexcept;

    void log(LogLevel level, const char* action, const void* ptr, size_t size, const std::string& extra) noexcept;

    // Lines lost to formatting or I/O failures
    size_t dropped() const noexcept { return dropped_.load(); }
    void drop() noexcept { dropped_++; }

private:
    WbindLogger() = default;
    ~WbindLogger();
    WbindLogger(const WbindLogger&) = delete;
    WbindLogger& operator=(const WbindLogger&) = delete;

    void load_from_env() noexcept;
    static const char* level_tag(LogLevel l) noexcept;

    // -1 until configured
    std::atomic<int> level_{-1};
    std::string file_;
    std::ofstream ofs_;
    std::mutex mtx_;
    std::atomic<size_t> dropped_{0};
};

// msg is only built when the level is on; a failure while building it
// counts as a dropped line.
#define WBIND_LOG(level, action, ptr, size, msg) \
    do { \
        WbindLogger& wbind_logger_ = WbindLogger::get(); \
        if (wbind_logger_.enabled(level)) { \
            try { \
                wbind_logger_.log(level, action, ptr, size, msg); \
            } catch (const std::exception&) { \
                wbind_logger_.drop(); \
            } \
        } \
    } while (0)

#define WBIND_LOG_ERR(action, ptr, size, msg) WBIND_LOG(LogLevel::ERROR, action, ptr, size, msg)
#define WBIND_LOG_INFO(action, ptr, size, msg) WBIND_LOG(LogLevel::INFO, action, ptr, size, msg)
#define WBIND_LOG_DBG(action, ptr, size, msg) WBIND_LOG(LogLevel::DEBUG, action, ptr, size, msg)
