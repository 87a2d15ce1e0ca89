#include "../include/wbind_env.hpp"
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

static const size_t kMegabyte = 1024 * 1024;

// stoull accepts "-1" and wraps it, so the sign is checked first.
static unsigned long long env_unsigned(const char* name, const char* v) {
    std::string s(v);
    if (s.find('-') != std::string::npos) {
        throw std::out_of_range(std::string(name) + " must not be negative: " + s);
    }
    return std::stoull(s);
}

static size_t env_megabytes(const char* name, size_t fallback) {
    const char* v = std::getenv(name);
    if (!v) return fallback;
    unsigned long long mb = env_unsigned(name, v);
    if (mb > SIZE_MAX / kMegabyte) {
        throw std::out_of_range(std::string(name) + " is too large: " + v);
    }
    return static_cast<size_t>(mb) * kMegabyte;
}

WbindEnv& WbindEnv::get() {
    static WbindEnv instance;
    return instance;
}

WbindEnv::WbindEnv() {
    // Mode
    const char* mode = std::getenv("WBIND_MODE");
    mode_ = (mode && std::string(mode) == "MONITOR") ? WbindMode::MONITOR : WbindMode::TRACKED;

    // Log Level
    const char* lvl = std::getenv("WBIND_LOG_LEVEL");
    log_level_ = LogLevel::ERROR;
    if (lvl) {
        std::string s(lvl);
        if (s == "INFO") log_level_ = LogLevel::INFO;
        else if (s == "DEBUG") log_level_ = LogLevel::DEBUG;
    }

    // Log File
    const char* file = std::getenv("WBIND_LOG_FILE");
    log_file_ = file ? std::string(file) : "";

    // Host allocator backing the tracked heap
    const char* host = std::getenv("WBIND_HOST");
    host_kind_ = (host && std::string(host) == "ARENA") ? WbindHostKind::ARENA : WbindHostKind::MALLOC;

    // Arena Size (Default: 64MB)
    arena_size_ = env_megabytes("WBIND_ARENA_SIZE_MB", 64 * kMegabyte);

    heap_limit_ = env_megabytes("WBIND_HEAP_LIMIT_MB", 0);

    // Wren GC tuning, passed through to WrenConfiguration
    initial_heap_size_ = env_megabytes("WBIND_INITIAL_HEAP_MB", 0);
    min_heap_size_ = env_megabytes("WBIND_MIN_HEAP_MB", 0);
    const char* growth = std::getenv("WBIND_HEAP_GROWTH_PCT");
    heap_growth_percent_ = 0;
    if (growth) {
        unsigned long long pct = env_unsigned("WBIND_HEAP_GROWTH_PCT", growth);
        if (pct > static_cast<unsigned long long>(std::numeric_limits<int>::max())) {
            throw std::out_of_range(std::string("WBIND_HEAP_GROWTH_PCT is too large: ") + growth);
        }
        heap_growth_percent_ = static_cast<int>(pct);
    }
}
