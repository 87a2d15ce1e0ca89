#pragma once
#include <cstddef>
#include <string>

enum class WbindMode { TRACKED, MONITOR };
enum class WbindHostKind { MALLOC, ARENA };
enum class LogLevel { ERROR = 0, INFO = 1, DEBUG = 2 };

class WbindEnv {
public:
    static WbindEnv& get();

    // Reads the WBIND_* environment variables. get() caches one instance;
    // constructing another re-reads the environment.
    WbindEnv();

    WbindMode get_mode() const { return mode_; }
    LogLevel get_log_level() const { return log_level_; }
    std::string get_log_file() const { return log_file_; }

    WbindHostKind get_host_kind() const { return host_kind_; }
    size_t get_arena_size() const { return arena_size_; }

    // 0 means no limit
    size_t get_heap_limit() const { return heap_limit_; }

    // 0 leaves the Wren default in place
    size_t get_initial_heap_size() const { return initial_heap_size_; }
    size_t get_min_heap_size() const { return min_heap_size_; }
    int get_heap_growth_percent() const { return heap_growth_percent_; }

private:
    WbindMode mode_;
    LogLevel log_level_;
    std::string log_file_;
    WbindHostKind host_kind_;
    size_t arena_size_;
    size_t heap_limit_;
    size_t initial_heap_size_;
    size_t min_heap_size_;
    int heap_growth_percent_;
};
