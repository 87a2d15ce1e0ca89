#pragma once
#include "wbind_host.hpp"
#include "wbind_tracker.hpp"
#include <cstddef>

// The four request shapes a reallocate callback can receive.
enum class WbindReallocKind { NOOP, ALLOCATE, FREE, RESIZE };

WbindReallocKind wbind_classify(const void* memory, size_t new_size);

// Bridges the VM's single reallocate callback to a host allocator.
//
// The VM never says how large a block was when it frees or grows it, so the
// adapter keeps that in its tracker. Must be constructed before the VM that
// uses it and destroyed after that VM; destruction releases whatever is
// still tracked.
class WbindAllocator {
public:
    explicit WbindAllocator(WbindHostAllocator& host);
    ~WbindAllocator();

    WbindAllocator(const WbindAllocator&) = delete;
    WbindAllocator& operator=(const WbindAllocator&) = delete;

    // Entry point behind wbind_reallocate(). Runs inside the VM's C frames,
    // so failures come back as nullptr or abort, never as exceptions.
    void* reallocate(void* memory, size_t new_size) noexcept;

    void* alloc(size_t size) noexcept;
    void* realloc(void* ptr, size_t new_size) noexcept;
    void free(void* ptr) noexcept;

    const WbindTracker& tracker() const { return tracker_; }
    size_t live_count() const { return tracker_.count(); }
    size_t live_bytes() const { return tracker_.total_bytes(); }

    size_t get_alloc_calls() const { return alloc_calls_; }
    size_t get_resize_calls() const { return resize_calls_; }
    size_t get_free_calls() const { return free_calls_; }

private:
    size_t lookup_or_die(void* ptr, const char* action) const noexcept;
    [[noreturn]] void die(const char* action, void* ptr, size_t size, const char* why) const noexcept;
    void release_to_host(void* ptr, size_t size) noexcept;

    WbindHostAllocator& host_;
    WbindTracker tracker_;

    size_t alloc_calls_ = 0;
    size_t resize_calls_ = 0;
    size_t free_calls_ = 0;
};

extern "C" {
// WrenReallocateFn for TRACKED mode. user_data is the WbindAllocator.
void* wbind_reallocate(void* memory, size_t new_size, void* user_data) noexcept;

// WrenReallocateFn for MONITOR mode. Logs, then forwards to realloc/free.
void* wbind_monitor_reallocate(void* memory, size_t new_size, void* user_data) noexcept;
}
