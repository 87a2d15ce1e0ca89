#include "../include/wbind_allocator.hpp"
#include "../include/wbind_logger.hpp"
#include <cstdlib>

extern "C" {
void* wbind_reallocate(void* memory, size_t new_size, void* user_data) noexcept {
    return static_cast<WbindAllocator*>(user_data)->reallocate(memory, new_size);
}

void* wbind_monitor_reallocate(void* memory, size_t new_size, void*) noexcept {
    switch (wbind_classify(memory, new_size)) {
        case WbindReallocKind::NOOP:
            return nullptr;
        case WbindReallocKind::FREE:
            WBIND_LOG_INFO("FREE", memory, 0, "MONITOR");
            std::free(memory);
            return nullptr;
        case WbindReallocKind::ALLOCATE:
        case WbindReallocKind::RESIZE:
            break;
    }
    void* out = std::realloc(memory, new_size);
    if (out) WBIND_LOG_INFO(memory ? "RESIZE" : "ALLOC", out, new_size, "MONITOR");
    return out;
}
}
