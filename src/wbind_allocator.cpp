#include "../include/wbind_allocator.hpp"
#include "../include/wbind_logger.hpp"
#include <cstdlib>
#include <exception>
#include <new>
#include <string>

WbindReallocKind wbind_classify(const void* memory, size_t new_size) {
    if (memory == nullptr) {
        return new_size == 0 ? WbindReallocKind::NOOP : WbindReallocKind::ALLOCATE;
    }
    return new_size == 0 ? WbindReallocKind::FREE : WbindReallocKind::RESIZE;
}

WbindAllocator::WbindAllocator(WbindHostAllocator& host) : host_(host) {}

WbindAllocator::~WbindAllocator() {
    if (tracker_.count() > 0) {
        WBIND_LOG_INFO("TEARDOWN", nullptr, tracker_.total_bytes(), "Releasing " + std::to_string(tracker_.count()) + " live blocks");
    }
    tracker_.drain([this](void* ptr, size_t size) {
        release_to_host(ptr, size);
    });
}

void* WbindAllocator::reallocate(void* memory, size_t new_size) noexcept {
    switch (wbind_classify(memory, new_size)) {
        case WbindReallocKind::NOOP:
            return nullptr;
        case WbindReallocKind::ALLOCATE:
            return alloc(new_size);
        case WbindReallocKind::FREE:
            free(memory);
            return nullptr;
        case WbindReallocKind::RESIZE:
            return realloc(memory, new_size);
    }
    return nullptr;
}

void WbindAllocator::die(const char* action, void* ptr, size_t size, const char* why) const noexcept {
    // The table no longer matches the VM's view of its heap. Going on
    // would release, copy or hand out memory twice.
    WBIND_LOG_ERR(action, ptr, size, std::string(why) + ", Live=" + std::to_string(tracker_.count()));
    std::abort();
}

size_t WbindAllocator::lookup_or_die(void* ptr, const char* action) const noexcept {
    size_t size = 0;
    if (!tracker_.get_alloc(ptr, size)) {
        die(action, ptr, 0, "Untracked pointer");
    }
    return size;
}

void WbindAllocator::release_to_host(void* ptr, size_t size) noexcept {
    try {
        host_.release(ptr, size);
    } catch (const std::exception& e) {
        // The VM is done with the block either way; only the host's own
        // bookkeeping is lost.
        WBIND_LOG_ERR("RELEASE_FAIL", ptr, size, e.what());
    }
}

void* WbindAllocator::alloc(size_t size) noexcept {
    alloc_calls_++;

    void* ptr = nullptr;
    try {
        ptr = host_.allocate(size);
    } catch (const std::exception& e) {
        WBIND_LOG_ERR("ALLOC_FAIL", nullptr, size, e.what());
        return nullptr;
    }
    if (!ptr) {
        WBIND_LOG_INFO("ALLOC_OOM", nullptr, size, "Host allocator refused");
        return nullptr;
    }

    bool inserted = false;
    try {
        inserted = tracker_.register_alloc(ptr, size);
    } catch (const std::bad_alloc&) {
        release_to_host(ptr, size);
        WBIND_LOG_ERR("ALLOC_FAIL", nullptr, size, "Tracker insert failed");
        return nullptr;
    }
    if (!inserted) {
        die("ALLOC_DUPLICATE", ptr, size, "Host returned a live block");
    }

    WBIND_LOG_DBG("ALLOC", ptr, size, "");
    return ptr;
}

void* WbindAllocator::realloc(void* ptr, size_t new_size) noexcept {
    resize_calls_++;
    size_t old_size = lookup_or_die(ptr, "RESIZE_UNTRACKED");

    void* out = nullptr;
    try {
        out = host_.resize(ptr, old_size, new_size);
    } catch (const std::exception& e) {
        WBIND_LOG_ERR("RESIZE_FAIL", ptr, new_size, e.what());
        return nullptr;
    }
    if (!out) {
        // ptr is untouched and keeps its old entry
        WBIND_LOG_INFO("RESIZE_OOM", ptr, new_size, "Old=" + std::to_string(old_size));
        return nullptr;
    }

    size_t other = 0;
    if (out != ptr && tracker_.get_alloc(out, other)) {
        die("RESIZE_DUPLICATE", out, new_size, "Host moved onto a live block");
    }

    tracker_.rekey_alloc(ptr, out, new_size);
    WBIND_LOG_DBG("RESIZE", out, new_size, "Old=" + std::to_string(old_size) + (out == ptr ? " InPlace" : " Moved"));
    return out;
}

void WbindAllocator::free(void* ptr) noexcept {
    free_calls_++;
    size_t size = lookup_or_die(ptr, "FREE_UNTRACKED");

    release_to_host(ptr, size);
    tracker_.unregister_alloc(ptr);
    WBIND_LOG_DBG("FREE", ptr, size, "");
}
