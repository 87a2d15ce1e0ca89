#include "../include/wbind_arena.hpp"
#include "../include/wbind_logger.hpp"
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <iterator>
#include <new>
#include <string>

static const size_t kArenaAlign = alignof(std::max_align_t);

size_t WbindArenaHost::round_up(size_t size) {
    if (size == 0) return kArenaAlign;
    if (size > SIZE_MAX - (kArenaAlign - 1)) return 0;
    return ((size + kArenaAlign - 1) / kArenaAlign) * kArenaAlign;
}

WbindArenaHost::WbindArenaHost(size_t capacity) {
    capacity_ = (capacity / kArenaAlign) * kArenaAlign;
    if (capacity_ == 0) throw std::bad_alloc();

    base_ = static_cast<unsigned char*>(std::malloc(capacity_));
    if (!base_) {
        WBIND_LOG_ERR("ARENA_INIT", nullptr, capacity_, "Reservation failed");
        throw std::bad_alloc();
    }

    uintptr_t addr = reinterpret_cast<uintptr_t>(base_);
    free_by_size_.insert({capacity_, addr});
    free_by_addr_.insert({addr, capacity_});
    total_free_ = capacity_;

    WBIND_LOG_INFO("ARENA_INIT", base_, capacity_, "Arena Reserved");
}

WbindArenaHost::~WbindArenaHost() {
    if (total_free_ != capacity_) {
        WBIND_LOG_INFO("ARENA_FREE", base_, capacity_ - total_free_, "Bytes still carved at teardown");
    }
    std::free(base_);
}

bool WbindArenaHost::owns(const void* ptr) const {
    const unsigned char* p = static_cast<const unsigned char*>(ptr);
    return p >= base_ && p < base_ + capacity_;
}

void WbindArenaHost::erase_free_by_size(uintptr_t addr, size_t size) {
    auto range = free_by_size_.equal_range(size);
    for (auto it = range.first; it != range.second; ++it) {
        if (it->second == addr) {
            free_by_size_.erase(it);
            break;
        }
    }
}

void* WbindArenaHost::allocate(size_t size) {
    size_t need = round_up(size);
    if (need == 0) {
        WBIND_LOG_DBG("ARENA_OOM", nullptr, size, "Request too large to align");
        return nullptr;
    }

    // 1. Best-Fit: smallest block >= need, O(logN)
    auto it = free_by_size_.lower_bound(need);
    if (it == free_by_size_.end()) {
        WBIND_LOG_DBG("ARENA_OOM", nullptr, size, "No fit block, Free=" + std::to_string(total_free_));
        return nullptr;
    }

    size_t blk_size = it->first;
    uintptr_t blk_ptr = it->second;

    // 2. Unlink, O(logN)
    free_by_size_.erase(it);
    free_by_addr_.erase(blk_ptr);

    // 3. Split, the tail goes back on the free list
    if (blk_size > need) {
        size_t rem_size = blk_size - need;
        uintptr_t rem_ptr = blk_ptr + need;

        free_by_size_.insert({rem_size, rem_ptr});
        free_by_addr_.insert({rem_ptr, rem_size});
    }

    total_free_ -= need;
    return reinterpret_cast<void*>(blk_ptr);
}

void WbindArenaHost::insert_free(uintptr_t ptr, size_t size) {
    uintptr_t new_ptr = ptr;
    size_t new_size = size;

    // 1. Merge with the block right before ptr, if it ends at ptr
    auto it_next = free_by_addr_.lower_bound(ptr);
    if (it_next != free_by_addr_.begin()) {
        auto it_prev = std::prev(it_next);
        if (it_prev->first + it_prev->second == ptr) {
            new_ptr = it_prev->first;
            new_size += it_prev->second;

            erase_free_by_size(it_prev->first, it_prev->second);
            free_by_addr_.erase(it_prev);
        }
    }

    // 2. Merge with the block starting right after ptr
    if (it_next != free_by_addr_.end() && it_next->first == ptr + size) {
        new_size += it_next->second;

        erase_free_by_size(it_next->first, it_next->second);
        free_by_addr_.erase(it_next);
    }

    // 3. Insert the merged block, O(logN)
    free_by_size_.insert({new_size, new_ptr});
    free_by_addr_.insert({new_ptr, new_size});

    total_free_ += size;
}

void WbindArenaHost::release(void* ptr, size_t size) {
    insert_free(reinterpret_cast<uintptr_t>(ptr), round_up(size));
}

void* WbindArenaHost::resize(void* ptr, size_t old_size, size_t new_size) {
    size_t have = round_up(old_size);
    size_t need = round_up(new_size);
    uintptr_t addr = reinterpret_cast<uintptr_t>(ptr);

    if (need == 0) {
        WBIND_LOG_DBG("ARENA_OOM", ptr, new_size, "Request too large to align");
        return nullptr;
    }

    if (need == have) return ptr;

    // Shrink: hand the tail back
    if (need < have) {
        insert_free(addr + need, have - need);
        return ptr;
    }

    // Grow in place if the neighbour is free and large enough
    auto it = free_by_addr_.find(addr + have);
    if (it != free_by_addr_.end() && it->second >= need - have) {
        size_t blk_size = it->second;
        uintptr_t blk_ptr = it->first;
        size_t taken = need - have;

        erase_free_by_size(blk_ptr, blk_size);
        free_by_addr_.erase(it);

        if (blk_size > taken) {
            free_by_size_.insert({blk_size - taken, blk_ptr + taken});
            free_by_addr_.insert({blk_ptr + taken, blk_size - taken});
        }
        total_free_ -= taken;
        WBIND_LOG_DBG("ARENA_GROW", ptr, new_size, "InPlace");
        return ptr;
    }

    // Move
    void* moved = allocate(new_size);
    if (!moved) return nullptr;
    std::memcpy(moved, ptr, old_size);
    release(ptr, old_size);
    WBIND_LOG_DBG("ARENA_GROW", moved, new_size, "Moved");
    return moved;
}
