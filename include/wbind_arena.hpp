#pragma once
#include "wbind_host.hpp"
#include <cstdint>
#include <map>

// Fixed-size region carved with an O(log N) best-fit free list.
class WbindArenaHost : public WbindHostAllocator {
public:
    // Reserves capacity bytes up front. Throws std::bad_alloc on failure.
    explicit WbindArenaHost(size_t capacity);
    ~WbindArenaHost() override;

    WbindArenaHost(const WbindArenaHost&) = delete;
    WbindArenaHost& operator=(const WbindArenaHost&) = delete;

    // Best-Fit: smallest free block that holds the request
    void* allocate(size_t size) override;

    // Shrinks in place, grows in place into a free neighbour, or moves
    void* resize(void* ptr, size_t old_size, size_t new_size) override;

    // Returns the block and coalesces it with adjacent free blocks
    void release(void* ptr, size_t size) override;

    size_t get_capacity() const { return capacity_; }
    size_t get_total_free() const { return total_free_; }
    size_t get_free_block_count() const { return free_by_addr_.size(); }
    bool owns(const void* ptr) const;

    // 0 when size cannot be rounded without overflowing
    static size_t round_up(size_t size);

private:
    void insert_free(uintptr_t addr, size_t size);
    void erase_free_by_size(uintptr_t addr, size_t size);

    unsigned char* base_ = nullptr;
    size_t capacity_ = 0;
    size_t total_free_ = 0;

    // size -> addr, for Best-Fit lookup (sizes repeat, hence multimap)
    std::multimap<size_t, uintptr_t> free_by_size_;

    // addr -> size, for neighbour checks when coalescing
    std::map<uintptr_t, size_t> free_by_addr_;
};
