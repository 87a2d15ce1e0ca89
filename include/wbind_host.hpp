#pragma once
#include <cstddef>
#include <memory>

// Allocator the adapter forwards to. Every method must tolerate being the
// only source of truth for block sizes: callers always pass the size they
// were given back.
class WbindHostAllocator {
public:
    virtual ~WbindHostAllocator() = default;

    // Returns nullptr when the request cannot be satisfied.
    virtual void* allocate(size_t size) = 0;

    // Returns the (possibly moved) block, or nullptr with ptr still valid.
    virtual void* resize(void* ptr, size_t old_size, size_t new_size) = 0;

    virtual void release(void* ptr, size_t size) = 0;
};

class WbindMallocHost : public WbindHostAllocator {
public:
    void* allocate(size_t size) override;
    void* resize(void* ptr, size_t old_size, size_t new_size) override;
    void release(void* ptr, size_t size) override;
};

// Counts what passes through to another host allocator and refuses any
// request that would push bytes in use past the limit (0 = unlimited).
class WbindBudgetHost : public WbindHostAllocator {
public:
    WbindBudgetHost(std::unique_ptr<WbindHostAllocator> inner, size_t limit);

    void* allocate(size_t size) override;
    void* resize(void* ptr, size_t old_size, size_t new_size) override;
    void release(void* ptr, size_t size) override;

    size_t get_limit() const { return limit_; }
    size_t get_in_use() const { return in_use_; }
    size_t get_peak() const { return peak_; }
    size_t get_block_count() const { return blocks_; }
    size_t get_refused() const { return refused_; }

private:
    bool fits(size_t extra) const;

    std::unique_ptr<WbindHostAllocator> inner_;
    size_t limit_;
    size_t in_use_ = 0;
    size_t peak_ = 0;
    size_t blocks_ = 0;
    size_t refused_ = 0;
};
