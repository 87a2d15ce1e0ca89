#pragma once
#include <unordered_map>
#include <cstddef>

// Address -> size table for every block handed to the VM through the adapter.
// Not synchronized: one table belongs to exactly one VM, and the VM is
// single-threaded.
class WbindTracker {
public:
    // false if ptr is already tracked; the existing entry is left alone
    bool register_alloc(void* ptr, size_t size);
    void unregister_alloc(void* ptr);
    bool get_alloc(void* ptr, size_t& out_size) const;

    // Moves the entry for old_ptr to new_ptr with a new size. Reuses the
    // existing node, so it cannot fail with bad_alloc.
    void rekey_alloc(void* old_ptr, void* new_ptr, size_t new_size);

    // Hands every entry to fn(ptr, size), then empties the table.
    template<typename Fn>
    void drain(Fn&& fn) {
        for (auto& entry : map_) {
            fn(entry.first, entry.second);
        }
        map_.clear();
        total_bytes_ = 0;
    }

    size_t count() const { return map_.size(); }
    size_t total_bytes() const { return total_bytes_; }

private:
    std::unordered_map<void*, size_t> map_;
    size_t total_bytes_ = 0;
};
