#include "../include/wbind_tracker.hpp"
#include <utility>

bool WbindTracker::register_alloc(void* ptr, size_t size) {
    auto res = map_.emplace(ptr, size);
    if (!res.second) return false;
    total_bytes_ += size;
    return true;
}

void WbindTracker::unregister_alloc(void* ptr) {
    auto it = map_.find(ptr);
    if (it == map_.end()) return;
    total_bytes_ -= it->second;
    map_.erase(it);
}

bool WbindTracker::get_alloc(void* ptr, size_t& out_size) const {
    auto it = map_.find(ptr);
    if (it == map_.end()) return false;
    out_size = it->second;
    return true;
}

void WbindTracker::rekey_alloc(void* old_ptr, void* new_ptr, size_t new_size) {
    auto node = map_.extract(old_ptr);
    if (node.empty()) return;
    total_bytes_ -= node.mapped();
    node.key() = new_ptr;
    node.mapped() = new_size;
    map_.insert(std::move(node));
    total_bytes_ += new_size;
}
