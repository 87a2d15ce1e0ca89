#include "../include/wbind_host.hpp"
#include "../include/wbind_logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <string>
#include <utility>

void* WbindMallocHost::allocate(size_t size) {
    return std::malloc(size);
}

void* WbindMallocHost::resize(void* ptr, size_t, size_t new_size) {
    return std::realloc(ptr, new_size);
}

void WbindMallocHost::release(void* ptr, size_t) {
    std::free(ptr);
}

WbindBudgetHost::WbindBudgetHost(std::unique_ptr<WbindHostAllocator> inner, size_t limit)
    : inner_(std::move(inner)), limit_(limit) {}

bool WbindBudgetHost::fits(size_t extra) const {
    if (limit_ == 0) return true;
    return extra <= limit_ && in_use_ <= limit_ - extra;
}

void* WbindBudgetHost::allocate(size_t size) {
    if (!fits(size)) {
        refused_++;
        WBIND_LOG_INFO("BUDGET_REFUSE", nullptr, size, "InUse=" + std::to_string(in_use_) + " Limit=" + std::to_string(limit_));
        return nullptr;
    }
    void* ptr = inner_->allocate(size);
    if (!ptr) return nullptr;

    in_use_ += size;
    blocks_++;
    peak_ = std::max(peak_, in_use_);
    return ptr;
}

void* WbindBudgetHost::resize(void* ptr, size_t old_size, size_t new_size) {
    if (new_size > old_size && !fits(new_size - old_size)) {
        refused_++;
        WBIND_LOG_INFO("BUDGET_REFUSE", ptr, new_size, "InUse=" + std::to_string(in_use_) + " Limit=" + std::to_string(limit_));
        return nullptr;
    }
    void* out = inner_->resize(ptr, old_size, new_size);
    if (!out) return nullptr;

    in_use_ = in_use_ - old_size + new_size;
    peak_ = std::max(peak_, in_use_);
    return out;
}

void WbindBudgetHost::release(void* ptr, size_t size) {
    inner_->release(ptr, size);
    in_use_ -= size;
    blocks_--;
}
