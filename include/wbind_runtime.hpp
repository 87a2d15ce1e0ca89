#pragma once
#include "wbind_allocator.hpp"
#include "wbind_env.hpp"
#include "wbind_host.hpp"
#include "wbind_vm.hpp"
#include <memory>

// Host allocator, adapter and VM with the lifetimes the adapter needs:
// created in that order, destroyed in reverse.
class WbindRuntime {
public:
    // Everything from the environment: mode, host allocator, heap tuning.
    explicit WbindRuntime(const WbindEnv& env = WbindEnv::get());
    WbindRuntime(const WbindEnv& env, WrenConfiguration config);

    // TRACKED mode over the given host allocator. Logging still follows
    // WbindEnv::get(), which throws here if the environment is malformed.
    WbindRuntime(std::unique_ptr<WbindHostAllocator> host, WrenConfiguration config);

    ~WbindRuntime();

    WbindRuntime(const WbindRuntime&) = delete;
    WbindRuntime& operator=(const WbindRuntime&) = delete;

    static std::unique_ptr<WbindHostAllocator> make_host(const WbindEnv& env);
    static void apply_heap_settings(const WbindEnv& env, WrenConfiguration& config);

    WbindVm& vm() { return *vm_; }
    bool running() const { return vm_ != nullptr; }

    // nullptr in MONITOR mode, and after shutdown()
    WbindAllocator* allocator() { return allocator_.get(); }
    WbindHostAllocator* host() { return host_.get(); }
    WbindMode mode() const { return mode_; }

    // Frees the VM, then the adapter. The host allocator stays until
    // destruction so its counters can still be read.
    void shutdown();

private:
    void start(WrenConfiguration config);

    WbindMode mode_;
    std::unique_ptr<WbindHostAllocator> host_;
    std::unique_ptr<WbindAllocator> allocator_;
    std::unique_ptr<WbindVm> vm_;
};
