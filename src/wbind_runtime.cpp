#include "../include/wbind_runtime.hpp"
#include "../include/wbind_arena.hpp"
#include "../include/wbind_logger.hpp"
#include <string>
#include <utility>

std::unique_ptr<WbindHostAllocator> WbindRuntime::make_host(const WbindEnv& env) {
    std::unique_ptr<WbindHostAllocator> host;
    if (env.get_host_kind() == WbindHostKind::ARENA) {
        host.reset(new WbindArenaHost(env.get_arena_size()));
    } else {
        host.reset(new WbindMallocHost());
    }

    if (env.get_heap_limit() > 0) {
        std::unique_ptr<WbindHostAllocator> inner = std::move(host);
        host.reset(new WbindBudgetHost(std::move(inner), env.get_heap_limit()));
    }
    return host;
}

void WbindRuntime::apply_heap_settings(const WbindEnv& env, WrenConfiguration& config) {
    if (env.get_initial_heap_size() > 0) config.initialHeapSize = env.get_initial_heap_size();
    if (env.get_min_heap_size() > 0) config.minHeapSize = env.get_min_heap_size();
    if (env.get_heap_growth_percent() > 0) config.heapGrowthPercent = env.get_heap_growth_percent();
}

WbindRuntime::WbindRuntime(const WbindEnv& env)
    : WbindRuntime(env, WbindVm::default_config()) {}

WbindRuntime::WbindRuntime(const WbindEnv& env, WrenConfiguration config)
    : mode_(env.get_mode()) {
    WbindLogger::get().configure(env);
    apply_heap_settings(env, config);

    if (mode_ == WbindMode::MONITOR) {
        config.reallocateFn = &wbind_monitor_reallocate;
        vm_.reset(new WbindVm(config));
        return;
    }

    host_ = make_host(env);
    start(config);
}

WbindRuntime::WbindRuntime(std::unique_ptr<WbindHostAllocator> host, WrenConfiguration config)
    : mode_(WbindMode::TRACKED), host_(std::move(host)) {
    // Parse the environment here, not from inside the VM's first
    // reallocate call; malformed values throw to the caller.
    WbindLogger::get().configure(WbindEnv::get());
    start(config);
}

void WbindRuntime::start(WrenConfiguration config) {
    allocator_.reset(new WbindAllocator(*host_));
    vm_.reset(new WbindVm(config, allocator_.get()));
    WBIND_LOG_INFO("RUNTIME_START", vm_->raw(), allocator_->live_bytes(), "Blocks=" + std::to_string(allocator_->live_count()));
}

WbindRuntime::~WbindRuntime() {
    shutdown();
}

void WbindRuntime::shutdown() {
    // VM first: wrenFreeVM still calls back into the adapter
    vm_.reset();
    allocator_.reset();
}
