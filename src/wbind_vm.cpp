#include "../include/wbind_vm.hpp"
#include "../include/wbind_allocator.hpp"
#include "../include/wbind_logger.hpp"
#include <cstdio>
#include <new>
#include <utility>

static const char* result_name(WrenInterpretResult res) {
    switch (res) {
        case WREN_RESULT_SUCCESS: return "SUCCESS";
        case WREN_RESULT_COMPILE_ERROR: return "COMPILE_ERROR";
        case WREN_RESULT_RUNTIME_ERROR: return "RUNTIME_ERROR";
        default: return "UNKNOWN";
    }
}

static void check_result(WrenInterpretResult res, const std::string& msg) {
    if (res != WREN_RESULT_SUCCESS) {
        WBIND_LOG_DBG("SCRIPT_FAIL", nullptr, 0, msg + " : " + result_name(res));
        throw WbindScriptError(res, "[wbind] " + msg + " : " + result_name(res));
    }
}

WbindScriptError::WbindScriptError(WrenInterpretResult result, const std::string& what)
    : std::runtime_error(what), result_(result) {}

WbindHandle::WbindHandle(WbindHandle&& other) noexcept
    : vm_(other.vm_), handle_(other.handle_) {
    other.handle_ = nullptr;
}

WbindHandle& WbindHandle::operator=(WbindHandle&& other) noexcept {
    if (this != &other) {
        release();
        vm_ = other.vm_;
        handle_ = other.handle_;
        other.handle_ = nullptr;
    }
    return *this;
}

void WbindHandle::release() {
    if (handle_) {
        wrenReleaseHandle(vm_, handle_);
        handle_ = nullptr;
    }
}

WrenHandle* WbindHandle::detach() {
    WrenHandle* h = handle_;
    handle_ = nullptr;
    return h;
}

WrenConfiguration WbindVm::default_config() {
    WrenConfiguration config;
    wrenInitConfiguration(&config);
    config.writeFn = &WbindVm::default_write;
    config.errorFn = &WbindVm::default_error;
    return config;
}

void WbindVm::default_write(WrenVM*, const char* text) {
    std::fputs(text, stdout);
}

void WbindVm::default_error(WrenVM*, WrenErrorType type, const char* module, int line, const char* message) {
    const char* mod = module ? module : "?";
    switch (type) {
        case WREN_ERROR_COMPILE:
            std::fprintf(stderr, "[%s line %d] [Error] %s\n", mod, line, message);
            break;
        case WREN_ERROR_STACK_TRACE:
            std::fprintf(stderr, "[%s line %d] in %s\n", mod, line, message);
            break;
        case WREN_ERROR_RUNTIME:
            std::fprintf(stderr, "[Runtime Error] %s\n", message);
            break;
    }
    WBIND_LOG_DBG("SCRIPT_ERR", nullptr, 0, std::string(mod) + ":" + std::to_string(line) + " " + message);
}

int WbindVm::version_number() {
    return wrenGetVersionNumber();
}

WbindVm::WbindVm(WrenConfiguration config, WbindAllocator* allocator)
    : allocator_(allocator) {
    if (allocator_) {
        // Wren hands config.userData to reallocateFn, so the adapter owns
        // that slot; host user data is kept here instead.
        user_data_ = config.userData;
        config.reallocateFn = &wbind_reallocate;
        config.userData = allocator_;
    }

    vm_ = wrenNewVM(&config);
    if (!vm_) {
        WBIND_LOG_ERR("VM_NEW", nullptr, 0, "wrenNewVM failed");
        throw std::bad_alloc();
    }
    WBIND_LOG_INFO("VM_NEW", vm_, allocator_ ? allocator_->live_bytes() : 0, allocator_ ? "TRACKED" : "UNTRACKED");
}

WbindVm::~WbindVm() {
    if (vm_) {
        WBIND_LOG_INFO("VM_FREE", vm_, allocator_ ? allocator_->live_bytes() : 0, "");
        wrenFreeVM(vm_);
    }
}

void WbindVm::collect_garbage() {
    wrenCollectGarbage(vm_);
    if (allocator_) WBIND_LOG_DBG("GC", vm_, allocator_->live_bytes(), "Live=" + std::to_string(allocator_->live_count()));
}

void WbindVm::interpret(const std::string& module, const std::string& source) {
    check_result(wrenInterpret(vm_, module.c_str(), source.c_str()), "Interpret " + module);
}

WbindHandle WbindVm::make_call_handle(const std::string& signature) {
    return WbindHandle(vm_, wrenMakeCallHandle(vm_, signature.c_str()));
}

void WbindVm::call(const WbindHandle& method) {
    check_result(wrenCall(vm_, method.get()), "Call");
}

void WbindVm::release_handle(WbindHandle& handle) {
    handle.release();
}

int WbindVm::get_slot_count() {
    return wrenGetSlotCount(vm_);
}

void WbindVm::ensure_slots(int num_slots) {
    wrenEnsureSlots(vm_, num_slots);
}

WrenType WbindVm::get_slot_type(int slot) {
    return wrenGetSlotType(vm_, slot);
}

bool WbindVm::get_slot_bool(int slot) {
    return wrenGetSlotBool(vm_, slot);
}

WbindBytes WbindVm::get_slot_bytes(int slot) {
    int len = 0;
    const char* ptr = wrenGetSlotBytes(vm_, slot, &len);
    return WbindBytes{ptr, static_cast<size_t>(len)};
}

double WbindVm::get_slot_double(int slot) {
    return wrenGetSlotDouble(vm_, slot);
}

void* WbindVm::get_slot_foreign(int slot) {
    return wrenGetSlotForeign(vm_, slot);
}

const char* WbindVm::get_slot_string(int slot) {
    return wrenGetSlotString(vm_, slot);
}

WbindHandle WbindVm::get_slot_handle(int slot) {
    return WbindHandle(vm_, wrenGetSlotHandle(vm_, slot));
}

void WbindVm::set_slot_bool(int slot, bool value) {
    wrenSetSlotBool(vm_, slot, value);
}

void WbindVm::set_slot_bytes(int slot, const char* bytes, size_t length) {
    wrenSetSlotBytes(vm_, slot, bytes, length);
}

void WbindVm::set_slot_double(int slot, double value) {
    wrenSetSlotDouble(vm_, slot, value);
}

void* WbindVm::set_slot_new_foreign(int slot, int class_slot, size_t size) {
    return wrenSetSlotNewForeign(vm_, slot, class_slot, size);
}

void WbindVm::set_slot_new_list(int slot) {
    wrenSetSlotNewList(vm_, slot);
}

void WbindVm::set_slot_new_map(int slot) {
    wrenSetSlotNewMap(vm_, slot);
}

void WbindVm::set_slot_null(int slot) {
    wrenSetSlotNull(vm_, slot);
}

void WbindVm::set_slot_string(int slot, const std::string& text) {
    wrenSetSlotString(vm_, slot, text.c_str());
}

void WbindVm::set_slot_handle(int slot, const WbindHandle& handle) {
    wrenSetSlotHandle(vm_, slot, handle.get());
}

int WbindVm::get_list_count(int slot) {
    return wrenGetListCount(vm_, slot);
}

void WbindVm::get_list_element(int list_slot, int index, int element_slot) {
    wrenGetListElement(vm_, list_slot, index, element_slot);
}

void WbindVm::set_list_element(int list_slot, int index, int element_slot) {
    wrenSetListElement(vm_, list_slot, index, element_slot);
}

void WbindVm::insert_in_list(int list_slot, int index, int element_slot) {
    wrenInsertInList(vm_, list_slot, index, element_slot);
}

int WbindVm::get_map_count(int slot) {
    return wrenGetMapCount(vm_, slot);
}

bool WbindVm::get_map_contains_key(int map_slot, int key_slot) {
    return wrenGetMapContainsKey(vm_, map_slot, key_slot);
}

void WbindVm::get_map_value(int map_slot, int key_slot, int value_slot) {
    wrenGetMapValue(vm_, map_slot, key_slot, value_slot);
}

void WbindVm::set_map_value(int map_slot, int key_slot, int value_slot) {
    wrenSetMapValue(vm_, map_slot, key_slot, value_slot);
}

void WbindVm::remove_map_value(int map_slot, int key_slot, int removed_value_slot) {
    wrenRemoveMapValue(vm_, map_slot, key_slot, removed_value_slot);
}

void WbindVm::get_variable(const std::string& module, const std::string& name, int slot) {
    wrenGetVariable(vm_, module.c_str(), name.c_str(), slot);
}

bool WbindVm::has_variable(const std::string& module, const std::string& name) {
    return wrenHasVariable(vm_, module.c_str(), name.c_str());
}

bool WbindVm::has_module(const std::string& module) {
    return wrenHasModule(vm_, module.c_str());
}

void WbindVm::abort_fiber(int slot) {
    wrenAbortFiber(vm_, slot);
}

void* WbindVm::get_user_data() {
    return allocator_ ? user_data_ : wrenGetUserData(vm_);
}

void WbindVm::set_user_data(void* user_data) {
    if (allocator_) {
        user_data_ = user_data;
        return;
    }
    wrenSetUserData(vm_, user_data);
}
