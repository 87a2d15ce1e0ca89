#pragma once
extern "C" {
#include <wren.h>
}
#include <cstddef>
#include <stdexcept>
#include <string>

class WbindAllocator;

// Raised when wrenInterpret/wrenCall does not return WREN_RESULT_SUCCESS.
// The details have already gone through the VM's errorFn.
class WbindScriptError : public std::runtime_error {
public:
    WbindScriptError(WrenInterpretResult result, const std::string& what);
    WrenInterpretResult result() const { return result_; }

private:
    WrenInterpretResult result_;
};

// Byte string owned by the VM. Valid only until the next call into the VM.
struct WbindBytes {
    const char* data;
    size_t size;
};

// Owns one WrenHandle and releases it exactly once. Must not outlive the VM
// it came from.
class WbindHandle {
public:
    WbindHandle() = default;
    WbindHandle(WrenVM* vm, WrenHandle* handle) : vm_(vm), handle_(handle) {}
    ~WbindHandle() { release(); }

    WbindHandle(const WbindHandle&) = delete;
    WbindHandle& operator=(const WbindHandle&) = delete;
    WbindHandle(WbindHandle&& other) noexcept;
    WbindHandle& operator=(WbindHandle&& other) noexcept;

    void release();

    // Gives up ownership; the caller must wrenReleaseHandle() it.
    WrenHandle* detach();

    WrenHandle* get() const { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    WrenVM* vm_ = nullptr;
    WrenHandle* handle_ = nullptr;
};

// One Wren VM. Methods map one-to-one onto the Wren C API; the VM's own
// contracts (slot numbering, string lifetime, handle lifetime) apply as-is.
class WbindVm {
public:
    // When allocator is non-null it backs the whole VM heap, and the VM's
    // userData slot is taken by it. The allocator must outlive this object.
    explicit WbindVm(WrenConfiguration config, WbindAllocator* allocator = nullptr);
    ~WbindVm();

    WbindVm(const WbindVm&) = delete;
    WbindVm& operator=(const WbindVm&) = delete;

    // wrenInitConfiguration() plus the stdout/stderr write and error hooks.
    static WrenConfiguration default_config();
    static void default_write(WrenVM* vm, const char* text);
    static void default_error(WrenVM* vm, WrenErrorType type, const char* module, int line, const char* message);

    static int version_number();

    WrenVM* raw() const { return vm_; }
    WbindAllocator* allocator() const { return allocator_; }

    void collect_garbage();

    void interpret(const std::string& module, const std::string& source);

    // Receiver in slot 0, arguments after it. Result lands in slot 0.
    WbindHandle make_call_handle(const std::string& signature);
    void call(const WbindHandle& method);
    void release_handle(WbindHandle& handle);

    int get_slot_count();
    void ensure_slots(int num_slots);
    WrenType get_slot_type(int slot);

    bool get_slot_bool(int slot);
    WbindBytes get_slot_bytes(int slot);
    double get_slot_double(int slot);
    void* get_slot_foreign(int slot);
    const char* get_slot_string(int slot);
    WbindHandle get_slot_handle(int slot);

    void set_slot_bool(int slot, bool value);
    void set_slot_bytes(int slot, const char* bytes, size_t length);
    void set_slot_double(int slot, double value);
    void* set_slot_new_foreign(int slot, int class_slot, size_t size);
    void set_slot_new_list(int slot);
    void set_slot_new_map(int slot);
    void set_slot_null(int slot);
    void set_slot_string(int slot, const std::string& text);
    void set_slot_handle(int slot, const WbindHandle& handle);

    int get_list_count(int slot);
    void get_list_element(int list_slot, int index, int element_slot);
    void set_list_element(int list_slot, int index, int element_slot);
    // index -1 appends
    void insert_in_list(int list_slot, int index, int element_slot);

    int get_map_count(int slot);
    bool get_map_contains_key(int map_slot, int key_slot);
    void get_map_value(int map_slot, int key_slot, int value_slot);
    void set_map_value(int map_slot, int key_slot, int value_slot);
    void remove_map_value(int map_slot, int key_slot, int removed_value_slot);

    void get_variable(const std::string& module, const std::string& name, int slot);
    bool has_variable(const std::string& module, const std::string& name);
    bool has_module(const std::string& module);

    void abort_fiber(int slot);

    void* get_user_data();
    void set_user_data(void* user_data);

private:
    WrenVM* vm_ = nullptr;
    WbindAllocator* allocator_ = nullptr;
    void* user_data_ = nullptr;
};
