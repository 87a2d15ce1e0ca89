#include "../include/wbind_runner.hpp"
#include "../include/wbind_logger.hpp"
#include "../include/wbind_runtime.hpp"
#include <cstdio>
#include <exception>
#include <fstream>
#include <new>
#include <sstream>

int wbind_exit_status(WrenInterpretResult result) {
    switch (result) {
        case WREN_RESULT_SUCCESS: return WBIND_EXIT_OK;
        case WREN_RESULT_COMPILE_ERROR: return WBIND_EXIT_COMPILE;
        case WREN_RESULT_RUNTIME_ERROR: return WBIND_EXIT_RUNTIME;
    }
    return WBIND_EXIT_RUNTIME;
}

bool wbind_read_file(const std::string& path, std::string& out) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs) return false;
    std::stringstream ss;
    ss << ifs.rdbuf();
    out = ss.str();
    return true;
}

void wbind_run_demo(WbindVm& vm) {
    vm.interpret("main", "System.print(\"Hello, world!\")");

    WbindHandle print = vm.make_call_handle("print(_)");
    vm.ensure_slots(2);
    vm.get_variable("main", "System", 0);
    vm.set_slot_string(1, "Hello from C++!");
    vm.call(print);
}

int wbind_run(const std::vector<std::string>& args, const WbindEnv& env, WrenConfiguration config) {
    const char* prog = args.empty() ? "wbind" : args[0].c_str();
    if (args.size() > 2) {
        std::fprintf(stderr, "Usage: %s [script.wren]\n", prog);
        return WBIND_EXIT_USAGE;
    }

    std::string source;
    bool has_script = args.size() == 2;
    if (has_script && !wbind_read_file(args[1], source)) {
        std::fprintf(stderr, "Could not read file \"%s\".\n", args[1].c_str());
        return WBIND_EXIT_NO_INPUT;
    }

    int status = WBIND_EXIT_OK;
    try {
        WbindRuntime runtime(env, config);
        try {
            if (has_script) {
                runtime.vm().interpret("main", source);
            } else {
                wbind_run_demo(runtime.vm());
            }
        } catch (const WbindScriptError& e) {
            status = wbind_exit_status(e.result());
        }

        WbindAllocator* a = runtime.allocator();
        if (a) {
            WBIND_LOG_INFO("EXIT", nullptr, a->live_bytes(),
                "Live=" + std::to_string(a->live_count()) +
                " Allocs=" + std::to_string(a->get_alloc_calls()) +
                " Resizes=" + std::to_string(a->get_resize_calls()) +
                " Frees=" + std::to_string(a->get_free_calls()));
        }
    } catch (const std::bad_alloc&) {
        // Arena reservation failed
        std::fprintf(stderr, "%s: out of memory\n", prog);
        return WBIND_EXIT_RUNTIME;
    }
    return status;
}
