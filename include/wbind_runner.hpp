#pragma once
#include "wbind_env.hpp"
#include "wbind_vm.hpp"
#include <string>
#include <vector>

// sysexits.h values, as used by the Wren CLI
enum WbindExitCode {
    WBIND_EXIT_OK = 0,
    WBIND_EXIT_USAGE = 64,
    WBIND_EXIT_COMPILE = 65,
    WBIND_EXIT_NO_INPUT = 66,
    WBIND_EXIT_RUNTIME = 70,
    WBIND_EXIT_CONFIG = 78,
};

int wbind_exit_status(WrenInterpretResult result);

bool wbind_read_file(const std::string& path, std::string& out);

// Prints through Wren, then calls System.print(_) through a call handle.
void wbind_run_demo(WbindVm& vm);

// Body of the wbind executable. args[0] is the program name, args[1] an
// optional script path. Returns the process exit status.
int wbind_run(const std::vector<std::string>& args, const WbindEnv& env, WrenConfiguration config);
