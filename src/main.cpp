#include "../include/wbind_runner.hpp"
#include <cstdio>
#include <exception>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv, argv + argc);
    try {
        return wbind_run(args, WbindEnv::get(), WbindVm::default_config());
    } catch (const std::exception& e) {
        // Malformed WBIND_* values
        std::fprintf(stderr, "wbind: %s\n", e.what());
        return WBIND_EXIT_CONFIG;
    }
}
