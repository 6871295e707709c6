#include "core/application.hpp"
#include <spdlog/spdlog.h>
#include <cstring>

namespace {

void print_usage(const char* program) {
    spdlog::info("Usage: {} <config.yaml> [--verbose]", program);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    const char* config_path = nullptr;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (!config_path) {
            config_path = argv[i];
        } else {
            spdlog::error("Unexpected argument '{}'", argv[i]);
            print_usage(argv[0]);
            return 2;
        }
    }

    if (!config_path) {
        print_usage(argv[0]);
        return 2;
    }

    spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    spdlog::info("Tidemark v0.1.0");

    tidemark::Application app;

    if (!app.init(config_path)) {
        spdlog::error("Failed to initialize application");
        return 1;
    }

    bool ok = app.run();
    app.shutdown();

    return ok ? 0 : 1;
}
