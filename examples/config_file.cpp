#include "veil.hpp"
#include <iostream>

int main(int argc, char *argv[]) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.json> [text...]" << std::endl;
        return 2;
    }

    veil::EngineConfig config;
    try {
        config = veil::loadConfigFile(argv[1]);
    } catch (const std::exception &e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }

    veil::MaskingEngine engine;
    try {
        engine.configure(config);
    } catch (const veil::ConfigurationError &e) {
        // The valid fields are already active.
        std::cerr << e.what() << std::endl;
    }

    for (int i = 2; i < argc; ++i) {
        std::cout << engine.sanitize(argv[i]) << std::endl;
    }
    return 0;
}
