// main.cpp - Booth Recorder entry point

#include "core/Application.hpp"
#include "core/Logger.hpp"

#include <iostream>

int main(int argc, char* argv[]) {
    try {
        vb::Application app(argc, argv);

        auto optsResult = app.parseArgs();
        if (!optsResult) {
            std::cerr << "Error: " << optsResult.error().message << "\n";
            std::cerr << "Try --help for usage information.\n";
            return 1;
        }

        auto opts = std::move(*optsResult);

        auto initResult = app.init(opts);
        if (!initResult) {
            std::cerr << "Initialization failed: " << initResult.error().message << "\n";
            return 1;
        }

        return app.exec();

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
