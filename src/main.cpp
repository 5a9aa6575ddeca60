#include "app/Application.hpp"
#include "app/CommandLine.hpp"

#include <spdlog/spdlog.h>

#include <iostream>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto options = resetwatch::app::parseCommandLine(args);

    if (options.help) {
        std::cout << resetwatch::app::usageText(argv[0]);
        return 0;
    }

    if (!options.errors.empty() || !options.hasCommand()) {
        for (const auto& error : options.errors) {
            std::cerr << "Error: " << error << '\n';
        }
        std::cerr << resetwatch::app::usageText(argv[0]);
        return 1;
    }

    try {
        resetwatch::app::Application app(std::move(options));
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
