#include "app/CommandLine.hpp"

#include <sstream>

namespace resetwatch::app {

CommandLineOptions parseCommandLine(const std::vector<std::string>& args) {
    CommandLineOptions options;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "-d" || arg == "--discover-and-scan") {
            options.discover = true;
        } else if (arg == "-r" || arg == "--reset-check") {
            options.resetCheck = true;
        } else if (arg == "-o" || arg == "--check-once") {
            options.checkOnce = true;
        } else if (arg == "--init-config") {
            options.initConfig = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= args.size()) {
                options.errors.push_back(arg + " requires a file argument");
                continue;
            }
            options.configPath = args[++i];
        } else if (arg.rfind("--config=", 0) == 0) {
            options.configPath = arg.substr(9);
        } else {
            options.errors.push_back("unknown option: " + arg);
        }
    }

    if (options.resetCheck && options.checkOnce) {
        options.errors.emplace_back("--reset-check and --check-once cannot be combined");
    }

    return options;
}

std::string usageText(const std::string& program) {
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  -d, --discover-and-scan  discover hosts on the reference team and scan their ports\n"
        << "  -r, --reset-check        monitor every team until interrupted\n"
        << "  -o, --check-once         check every team once, exit 2 if any host is down\n"
        << "      --init-config        write a default configuration file\n"
        << "  -c, --config <file>      configuration file (default: resetwatch.json)\n"
        << "  -v, --verbose            debug logging\n"
        << "  -h, --help               show this help\n";
    return out.str();
}

} // namespace resetwatch::app
