#include "CommandLine.hpp"

#include <cstdlib>
#include <filesystem>
#include <ostream>

std::optional<CommandLineOptions> parseCommandLine(int argc, const char* const* argv, std::ostream& err) {
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        // Options that take a value accept both `--path dir` and `--path=dir`.
        auto takeValue = [&](const std::string& longName, std::string& target) -> bool {
            const std::string prefix = longName + "=";
            if (arg.rfind(prefix, 0) == 0) {
                target = arg.substr(prefix.size());
            } else if (i + 1 < argc) {
                target = argv[++i];
            } else {
                err << "Option `" << arg << "` requires a value." << std::endl;
                return false;
            }

            if (target.empty()) {
                err << "Option `" << longName << "` requires a non-empty value." << std::endl;
                return false;
            }
            return true;
        };

        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "-d" || arg == "--dry-run") {
            options.dryRun = true;
        } else if (arg == "-l" || arg == "--list") {
            options.list = true;
        } else if (arg == "-p" || arg == "--path" || arg.rfind("--path=", 0) == 0) {
            if (!takeValue("--path", options.path)) {
                return std::nullopt;
            }
        } else if (arg == "-c" || arg == "--config" || arg.rfind("--config=", 0) == 0) {
            if (!takeValue("--config", options.configFile)) {
                return std::nullopt;
            }
        } else {
            err << "Unknown option `" << arg << "`." << std::endl;
            return std::nullopt;
        }
    }

    return options;
}

void printUsage(std::ostream& out, const std::string& programName) {
    out << "Organize your Downloads folder\n\n"
        << "Usage: " << programName << " [options]\n\n"
        << "Options:\n"
        << "  -p, --path <dir>      Path to downloads folder (default: ~/Downloads)\n"
        << "  -d, --dry-run         Show what would be moved without actually moving files\n"
        << "  -l, --list            List files by category after organization\n"
        << "  -c, --config <file>   JSON file with categories and the downloads folder\n"
        << "  -h, --help            Show this help" << std::endl;
}

std::string homeFolder() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
#else
    const char* home = std::getenv("HOME");
#endif
    return home == nullptr ? std::string{} : std::string(home);
}

std::string defaultDownloadsFolder() {
    const std::string home = homeFolder();
    if (home.empty()) {
        return "Downloads";
    }
    return (std::filesystem::path(home) / "Downloads").string();
}
