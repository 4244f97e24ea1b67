#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

#include "CommandLine.hpp"
#include "ConfigParser.hpp"
#include "Organizer.hpp"
#include "OrganizerEvents.hpp"

namespace {
constexpr int kUsageError = 2;

void printListing(const Listing& listing) {
    std::cout << "\nFiles in Downloads folder:" << std::endl;
    std::cout << std::string(50, '-') << std::endl;

    for (const auto& category : listing.categories) {
        if (category.files.empty()) {
            continue;
        }

        std::cout << "\n" << category.category << ":" << std::endl;
        for (const auto& file : category.files) {
            std::cout << "  - " << file << std::endl;
        }
    }

    std::cout << "\nTotal files: " << listing.total << std::endl;
}

// Duplicate extensions are legal but worth pointing out when the user supplied the table.
void reportReassignments(const Classifier& classifier) {
    for (const auto& reassignment : classifier.reassignments()) {
        std::cerr << "Warning: `" << reassignment.extension << "` is listed under both "
                  << reassignment.previousCategory << " and " << reassignment.category << "; using "
                  << reassignment.category << "." << std::endl;
    }
}
} // namespace

int main(int argc, char* argv[]) {
    const std::string programName =
        argc > 0 ? std::filesystem::path(argv[0]).filename().string() : std::string("downloads_organizer");

    const auto options = parseCommandLine(argc, argv, std::cerr);
    if (!options) {
        printUsage(std::cerr, programName);
        return kUsageError;
    }

    if (options->help) {
        printUsage(std::cout, programName);
        return EXIT_SUCCESS;
    }

    ConfigParser parser(homeFolder());
    if (!options->configFile.empty() && !parser.load(options->configFile)) {
        std::cerr << "Failed to load configuration. Exiting." << std::endl;
        return EXIT_FAILURE;
    }

    // Command line beats the configuration file, which beats the platform default.
    std::string root = options->path;
    if (root.empty()) {
        root = parser.getDownloadsFolder();
    }
    if (root.empty()) {
        root = defaultDownloadsFolder();
    }

    ConsoleEventSink sink;
    Organizer organizer(root, parser.makeTable(), sink);
    if (!options->configFile.empty()) {
        reportReassignments(organizer.classifier());
    }

    if (options->dryRun) {
        std::cout << "DRY RUN - No files will be moved" << std::endl;
        std::cout << std::string(50, '=') << std::endl;
    }

    const RunSummary summary = organizer.organize(options->dryRun);
    if (!summary.ok()) {
        return EXIT_FAILURE;
    }

    if (options->list) {
        printListing(organizer.listByCategory());
    }

    return EXIT_SUCCESS;
}
