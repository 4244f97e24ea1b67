#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include <iosfwd>
#include <optional>
#include <string>

struct CommandLineOptions {
    std::string path;
    std::string configFile;
    bool dryRun = false;
    bool list = false;
    bool help = false;
};

// Parse argv; returns std::nullopt (after printing the problem to `err`) on bad input.
std::optional<CommandLineOptions> parseCommandLine(int argc, const char* const* argv, std::ostream& err);

void printUsage(std::ostream& out, const std::string& programName);

// Current user's home folder from the environment, or empty when unknown.
std::string homeFolder();
// The platform's usual downloads folder under the home folder.
std::string defaultDownloadsFolder();

#endif
