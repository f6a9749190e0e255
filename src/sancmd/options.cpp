// SPDX-License-Identifier: GPL-3.0-or-later

#include "../headers.h"
#include "../options.h"


const std::string SANCMD_VERSION = "1.0.0";


// Print the version number of the program
void printVersionNumber(const std::string& version) {
    std::cout << "\x1B[32mSanitize Commander v" << version << "\x1B[0m\n";
}


// Function to print help
void printHelp() {
    std::cout << "\n\x1B[32mUsage: sancmd [OPTIONS] [PATH]\n"
              << "Recursively renames files under PATH (default: current directory) so their\n"
              << "names are safe on Windows and POSIX filesystems.\n"
              << "\n"
              << "Options:\n"
              << "  -h, --help               Print help\n"
              << "  --version                Print version\n"
              << "  -y                       Sanitize without asking (headless)\n"
              << "  -c                       Cold run without asking, only print output (headless)\n"
              << "  -d  [DEPTH]              Set recursive depth level, -1 for unlimited (optional)\n"
              << "  -v, --verbose            Also list files whose names are already safe (optional)\n"
              << "  --no-color               Print without colors (optional)\n"
              << "\n"
              << "Without -y or -c a prompt asks for Y (sanitize), C (cold run) or N (no action).\n"
              << "Reserved Windows names (CON, NUL, COM1...) are never renamed, they are listed\n"
              << "at the end for manual attention.\n"
              << "\n"
              << "Examples:\n"
              << "  sancmd\n"
              << "  sancmd -c ~/Music\n"
              << "  sancmd -y -d 0 -v [path1]\n"
              << "\x1B[0m\n";
}


// Function to parse the command line, returns false when the program should exit with exitCode
bool parseOptions(int argc, char* argv[], SanitizeOptions& options, int& exitCode) {
    const std::unordered_set<std::string> validFlags = {
        "-h", "--help", "--version", "-y", "-c", "-d", "-v", "--verbose", "--no-color"
    };

    bool yFlag = false;
    bool cFlag = false;
    bool pathGiven = false;
    exitCode = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);

        if (validFlags.count(arg)) {
            if (arg == "-h" || arg == "--help") {
                printHelp();
                return false;
            } else if (arg == "--version") {
                printVersionNumber(SANCMD_VERSION);
                return false;
            } else if (arg == "-y") {
                yFlag = true;
            } else if (arg == "-c") {
                cFlag = true;
            } else if (arg == "-d") {
                if (i + 1 >= argc) {
                    printError("Error: Missing argument for option -d");
                    exitCode = 1;
                    return false;
                }
                const std::string depthValue(argv[++i]);
                try {
                    std::size_t consumed = 0;
                    const int depth = std::stoi(depthValue, &consumed);
                    if (consumed != depthValue.size() || depth < -1) {
                        throw std::invalid_argument(depthValue);
                    }
                    options.maxDepth = depth;
                } catch (const std::exception&) {
                    printError("Error: Depth value must be -1 or a non-negative integer - " + depthValue);
                    exitCode = 1;
                    return false;
                }
            } else if (arg == "-v" || arg == "--verbose") {
                options.verbose = true;
            } else if (arg == "--no-color") {
                options.color = false;
            }
        } else if (!arg.empty() && arg[0] == '-') {
            printError("Error: Unknown option - " + arg + ". Run 'sancmd --help'.");
            exitCode = 1;
            return false;
        } else {
            if (pathGiven) {
                printError("Error: Only one path can be sanitized at a time - " + arg);
                exitCode = 1;
                return false;
            }
            options.root = arg;
            pathGiven = true;
        }
    }

    if (yFlag && cFlag) {
        printError("Error: Cannot mix -y and -c options.");
        exitCode = 1;
        return false;
    }
    options.headless = yFlag || cFlag;
    options.coldRun = cFlag;

    std::error_code ec;
    if (!fs::is_directory(options.root, ec)) {
        printError("Error: Path does not exist or not a directory - " + options.root.string());
        exitCode = 1;
        return false;
    }

    fs::path absoluteRoot = fs::absolute(options.root, ec);
    if (ec) {
        printError("Error: Cannot resolve path - " + options.root.string() + ": " + ec.message());
        exitCode = 1;
        return false;
    }

    // "dir/." and "dir/" both become "dir"
    absoluteRoot = absoluteRoot.lexically_normal();
    if (!absoluteRoot.has_filename() && absoluteRoot != absoluteRoot.root_path()) {
        absoluteRoot = absoluteRoot.parent_path();
    }
    options.root = absoluteRoot;
    return true;
}
