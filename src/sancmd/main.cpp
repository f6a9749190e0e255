// SPDX-License-Identifier: GPL-3.0-or-later

#include "../headers.h"
#include "../options.h"
#include "../report.h"
#include "../walk.h"


// Main function
int main(int argc, char *argv[]) {
    SanitizeOptions options;
    int exitCode = 0;

    if (!parseOptions(argc, argv, options, exitCode)) {
        return exitCode;
    }

    // Colors only make sense on a terminal
    const bool colored = options.color && isTerminal(STDOUT_FILENO);

    WalkMode mode = options.coldRun ? WalkMode::DryRun : WalkMode::Apply;

    if (!options.headless) {
        const RunChoice choice = promptRunChoice(options.root, colored);
        if (choice == RunChoice::Abort) {
            return 0;
        }
        mode = (choice == RunChoice::ColdRun) ? WalkMode::DryRun : WalkMode::Apply;
    }

    printVerbose("Sanitizing " + options.root.string() + (mode == WalkMode::DryRun ? " (cold run)" : ""), options.verbose);
    std::cout << "\n";

    ConsoleReporter reporter(std::cout, std::cerr, colored, options.verbose);
    WalkOptions walkOptions;
    walkOptions.maxDepth = options.maxDepth;

    try {
        // Walk relative to the root so reported directories read like "./sub"
        std::error_code ec;
        fs::current_path(options.root, ec);
        if (ec) {
            throw fs::filesystem_error("cannot enter directory", options.root, ec);
        }
        sanitizeRecursively(".", mode, reporter, walkOptions);
    } catch (const fs::filesystem_error& e) {
        printError(std::string("Error: ") + e.what(), colored);
        return 1;
    }

    return 0;
}
