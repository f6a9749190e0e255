// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef OPTIONS_H
#define OPTIONS_H

#include <filesystem>

// Settings collected from the command line
struct SanitizeOptions {
    std::filesystem::path root = ".";  // Directory to walk
    bool headless = false;             // Skip the prompt, -y or -c given
    bool coldRun = false;              // Report only, never rename
    bool verbose = false;              // Also print unchanged files
    bool color = true;                 // ANSI colors when stdout is a terminal
    int maxDepth = -1;                 // Recursion limit, -1 for none
};

#endif // OPTIONS_H
