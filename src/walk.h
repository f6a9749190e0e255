// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef WALK_H
#define WALK_H

#include "sanitize.h"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

// Forward declaration
class ChangeReporter;

enum class WalkMode {
    Apply,  // Rename files on disk
    DryRun  // Only report what would be renamed
};

struct WalkOptions {
    int maxDepth = -1; // -1 descends without limit, 0 stays in the root
};

// Everything a walk found, handed to the reporter once traversal is done
struct WalkSummary {
    ExceptionList exceptions;             // Reserved names, never renamed
    std::vector<std::string> collisions;  // Targets that already existed
    std::vector<std::string> errors;      // Directories that could not be listed
    std::size_t filesVisited = 0;
    std::size_t changesFound = 0;
    std::size_t filesRenamed = 0;
    std::size_t skippedTooLong = 0;
};

/**
 * Visits every file below `root`, directory by directory, and sanitizes its
 * name. In WalkMode::Apply the file is renamed inside its own directory unless
 * the new name collides with another entry or the resulting path is too long
 * for the operating system; both cases are reported and the walk goes on.
 * Any other rename failure, and failure to list `root` itself, throws
 * std::filesystem::filesystem_error.
 */
WalkSummary sanitizeRecursively(const std::filesystem::path& root, WalkMode mode, ChangeReporter& reporter, const WalkOptions& options = WalkOptions());

#endif // WALK_H
