// SPDX-License-Identifier: GPL-3.0-or-later

#include "../headers.h"
#include "../report.h"
#include "../walk.h"


// One directory listing, taken in full before anything inside it is renamed
struct DirectoryListing {
    std::vector<std::string> files;
    std::vector<fs::path> subdirectories;
};


// Function to list a directory, sorting both lists for reproducible output
static DirectoryListing listDirectory(const fs::path& directory, std::error_code& ec) {
    DirectoryListing listing;

    fs::directory_iterator it(directory, ec);
    if (ec) {
        return listing;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;

        // A dangling symlink fails to resolve and counts as a file entry
        std::error_code statusError;
        const bool isDirectory = entry.is_directory(statusError);

        if (isDirectory) {
            // Symlinked directories are never descended into
            std::error_code linkError;
            if (!entry.is_symlink(linkError)) {
                listing.subdirectories.push_back(entry.path());
            }
        } else {
            listing.files.push_back(entry.path().filename().string());
        }
    }
    if (ec) {
        return listing;
    }

    std::sort(listing.files.begin(), listing.files.end());
    std::sort(listing.subdirectories.begin(), listing.subdirectories.end());
    return listing;
}


// Function to tell whether renaming source to target would replace another file
static bool targetCollides(const fs::path& source, const fs::path& target) {
    struct stat sourceStat;
    struct stat targetStat;

    if (lstat(target.c_str(), &targetStat) != 0) {
        // Missing or unreachable target, rename decides what happens
        return false;
    }
    if (lstat(source.c_str(), &sourceStat) != 0) {
        return true;
    }

    // Case-only renames on case-insensitive filesystems resolve to the same inode
    return sourceStat.st_dev != targetStat.st_dev || sourceStat.st_ino != targetStat.st_ino;
}


// Function to sanitize the files of one directory and descend into its subdirectories
static void sanitizeDirectory(const fs::path& directory, int depth, WalkMode mode, ChangeReporter& reporter, const WalkOptions& options, WalkSummary& summary) {
    std::error_code ec;
    DirectoryListing listing = listDirectory(directory, ec);

    if (ec) {
        // Only the root is essential, anything below it is skipped and reported
        if (depth == 0) {
            throw fs::filesystem_error("cannot list directory", directory, ec);
        }
        std::string message = "Error traversing directory: " + directory.string() + " - " + ec.message();
        reporter.reportTraversalError(message);
        summary.errors.push_back(std::move(message));
        return;
    }

    const std::string directoryName = directory.string();

    // Sanitized names already taken by an earlier entry of this listing, so a
    // cold run reports the same collisions a real run runs into
    std::unordered_set<std::string> claimedNames;

    for (const auto& filename : listing.files) {
        ++summary.filesVisited;

        const std::string sanitized = sanitizeFilename(filename, directoryName, summary.exceptions);
        if (sanitized == filename) {
            reporter.reportUnchanged(directoryName, filename);
            continue;
        }

        ++summary.changesFound;
        reporter.reportChange(directoryName, filename, sanitized, mode);

        const fs::path source = directory / filename;
        const fs::path target = directory / sanitized;

        if (claimedNames.count(sanitized) > 0 || targetCollides(source, target)) {
            reporter.reportCollision(directoryName, filename, sanitized, mode);
            summary.collisions.push_back(source.string() + " -> " + sanitized);
            continue;
        }

        if (mode == WalkMode::DryRun) {
            claimedNames.insert(sanitized);
            continue;
        }

        std::error_code renameError;
        fs::rename(source, target, renameError);
        if (!renameError) {
            ++summary.filesRenamed;
            claimedNames.insert(sanitized);
        } else if (renameError == std::errc::filename_too_long) {
            ++summary.skippedTooLong;
            reporter.reportNameTooLong(directoryName, filename, sanitized);
        } else {
            throw fs::filesystem_error("cannot rename", source, target, renameError);
        }
    }

    if (options.maxDepth >= 0 && depth >= options.maxDepth) {
        return;
    }

    for (const auto& subdirectory : listing.subdirectories) {
        sanitizeDirectory(subdirectory, depth + 1, mode, reporter, options, summary);
    }
}


WalkSummary sanitizeRecursively(const fs::path& root, WalkMode mode, ChangeReporter& reporter, const WalkOptions& options) {
    WalkSummary summary;

    sanitizeDirectory(root, 0, mode, reporter, options, summary);

    // Exceptions are only reported once the whole tree has been seen
    reporter.reportSummary(summary, mode);
    return summary;
}
