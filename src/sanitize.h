// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef SANITIZE_H
#define SANITIZE_H

#include <cstddef>
#include <string>
#include <vector>

// Longest filename accepted by common filesystems, counted in code points
constexpr std::size_t MAX_FILENAME_LENGTH = 255;

// An extension may take every code point but one, leaving room for a base
constexpr std::size_t MAX_EXTENSION_LENGTH = MAX_FILENAME_LENGTH - 1;

// A reserved filename found during a walk, left untouched for manual review
struct ExceptionRecord {
    std::string directory;
    std::string filename;
};

using ExceptionList = std::vector<ExceptionRecord>;

/**
 * Returns a filename that is safe on Windows and POSIX filesystems.
 *
 * Names that exactly match a reserved Windows device name (case-sensitive) are
 * returned unchanged and appended to `exceptions` together with
 * `containingDir`. Every other name has blacklisted and control characters
 * removed, is NFKD normalized, loses trailing dots and whitespace and is cut
 * down to MAX_FILENAME_LENGTH code points while keeping its extension.
 * Names that are not valid UTF-8 get the same filters applied byte by byte,
 * without normalization, and keep their non-ASCII bytes.
 * Never fails; degenerate input becomes "__".
 */
std::string sanitizeFilename(const std::string& filename, const std::string& containingDir, ExceptionList& exceptions);

// Same transformation without exception bookkeeping
std::string sanitizeFilename(const std::string& filename);

bool isReservedName(const std::string& filename);
bool isBlacklisted(char32_t codePoint);
bool isUnicodeWhitespace(char32_t codePoint);

#endif // SANITIZE_H
