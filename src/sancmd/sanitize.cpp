// SPDX-License-Identifier: GPL-3.0-or-later

#include "../sanitize.h"

#include <algorithm>
#include <string_view>
#include <unordered_set>

#include <uni_algo/conv.h>
#include <uni_algo/norm.h>


// Reserved device names on Windows plus metadata artifacts, matched case-sensitively
static const std::unordered_set<std::string> reservedNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9",
    "Thumbs.db:encryptable"
};

// Characters Windows refuses anywhere in a filename, NUL is checked separately
static const std::u32string_view blacklist = U"\\/:*?\"<>|";


// Function to check for an exact reserved name
bool isReservedName(const std::string& filename) {
    return reservedNames.count(filename) > 0;
}


bool isBlacklisted(char32_t codePoint) {
    return codePoint == U'\0' || blacklist.find(codePoint) != std::u32string_view::npos;
}


// Unicode White_Space code points plus the ASCII separators 0x1C-0x1F
bool isUnicodeWhitespace(char32_t codePoint) {
    switch (codePoint) {
        case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D:
        case 0x001C: case 0x001D: case 0x001E: case 0x001F:
        case 0x0020: case 0x0085: case 0x00A0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return codePoint >= 0x2000 && codePoint <= 0x200A;
    }
}


// Code point seen by the filters; bytes of an undecodable name above 0x7F map
// to the lone surrogates U+DC80-U+DCFF so they never match a filter
static char32_t codePointOf(char c) {
    const auto byte = static_cast<unsigned char>(c);
    return byte < 0x80 ? char32_t(byte) : char32_t(0xDC00 + byte);
}


static char32_t codePointOf(char32_t c) {
    return c;
}


// Drop blacklisted and control code points, keeping the order of the rest
template <typename String>
static void removeForbiddenCodePoints(String& name) {
    name.erase(std::remove_if(name.begin(), name.end(), [](auto c) {
        const char32_t codePoint = codePointOf(c);
        return isBlacklisted(codePoint) || codePoint <= 31;
    }), name.end());
}


// Windows rejects names ending in a dot or a space; whitespace goes with them
// so trimming it can never leave a dot at the end
template <typename String>
static void stripTrailingDotsAndSpaces(String& name) {
    while (!name.empty() && (name.back() == '.' || isUnicodeWhitespace(codePointOf(name.back())))) {
        name.pop_back();
    }
}


template <typename String>
static void stripLeadingWhitespace(String& name) {
    auto firstKept = std::find_if(name.begin(), name.end(), [](auto c) {
        return !isUnicodeWhitespace(codePointOf(c));
    });
    name.erase(name.begin(), firstKept);
}


static std::u32string toNfkd(const std::u32string& name) {
    return una::utf8to32u(una::norm::to_nfkd_utf8(una::utf32to8(name)));
}


// Cut an over-long name down to MAX_FILENAME_LENGTH, keeping the extension of
// the last path-like segment when there is one
template <typename String>
static void truncateKeepingExtension(String& name) {
    const String separators{'/', '\\'};
    const std::size_t lastSeparator = name.find_last_of(separators);
    const std::size_t segmentStart = (lastSeparator == String::npos) ? 0 : lastSeparator + 1;
    const std::size_t lastDot = name.rfind('.');

    String base = name;
    String extension;
    if (lastDot != String::npos && lastDot >= segmentStart) {
        base = name.substr(0, lastDot);
        extension = name.substr(lastDot);
    }

    if (base.empty()) {
        base = String(2, '_');
    }

    // Keep the tail of an extension that would not leave room for a base
    if (extension.size() > MAX_EXTENSION_LENGTH) {
        extension = extension.substr(extension.size() - MAX_EXTENSION_LENGTH);
    }

    base.resize(std::min(base.size(), MAX_FILENAME_LENGTH - extension.size()));
    name = base + extension;

    // Cutting the base may have exposed a dot or a space
    stripTrailingDotsAndSpaces(name);
    if (name.empty()) {
        name = String(2, '_');
    }
}


// Steps that follow character removal, for decoded and raw names alike
template <typename String>
static void finishSanitization(String& name) {
    stripTrailingDotsAndSpaces(name);
    stripLeadingWhitespace(name);

    if (std::all_of(name.begin(), name.end(), [](auto c) { return c == '.'; })) {
        name.insert(name.begin(), 2, '_');
    }

    if (name.size() > MAX_FILENAME_LENGTH) {
        truncateKeepingExtension(name);
    }
}


// Transformation shared by both sanitizeFilename overloads
static std::string applySanitization(const std::string& filename) {
    // A name that is not UTF-8 is filtered byte by byte and never decoded, so
    // its foreign bytes stay exactly as they are on disk
    if (!una::is_valid_utf8(filename)) {
        std::string raw = filename;
        removeForbiddenCodePoints(raw);
        finishSanitization(raw);
        return raw;
    }

    std::u32string name = una::utf8to32u(filename);

    removeForbiddenCodePoints(name);
    name = toNfkd(name);
    // Compatibility decomposition turns fullwidth solidus, colon and friends
    // into their ASCII forms, which must not survive either
    removeForbiddenCodePoints(name);

    finishSanitization(name);
    return una::utf32to8(name);
}


std::string sanitizeFilename(const std::string& filename, const std::string& containingDir, ExceptionList& exceptions) {
    // Reserved names need a human, record them and leave them alone
    if (isReservedName(filename)) {
        exceptions.push_back({containingDir, filename});
        return filename;
    }
    return applySanitization(filename);
}


std::string sanitizeFilename(const std::string& filename) {
    if (isReservedName(filename)) {
        return filename;
    }
    return applySanitization(filename);
}
