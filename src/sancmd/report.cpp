// SPDX-License-Identifier: GPL-3.0-or-later

#include "../headers.h"
#include "../report.h"


ConsoleReporter::ConsoleReporter(std::ostream& out, std::ostream& err, bool colored, bool verbose)
    : out_(out), err_(err), colored_(colored), verbose_(verbose) {}


std::string ConsoleReporter::paintIf(const std::string& text, const char* colorCode) const {
    return paint(text, colorCode, colored_);
}


// Print directory, original and sanitized name of one file
void ConsoleReporter::reportChange(const std::string& directory, const std::string& original, const std::string& sanitized, WalkMode mode) {
    const char* inputLabel = (mode == WalkMode::DryRun) ? "inp (COLD RUN): " : "inp: ";
    const char* outputLabel = (mode == WalkMode::DryRun) ? "out (COLD RUN): " : "out: ";

    out_ << directory << "\n"
         << inputLabel << paintIf(original, color::red) << "\n"
         << outputLabel << paintIf(sanitized, color::green) << "\n\n";
}


void ConsoleReporter::reportUnchanged(const std::string& directory, const std::string& filename) {
    if (!verbose_) {
        return;
    }
    out_ << paintIf("Skipped", color::yellow) << " file " << (fs::path(directory) / filename).string() << " (name unchanged)\n";
}


void ConsoleReporter::reportNameTooLong(const std::string& directory, const std::string& original, const std::string& sanitized) {
    err_ << paintIf("ERROR: Filename is too long, edit it manually: '" + (fs::path(directory) / sanitized).string() + "'", color::redBold) << "\n"
         << paintIf("File name was not changed: '" + original + "'", color::redBold) << "\n\n";
}


void ConsoleReporter::reportCollision(const std::string& directory, const std::string& original, const std::string& sanitized, WalkMode mode) {
    const std::string verb = (mode == WalkMode::DryRun) ? "Would not rename" : "Cannot rename";
    err_ << paintIf(verb + " '" + original + "': '" + sanitized + "' already exists in " + directory, color::redBold) << "\n"
         << paintIf("File name was not changed", color::redBold) << "\n\n";
}


void ConsoleReporter::reportTraversalError(const std::string& message) {
    err_ << paintIf(message, color::redBold) << "\n";
}


// Print everything that needs the operator's attention once the walk is over
void ConsoleReporter::reportSummary(const WalkSummary& summary, WalkMode mode) {
    if (!summary.exceptions.empty()) {
        out_ << paintIf("Reserved names found, these were not renamed and need manual attention:", color::yellowBold) << "\n";
        for (const auto& exception : summary.exceptions) {
            out_ << exception.directory << "\n"
                 << "    " << paintIf(exception.filename, color::red) << "\n";
        }
        out_ << "\n";
    }

    if (!summary.collisions.empty()) {
        out_ << paintIf("Name collisions, left untouched:", color::yellowBold) << "\n";
        for (const auto& collision : summary.collisions) {
            out_ << "    " << collision << "\n";
        }
        out_ << "\n";
    }

    if (!summary.errors.empty()) {
        out_ << paintIf("Directories that could not be traversed:", color::yellowBold) << "\n";
        for (const auto& error : summary.errors) {
            out_ << "    " << error << "\n";
        }
        out_ << "\n";
    }

    std::ostringstream counts;
    counts << "Files scanned: " << summary.filesVisited
           << ", names to sanitize: " << summary.changesFound;
    if (mode == WalkMode::Apply) {
        counts << ", renamed: " << summary.filesRenamed
               << ", too long: " << summary.skippedTooLong;
    }
    counts << ", collisions: " << summary.collisions.size()
           << ", reserved: " << summary.exceptions.size();
    out_ << paintIf(counts.str(), color::bold) << "\n";
}
