// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef REPORT_H
#define REPORT_H

#include "walk.h"

#include <ostream>
#include <string>

// Receives the events of a walk; rendering is up to the implementation
class ChangeReporter {
public:
    virtual ~ChangeReporter() = default;

    virtual void reportChange(const std::string& directory, const std::string& original, const std::string& sanitized, WalkMode mode) = 0;
    virtual void reportUnchanged(const std::string& directory, const std::string& filename) = 0;
    virtual void reportNameTooLong(const std::string& directory, const std::string& original, const std::string& sanitized) = 0;
    virtual void reportCollision(const std::string& directory, const std::string& original, const std::string& sanitized, WalkMode mode) = 0;
    virtual void reportTraversalError(const std::string& message) = 0;
    virtual void reportSummary(const WalkSummary& summary, WalkMode mode) = 0;
};

// Human readable report on a terminal, with or without ANSI colors
class ConsoleReporter : public ChangeReporter {
public:
    ConsoleReporter(std::ostream& out, std::ostream& err, bool colored, bool verbose);

    void reportChange(const std::string& directory, const std::string& original, const std::string& sanitized, WalkMode mode) override;
    void reportUnchanged(const std::string& directory, const std::string& filename) override;
    void reportNameTooLong(const std::string& directory, const std::string& original, const std::string& sanitized) override;
    void reportCollision(const std::string& directory, const std::string& original, const std::string& sanitized, WalkMode mode) override;
    void reportTraversalError(const std::string& message) override;
    void reportSummary(const WalkSummary& summary, WalkMode mode) override;

private:
    std::string paintIf(const std::string& text, const char* colorCode) const;

    std::ostream& out_;
    std::ostream& err_;
    bool colored_;
    bool verbose_;
};

#endif // REPORT_H
