// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef HEADERS_H
#define HEADERS_H

//==============================
// STANDARD LIBRARY INCLUDES
//==============================
// C++ Standard Library
#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_set>
#include <vector>

// System Libraries
#include <readline/readline.h>
#include <sys/stat.h>
#include <unistd.h>

//==============================
// GLOBAL NAMESPACE ALIASES
//==============================
namespace fs = std::filesystem;

//==============================
// GLOBAL VARIABLES & CONSTANTS
//==============================
// Program version
extern const std::string SANCMD_VERSION;

// Terminal colors
namespace color {
    extern const char* const reset;
    extern const char* const bold;
    extern const char* const red;
    extern const char* const green;
    extern const char* const yellow;
    extern const char* const blue;
    extern const char* const redBold;
    extern const char* const yellowBold;
}

//==============================
// SANITIZE COMMANDER FUNCTIONS
//==============================

// Forward declaration
struct SanitizeOptions;

// Answers accepted at the confirmation prompt
enum class RunChoice {
    Apply,
    ColdRun,
    Abort
};

//------------------
// Boolean Functions
//------------------
bool parseOptions(int argc, char* argv[], SanitizeOptions& options, int& exitCode);
bool isTerminal(int fd);

//------------------
// Void Functions (UI)
//------------------
void printHelp();
void printVersionNumber(const std::string& version);
void printError(const std::string& error, bool colored = true);
void printVerbose(const std::string& message, bool verbose);
void clearScrollBuffer();

//------------------
// Void Functions (Signal Handling)
//------------------
void setupPromptSignalHandlers();
void restoreDefaultSignalHandlers();
void promptInterruptHandler(int signum);

//------------------
// Return Type Functions
//------------------
RunChoice promptRunChoice(const fs::path& root, bool colored);
RunChoice parseRunChoice(std::string_view answer);
std::string trimRight(std::string_view str);
std::string paint(const std::string& text, const char* colorCode, bool colored);

#endif // HEADERS_H
