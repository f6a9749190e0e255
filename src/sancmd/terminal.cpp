// SPDX-License-Identifier: GPL-3.0-or-later

#include "../headers.h"


namespace color {
    const char* const reset = "\033[0m";
    const char* const bold = "\033[1m";
    const char* const red = "\033[91m";
    const char* const green = "\033[92m";
    const char* const yellow = "\033[93m";
    const char* const blue = "\033[94m";
    const char* const redBold = "\033[1;91m";
    const char* const yellowBold = "\033[1;93m";
}


// Wrap text in a color, or leave it alone for plain output
std::string paint(const std::string& text, const char* colorCode, bool colored) {
    if (!colored) {
        return text;
    }
    return std::string(colorCode) + text + color::reset;
}


bool isTerminal(int fd) {
    return isatty(fd) == 1;
}


// Print an error message to stderr
void printError(const std::string& error, bool colored) {
    std::cerr << paint(error, color::redBold, colored) << std::endl;
}


// Print a message to stdout, assuming verbose mode is enabled
void printVerbose(const std::string& message, bool verbose) {
    if (verbose) {
        std::cout << message << std::endl;
    }
}


// Clear the screen together with the scroll buffer
void clearScrollBuffer() {
    std::cout << "\033[3J\033[2J\033[H\033[0m" << std::flush;
}


// Strip trailing whitespace from prompt input
std::string trimRight(std::string_view str) {
    const auto last = str.find_last_not_of(" \t\n\r\f\v");
    if (last == std::string_view::npos) {
        return "";
    }
    return std::string(str.substr(0, last + 1));
}


// Map the prompt answer to an action, anything unknown means no action
RunChoice parseRunChoice(std::string_view answer) {
    const std::string choice = trimRight(answer);
    if (choice == "Y" || choice == "y") {
        return RunChoice::Apply;
    }
    if (choice == "C" || choice == "c") {
        return RunChoice::ColdRun;
    }
    return RunChoice::Abort;
}


// Set from the SIGINT handler while the prompt is open
static volatile sig_atomic_t promptInterrupted = 0;


void promptInterruptHandler(int signum) {
    (void)signum;
    promptInterrupted = 1;
}


// Readline calls this outside the handler once a read was interrupted;
// Ctrl+C at the prompt leaves without touching anything
static int promptSignalEventHook() {
    if (promptInterrupted) {
        rl_free_line_state();
        rl_cleanup_after_signal();
        std::cout << color::reset << std::endl;
        std::exit(0);
    }
    return 0;
}


// Let our handler deal with Ctrl+C while readline owns the terminal
void setupPromptSignalHandlers() {
    rl_catch_signals = 0;
    promptInterrupted = 0;
    rl_signal_event_hook = promptSignalEventHook;

    struct sigaction sa;
    sa.sa_handler = promptInterruptHandler;
    sigemptyset(&sa.sa_mask);
    // No SA_RESTART, the interrupted read has to return to readline
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
}


// Once a choice is made an interrupt simply terminates the walk
void restoreDefaultSignalHandlers() {
    rl_signal_event_hook = nullptr;

    struct sigaction sa;
    sa.sa_handler = SIG_DFL;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
}


// Show the location and ask what to do with it
RunChoice promptRunChoice(const fs::path& root, bool colored) {
    if (isTerminal(STDOUT_FILENO)) {
        clearScrollBuffer();
    }

    std::cout << paint("Perform filename sanitization recursively in this location:", color::redBold, colored) << "\n"
              << paint(root.string(), color::blue, colored) << "\n"
              << paint("Y - yes, N - no, C - cold run (no file change, only print output)", color::green, colored) << "\n";

    // Readline needs \001 and \002 around escapes to measure the prompt correctly
    const std::string prompt = colored ? "\001\033[1;91m\002(Y | N | C)\001\033[0m\002 : " : "(Y | N | C) : ";

    setupPromptSignalHandlers();
    char* rawInput = readline(prompt.c_str());
    std::unique_ptr<char[], decltype(&std::free)> input(rawInput, &std::free);
    restoreDefaultSignalHandlers();

    // EOF (Ctrl+D) counts as no action
    if (!input.get()) {
        std::cout << "\n";
        return RunChoice::Abort;
    }

    return parseRunChoice(input.get());
}
