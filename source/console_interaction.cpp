#include "multidl/console_interaction.hpp"

#include "multidl/raii.hpp"
#include "multidl/util.hpp"

#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace multidl {

ConsoleInteraction::ConsoleInteraction(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

bool ConsoleInteraction::prompt(const std::string& label, std::string& value, bool secret) {
    out_ << label << ": " << std::flush;

    struct termios saved{};
    const bool hideEcho = secret && &in_ == &std::cin && ::isatty(STDIN_FILENO) &&
                          ::tcgetattr(STDIN_FILENO, &saved) == 0;
    if (hideEcho) {
        struct termios quiet = saved;
        quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSANOW, &quiet);
    }
    auto restore = make_scope_guard([&]() {
        if (!hideEcho) return;
        ::tcsetattr(STDIN_FILENO, TCSANOW, &saved);
        out_ << "\n";
    });

    if (!std::getline(in_, value)) return false;
    if (!secret) value = util::trimCopy(value);
    return true;
}

bool ConsoleInteraction::requestLogin(SourceId source, LoginRequest& out) {
    out_ << sourceDisplayName(source) << " login (leave password empty to import a session file)\n";
    if (!prompt("Username", out.username)) return false;
    if (!prompt("Password", out.password, true)) return false;
    if (out.password.empty()) {
        if (!prompt("Session file", out.sessionFile)) return false;
    }
    return !(out.username.empty() && out.password.empty() && out.sessionFile.empty());
}

std::string ConsoleInteraction::requestSecondFactorCode(SourceId source) {
    std::string code;
    if (!prompt(std::string(sourceDisplayName(source)) + " 2FA code (empty to cancel)", code)) return {};
    return code;
}

std::string ConsoleInteraction::requestExportPath(SourceId /*source*/) {
    std::string path;
    if (!prompt("Export session copy to (empty to skip)", path)) return {};
    return path;
}

void ConsoleInteraction::showError(const std::string& message) {
    out_ << "Error: " << message << std::endl;
}

} // namespace multidl
