#pragma once

#include "multidl/handler.hpp"
#include <iosfwd>

namespace multidl {

// Line-oriented prompts on a pair of streams. Password echo is turned off
// when `in` is std::cin attached to a terminal.
class ConsoleInteraction : public InteractionContext {
public:
    ConsoleInteraction(std::istream& in, std::ostream& out);

    bool requestLogin(SourceId source, LoginRequest& out) override;
    std::string requestSecondFactorCode(SourceId source) override;
    std::string requestExportPath(SourceId source) override;
    void showError(const std::string& message) override;

private:
    bool prompt(const std::string& label, std::string& value, bool secret = false);

    std::istream& in_;
    std::ostream& out_;
};

} // namespace multidl
