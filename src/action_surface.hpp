#pragma once
#include "intent.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>

namespace vigil {

// OS side of an intent: power, network, display, app control. Each call is
// an opaque side effect reporting only success or failure.
class ActionSurface {
public:
    virtual ~ActionSurface() = default;
    virtual bool perform(const ActionIntent& intent) = 0;
};

// Runs a configured shell command template per action. Placeholders
// {value}, {url}, {app} and {path} are replaced with shell-quoted arguments.
class CommandActionSurface : public ActionSurface {
public:
    CommandActionSurface(std::unordered_map<std::string, std::string> commands,
                         uint32_t timeout_seconds = 15);

    bool perform(const ActionIntent& intent) override;

    // Expanded command line, empty if the action has no template or an
    // argument is missing.
    std::string render(const ActionIntent& intent) const;

private:
    std::unordered_map<std::string, std::string> commands_;
    uint32_t timeout_;
};

// Single-quote s for /bin/sh.
std::string shell_quote(const std::string& s);

// Run cmd under /bin/sh, killing it after timeout_seconds. True on exit 0.
bool run_command(const std::string& cmd, uint32_t timeout_seconds);

} // namespace vigil
