#include "action_surface.hpp"
#include "util.hpp"
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <iostream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace vigil {

std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

bool run_command(const std::string& cmd, uint32_t timeout_seconds) {
    pid_t pid = fork();
    if (pid < 0) {
        std::cerr << "[action] Failed to fork process\n";
        return false;
    }

    if (pid == 0) {
        // Child process: detach from controlling terminal, discard output
        setsid();
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }
        execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
        _exit(127);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    int status = 0;
    while (true) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) break;
        if (r < 0) return false;
        if (std::chrono::steady_clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            waitpid(pid, &status, 0);
            std::cerr << "[action] Timed out: " << cmd << "\n";
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

CommandActionSurface::CommandActionSurface(
    std::unordered_map<std::string, std::string> commands, uint32_t timeout_seconds)
    : commands_(std::move(commands)), timeout_(timeout_seconds) {}

static bool substitute(std::string& cmd, const char* placeholder,
                       const nlohmann::json& args, const char* key) {
    if (cmd.find(placeholder) == std::string::npos) return true;
    if (!args.contains(key)) return false;
    std::string value;
    if (args[key].is_string()) value = args[key].get<std::string>();
    else if (args[key].is_number_integer()) value = std::to_string(args[key].get<long long>());
    else return false;
    if (std::string(key) == "path") value = expand_home(value);
    cmd = replace_all(cmd, placeholder, shell_quote(value));
    return true;
}

std::string CommandActionSurface::render(const ActionIntent& intent) const {
    auto it = commands_.find(intent.action);
    if (it == commands_.end() || trim(it->second).empty()) return {};

    nlohmann::json args = intent.args;
    if (!args.contains("path") && args.contains("query")) args["path"] = args["query"];
    if (!args.contains("value") &&
        (intent.action == "increase_brightness" || intent.action == "decrease_brightness"))
        args["value"] = 10;

    std::string cmd = it->second;
    if (!substitute(cmd, "{value}", args, "value") ||
        !substitute(cmd, "{url}", args, "url") ||
        !substitute(cmd, "{app}", args, "app_name") ||
        !substitute(cmd, "{path}", args, "path")) {
        return {};
    }
    return cmd;
}

bool CommandActionSurface::perform(const ActionIntent& intent) {
    if (intent.action == "reply") return true;
    if (!validate_intent(intent)) {
        std::cerr << "[action] Rejected invalid intent: " << describe_intent(intent) << "\n";
        return false;
    }
    std::string cmd = render(intent);
    if (cmd.empty()) {
        std::cerr << "[action] No command configured for " << intent.action << "\n";
        return false;
    }
    return run_command(cmd, timeout_);
}

} // namespace vigil
