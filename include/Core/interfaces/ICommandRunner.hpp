#pragma once
#include <map>
#include <string>
#include <vector>
#include "Utils/Result.hpp"

struct CommandOutput {
    int exitCode{-1};
    std::string out;
    std::string err;

    [[nodiscard]] bool ok() const noexcept { return exitCode == 0; }
};

/**
 * @brief Runs host utilities on behalf of the rest of the code.
 *
 * Every OS interaction (qemu-img, ip, arp, ping, ISO builders) goes through
 * this seam so it can be replaced by a mock in tests.
 */
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    /**
     * @brief Runs a program to completion and captures its output
     * @param program Program name (looked up in PATH) or absolute path
     * @param args Arguments, not including argv[0]
     * @param env Extra environment variables layered over the current one
     * @return Captured output; an error only when the program could not be started
     */
    [[nodiscard]] virtual Result<CommandOutput> run(
        const std::string& program,
        const std::vector<std::string>& args,
        const std::map<std::string, std::string>& env = {}) = 0;

    /**
     * @brief Runs a program in the foreground with the caller's stdio
     * @return Exit status; an error only when the program could not be started
     */
    [[nodiscard]] virtual Result<int> runAttached(const std::string& program,
                                                  const std::vector<std::string>& args) = 0;

    /**
     * @brief Starts a program without waiting for it
     * @return false if it could not be started
     */
    virtual bool spawnDetached(const std::string& program,
                               const std::vector<std::string>& args) = 0;

    // True if program resolves to an executable
    [[nodiscard]] virtual bool exists(const std::string& program) const = 0;
};
