#pragma once
#include <memory>
#include "Core/interfaces/ICommandRunner.hpp"
#include "Core/concurrency/EventDispatcher.hpp"

/**
 * Boost.Process backed runner. Detached children are registered on the
 * dispatcher's io_context so their exit is reaped without anyone waiting.
 */
class CommandRunner : public ICommandRunner {
public:
    explicit CommandRunner(std::shared_ptr<CONCURRENCY::EventDispatcher> dispatcher = nullptr);
    ~CommandRunner() override;

    CommandRunner(const CommandRunner&) = delete;
    CommandRunner& operator=(const CommandRunner&) = delete;

    [[nodiscard]] Result<CommandOutput> run(
        const std::string& program,
        const std::vector<std::string>& args,
        const std::map<std::string, std::string>& env = {}) override;

    [[nodiscard]] Result<int> runAttached(const std::string& program,
                                          const std::vector<std::string>& args) override;

    bool spawnDetached(const std::string& program,
                       const std::vector<std::string>& args) override;

    [[nodiscard]] bool exists(const std::string& program) const override;

private:
    std::shared_ptr<CONCURRENCY::EventDispatcher> dispatcher_;
};

// Joins program and args into a single printable line (dry runs, logs).
[[nodiscard]] std::string formatCommandLine(const std::string& program,
                                            const std::vector<std::string>& args);
