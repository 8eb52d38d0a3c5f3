#pragma once
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Core/interfaces/IClock.hpp"
#include "Core/interfaces/ICommandRunner.hpp"
#include "Core/interfaces/IGuestLauncher.hpp"

/**
 * @brief Launches qemu-system-<arch> directly
 *
 * Daemonized guests detach immediately; the launch succeeds once QEMU has
 * written its pid file. Foreground guests block until QEMU exits.
 */
class QemuProcessLauncher : public IGuestLauncher {
public:
    static constexpr std::chrono::seconds kPidFileTimeout{5};
    static constexpr std::chrono::milliseconds kPidFilePoll{100};

    QemuProcessLauncher(std::shared_ptr<ICommandRunner> runner, std::shared_ptr<IClock> clock);

    LaunchedGuest launch(const GuestSpec& spec) override;
    [[nodiscard]] std::string describe(const GuestSpec& spec) const override;
    [[nodiscard]] const char* backend() const noexcept override { return "qemu"; }

    // QEMU arguments, not including the emulator itself.
    [[nodiscard]] static std::vector<std::string> arguments(const GuestSpec& spec);

    // Program and argv actually executed, with the sudo prefix when requested.
    [[nodiscard]] static std::pair<std::string, std::vector<std::string>> commandLine(const GuestSpec& spec);

private:
    std::optional<int> waitForPidFile(const std::filesystem::path& pidFile);

    std::shared_ptr<ICommandRunner> runner;
    std::shared_ptr<IClock> clock;
};

// First integer in the file, if any.
[[nodiscard]] std::optional<int> readPidFile(const std::filesystem::path& pidFile);
