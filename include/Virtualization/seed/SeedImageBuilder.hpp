#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "Core/interfaces/ICommandRunner.hpp"

/**
 * @brief Packs a seed directory into an ISO9660 volume labelled "cidata"
 *
 * Tries hdiutil (macOS), genisoimage, mkisofs and xorrisofs in that order and
 * moves on to the next tool when one fails.
 */
class SeedImageBuilder {
public:
    static constexpr const char* kVolumeId = "cidata";

    explicit SeedImageBuilder(std::shared_ptr<ICommandRunner> runner);

    /**
     * @brief Builds iso from dir
     * @return Name of the tool that produced the image
     * @throws SetupException when no builder is installed,
     *         SeedImageException when every installed builder failed
     */
    std::string build(const std::filesystem::path& dir, const std::filesystem::path& iso);

    // Installed builders in preference order.
    [[nodiscard]] std::vector<std::string> availableTools() const;

    // Argument list for tool; hdiutil writes to iso without its extension.
    [[nodiscard]] static std::vector<std::string> arguments(const std::string& tool,
                                                            const std::filesystem::path& dir,
                                                            const std::filesystem::path& iso);

    [[nodiscard]] static const std::vector<std::string>& knownTools();

private:
    bool buildWithHdiutil(const std::filesystem::path& dir, const std::filesystem::path& iso);

    std::shared_ptr<ICommandRunner> runner;
};
