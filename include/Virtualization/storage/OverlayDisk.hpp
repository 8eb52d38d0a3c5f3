#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "Core/interfaces/ICommandRunner.hpp"

namespace fs = std::filesystem;

/**
 * @brief Files belonging to one single-guest run under a base directory
 *
 *   <base>/base/gold.qcow2, <base>/base/vars.fd
 *   <base>/overlays/<name>.qcow2, <base>/overlays/<name>-vars.fd
 *   <base>/overlays/<name>.pid
 *   <base>/logs/<name>.log
 */
struct GuestLayout {
    fs::path baseDir;
    fs::path goldImage;
    fs::path varsFile;
    fs::path overlay;
    fs::path guestVars;
    fs::path pidFile;
    fs::path logFile;

    [[nodiscard]] static GuestLayout forGuest(const fs::path& baseDir, const std::string& name);

    // mkdir -p base/ overlays/ logs/; throws StorageException.
    void ensureDirectories() const;
};

/**
 * @brief Copy-on-write qcow2 overlays on top of a read-only base image
 */
class OverlayDisk {
public:
    explicit OverlayDisk(std::shared_ptr<ICommandRunner> runner);

    /**
     * @brief Creates overlay backed by base unless it already exists
     * @return true if created, false if an existing overlay was reused
     * @throws SetupException if base is missing, StorageException if qemu-img fails
     */
    bool create(const fs::path& base, const fs::path& overlay);

    /**
     * @brief Per-guest copy of the UEFI variable store
     * @return true if copied, false if the copy already existed
     */
    bool copyVars(const fs::path& sharedVars, const fs::path& guestVars);

    [[nodiscard]] static std::vector<std::string> createArguments(const fs::path& base,
                                                                  const fs::path& overlay);

private:
    std::shared_ptr<ICommandRunner> runner;
};
