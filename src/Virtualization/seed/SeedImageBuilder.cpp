#include "Virtualization/seed/SeedImageBuilder.hpp"
#include "System/Logger.hpp"
#include "Utils/Exception.hpp"

namespace fs = std::filesystem;

SeedImageBuilder::SeedImageBuilder(std::shared_ptr<ICommandRunner> runner) : runner(std::move(runner)) {}

const std::vector<std::string>& SeedImageBuilder::knownTools() {
    static const std::vector<std::string> tools{"hdiutil", "genisoimage", "mkisofs", "xorrisofs"};
    return tools;
}

std::vector<std::string> SeedImageBuilder::availableTools() const {
    std::vector<std::string> found;
    for (const auto& tool : knownTools()) {
        if (runner->exists(tool)) found.push_back(tool);
    }
    return found;
}

std::vector<std::string> SeedImageBuilder::arguments(const std::string& tool,
                                                     const fs::path& dir,
                                                     const fs::path& iso) {
    if (tool == "hdiutil") {
        fs::path stem = iso;
        stem.replace_extension();
        return {"makehybrid", "-iso", "-joliet", "-default-volume-name", kVolumeId,
                "-o", stem.string(), dir.string()};
    }
    if (tool == "xorrisofs") {
        return {"-o", iso.string(), "-V", kVolumeId, "-J", "-R", dir.string()};
    }
    // genisoimage and mkisofs share their command line.
    return {"-output", iso.string(), "-volid", kVolumeId, "-joliet", "-rock", dir.string()};
}

std::string SeedImageBuilder::build(const fs::path& dir, const fs::path& iso) {
    const auto tools = availableTools();
    if (tools.empty()) {
        throw SetupException("No ISO builder found (need hdiutil, genisoimage, mkisofs, or xorrisofs).");
    }

    for (const auto& tool : tools) {
        if (tool == "hdiutil") {
            if (buildWithHdiutil(dir, iso)) return tool;
            continue;
        }
        auto res = runner->run(tool, arguments(tool, dir, iso));
        if (res.isOk() && res.unwrap().ok()) {
            LSLOG_INFO("Built seed image {} with {}", iso.string(), tool);
            return tool;
        }
        LSLOG_WARN("{} failed: {}", tool, res.isOk() ? res.unwrap().err : res.unwrapErr());
    }
    throw SeedImageException("No ISO builder succeeded (hdiutil/genisoimage/mkisofs/xorrisofs). Install one and retry.");
}

bool SeedImageBuilder::buildWithHdiutil(const fs::path& dir, const fs::path& iso) {
    fs::path stem = iso;
    stem.replace_extension();
    std::error_code ec;
    fs::remove_all(stem, ec);

    // hdiutil crashes in forked children unless ObjC fork safety is off.
    auto res = runner->run("hdiutil", arguments("hdiutil", dir, iso),
                           {{"OBJC_DISABLE_INITIALIZE_FORK_SAFETY", "YES"}});
    if (res.isErr() || !res.unwrap().ok()) {
        LSLOG_WARN("hdiutil failed: {}", res.isOk() ? res.unwrap().err : res.unwrapErr());
        return false;
    }

    fs::path produced = stem;
    produced += ".iso";
    if (produced != iso) {
        fs::remove(iso, ec);
        fs::rename(produced, iso, ec);
        if (ec) {
            LSLOG_WARN("cannot move {} to {}: {}", produced.string(), iso.string(), ec.message());
            return false;
        }
    }
    LSLOG_INFO("Built seed image {} with hdiutil", iso.string());
    return true;
}
