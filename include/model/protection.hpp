#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace branchsweep::model {

inline constexpr const char *kConfigFileName = ".git-cleanup-config.json";
inline constexpr const char *kProtectedBranchesKey = "protectedBranches";

enum class ProtectionSource {
    Defaults,
    ConfigFile,
};

struct ProtectedBranches {
    std::vector<std::string> names;
    ProtectionSource source = ProtectionSource::Defaults;
    // Set when the file existed but could not be used.
    std::optional<std::string> problem;

    bool contains(const std::string &name) const;
};

const std::vector<std::string> &defaultProtectedBranches();

// `contents` is the config file text, or nullopt when there is no file.
ProtectedBranches resolveProtectedBranches(const std::optional<std::string> &contents, const std::string &origin);

ProtectedBranches loadProtectedBranches(const std::filesystem::path &configPath, const branchsweep::Context &ctx);

} // namespace branchsweep::model
