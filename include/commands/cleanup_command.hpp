#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

#include "core/context.hpp"
#include "git/repository.hpp"
#include "ui/prompt.hpp"

namespace branchsweep::commands {

struct CleanupOptions {
    bool dryRun = false;
    std::filesystem::path configFile;
};

enum class BranchOutcome {
    Deleted,
    ForceDeleted,
    Skipped,
    Failed,
    WouldDelete,
};

struct DeletionReport {
    std::vector<std::pair<std::string, BranchOutcome>> entries;

    std::size_t count(BranchOutcome outcome) const;
    std::string summary() const;
};

// Deletes each selected branch in order. A failure only affects its own
// branch; the rest of the batch still runs.
DeletionReport deleteBranches(
    const branchsweep::Context &ctx,
    git::Repository &repo,
    ui::Prompter &prompter,
    const std::vector<std::string> &selection,
    bool dryRun
);

int runCleanupCommand(
    const branchsweep::Context &ctx,
    git::Repository &repo,
    ui::Prompter &prompter,
    const CleanupOptions &options
);

} // namespace branchsweep::commands
