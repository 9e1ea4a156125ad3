#pragma once

#include <filesystem>
#include <string>

#include "core/context.hpp"

namespace branchsweep::git {

enum class DeleteMode {
    Safe,
    Force,
};

struct DeleteOutcome {
    bool ok = false;
    std::string message;
};

// True when a safe delete was refused because the branch has commits not
// merged anywhere else. Matches git's own wording.
bool isNotFullyMerged(const DeleteOutcome &outcome);

class Repository {
public:
    virtual ~Repository() = default;

    virtual bool isInsideWorkTree() = 0;
    virtual bool fetchPrune() = 0;
    // Throws std::runtime_error when git cannot list branches.
    virtual std::string listBranchesVerbose() = 0;
    virtual DeleteOutcome deleteBranch(const std::string &name, DeleteMode mode) = 0;
};

class CliRepository : public Repository {
public:
    CliRepository(const branchsweep::Context &ctx, std::filesystem::path workDir, std::string gitExecutable = "git");

    bool isInsideWorkTree() override;
    bool fetchPrune() override;
    std::string listBranchesVerbose() override;
    DeleteOutcome deleteBranch(const std::string &name, DeleteMode mode) override;

private:
    const branchsweep::Context &ctx_;
    std::filesystem::path workDir_;
    std::string git_;
};

} // namespace branchsweep::git
