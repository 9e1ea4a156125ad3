#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "model/protection.hpp"

namespace branchsweep::model {

inline constexpr std::string_view kGoneMarker = ": gone]";

bool isGoneLine(std::string_view line);

// Branch name of one `git branch -vv` line, without the `*`/`+` worktree
// marker. Empty for blank lines.
std::string branchNameOf(std::string_view line);

// Branches whose upstream is gone, in listing order, minus protected names.
std::vector<std::string> findGoneBranches(const std::string &listing, const ProtectedBranches &protectedBranches);

} // namespace branchsweep::model
