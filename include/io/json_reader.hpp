#pragma once

#include <filesystem>
#include <string>

#include "nlohmann/json.hpp"

namespace branchsweep::io {

std::string readTextFile(const std::filesystem::path &path);
nlohmann::json parseJsonObject(const std::string &text, const std::string &origin);

} // namespace branchsweep::io
