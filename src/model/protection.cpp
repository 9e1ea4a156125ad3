#include "model/protection.hpp"

#include <algorithm>
#include <exception>
#include <system_error>

#include "io/json_reader.hpp"

namespace fs = std::filesystem;
using nlohmann::json;

namespace branchsweep::model
{

    namespace
    {

        std::vector<std::string> toStringList(const json &node)
        {
            std::vector<std::string> out;
            if (!node.is_array())
            {
                return out;
            }

            for (const auto &item : node)
            {
                if (!item.is_string())
                {
                    continue;
                }
                std::string value = item.get<std::string>();
                if (!value.empty())
                {
                    out.push_back(value);
                }
            }
            return out;
        }

        ProtectedBranches defaults()
        {
            ProtectedBranches out;
            out.names = defaultProtectedBranches();
            out.source = ProtectionSource::Defaults;
            return out;
        }

    } // namespace

    bool ProtectedBranches::contains(const std::string &name) const
    {
        return std::find(names.begin(), names.end(), name) != names.end();
    }

    const std::vector<std::string> &defaultProtectedBranches()
    {
        static const std::vector<std::string> kDefaults = {
            "main", "master", "develop", "dev", "prod", "production"};
        return kDefaults;
    }

    ProtectedBranches resolveProtectedBranches(const std::optional<std::string> &contents, const std::string &origin)
    {
        if (!contents.has_value())
        {
            return defaults();
        }

        json data;
        try
        {
            data = io::parseJsonObject(contents.value(), origin);
        }
        catch (const std::exception &e)
        {
            ProtectedBranches out = defaults();
            out.problem = e.what();
            return out;
        }

        if (!data.contains(kProtectedBranchesKey) || !data[kProtectedBranchesKey].is_array())
        {
            return defaults();
        }

        ProtectedBranches out;
        out.names = toStringList(data[kProtectedBranchesKey]);
        out.source = ProtectionSource::ConfigFile;
        return out;
    }

    ProtectedBranches loadProtectedBranches(const fs::path &configPath, const branchsweep::Context &ctx)
    {
        std::optional<std::string> contents;
        std::error_code ec;
        if (fs::exists(configPath, ec))
        {
            try
            {
                contents = io::readTextFile(configPath);
            }
            catch (const std::exception &e)
            {
                ctx.warn("Error reading or parsing config file: ", e.what());
                ctx.warn("Falling back to default protected branches.");
                return defaults();
            }
        }

        ProtectedBranches out = resolveProtectedBranches(contents, configPath.filename().string());
        if (out.problem.has_value())
        {
            ctx.warn("Error reading or parsing config file: ", out.problem.value());
            ctx.warn("Falling back to default protected branches.");
            return out;
        }

        if (out.source == ProtectionSource::ConfigFile)
        {
            ctx.say(Tone::Muted, "Loaded protected branches from ", configPath.filename().string());
        }
        else
        {
            ctx.say(Tone::Muted, "Using default protected branches. Create ", kConfigFileName, " to override.");
        }
        return out;
    }

} // namespace branchsweep::model
