#include "git/repository.hpp"

#include <stdexcept>
#include <utility>

#include "io/process.hpp"

namespace branchsweep::git
{

    namespace
    {

        constexpr const char *kNotFullyMerged = "not fully merged";

        // git translates its messages, including the ": gone]" tracking marker and
        // the "not fully merged" refusal. Both are matched in the C locale text.
        const io::EnvOverrides &untranslated()
        {
            static const io::EnvOverrides kEnv = {{"LC_ALL", "C"}};
            return kEnv;
        }

    } // namespace

    bool isNotFullyMerged(const DeleteOutcome &outcome)
    {
        return !outcome.ok && outcome.message.find(kNotFullyMerged) != std::string::npos;
    }

    CliRepository::CliRepository(const branchsweep::Context &ctx, std::filesystem::path workDir, std::string gitExecutable)
        : ctx_(ctx), workDir_(std::move(workDir)), git_(std::move(gitExecutable))
    {
    }

    bool CliRepository::isInsideWorkTree()
    {
        const auto result = io::runCommandCapture(git_, {"rev-parse", "--is-inside-work-tree"}, workDir_, ctx_);
        return result.ok();
    }

    bool CliRepository::fetchPrune()
    {
        const auto result = io::runCommand(git_, {"fetch", "-p"}, workDir_, ctx_);
        return result.ok();
    }

    std::string CliRepository::listBranchesVerbose()
    {
        auto result = io::runCommandCapture(git_, {"branch", "-vv", "--no-color"}, workDir_, ctx_, untranslated());
        if (!result.ok())
        {
            std::string reason = "Command failed (" + std::to_string(result.code) + "): " + result.commandLine;
            if (!result.err.empty())
            {
                reason += "\n" + result.err;
            }
            throw std::runtime_error(reason);
        }
        return std::move(result.out);
    }

    DeleteOutcome CliRepository::deleteBranch(const std::string &name, DeleteMode mode)
    {
        const char *flag = mode == DeleteMode::Force ? "-D" : "-d";
        const auto result = io::runCommandCapture(git_, {"branch", flag, name}, workDir_, ctx_, untranslated());

        DeleteOutcome outcome;
        outcome.ok = result.ok();
        outcome.message = result.ok() ? result.out : result.err;
        return outcome;
    }

} // namespace branchsweep::git
