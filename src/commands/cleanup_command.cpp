#include "commands/cleanup_command.hpp"

#include <sstream>
#include <string>
#include <vector>

#include "model/branches.hpp"
#include "model/protection.hpp"

namespace branchsweep::commands
{
    namespace
    {

        constexpr const char *kSelectMessage = "Select local branches to delete (whose remote is gone):";

        BranchOutcome forceDelete(const branchsweep::Context &ctx, git::Repository &repo, const std::string &branch)
        {
            const auto forced = repo.deleteBranch(branch, git::DeleteMode::Force);
            if (forced.ok)
            {
                ctx.say(Tone::Accent, "Force deleted ", branch);
                return BranchOutcome::ForceDeleted;
            }

            ctx.error("Failed to force delete '", branch, "'.");
            ctx.detail(forced.message);
            return BranchOutcome::Failed;
        }

        BranchOutcome deleteOne(
            const branchsweep::Context &ctx,
            git::Repository &repo,
            ui::Prompter &prompter,
            const std::string &branch,
            bool dryRun)
        {
            if (dryRun)
            {
                ctx.say(Tone::Success, "[Dry Run] Would delete ", branch);
                return BranchOutcome::WouldDelete;
            }

            const auto outcome = repo.deleteBranch(branch, git::DeleteMode::Safe);
            if (outcome.ok)
            {
                ctx.say(Tone::Success, "Deleted ", branch);
                return BranchOutcome::Deleted;
            }

            if (!git::isNotFullyMerged(outcome))
            {
                ctx.error("Failed to delete '", branch, "'.");
                ctx.detail(outcome.message);
                return BranchOutcome::Failed;
            }

            ctx.warn("'", branch, "' has unmerged changes.");
            if (!prompter.confirm("Do you want to force delete '" + branch + "'?", false))
            {
                ctx.say(Tone::Muted, "Skipped '", branch, "'");
                return BranchOutcome::Skipped;
            }
            return forceDelete(ctx, repo, branch);
        }

    } // namespace

    std::size_t DeletionReport::count(BranchOutcome outcome) const
    {
        std::size_t total = 0;
        for (const auto &entry : entries)
        {
            if (entry.second == outcome)
            {
                ++total;
            }
        }
        return total;
    }

    std::string DeletionReport::summary() const
    {
        std::ostringstream text;
        if (count(BranchOutcome::WouldDelete) > 0)
        {
            text << count(BranchOutcome::WouldDelete) << " would be deleted";
            return text.str();
        }
        text << count(BranchOutcome::Deleted) << " deleted, "
             << count(BranchOutcome::ForceDeleted) << " force deleted, "
             << count(BranchOutcome::Skipped) << " skipped, "
             << count(BranchOutcome::Failed) << " failed";
        return text.str();
    }

    DeletionReport deleteBranches(
        const branchsweep::Context &ctx,
        git::Repository &repo,
        ui::Prompter &prompter,
        const std::vector<std::string> &selection,
        bool dryRun)
    {
        DeletionReport report;
        report.entries.reserve(selection.size());
        for (const auto &branch : selection)
        {
            report.entries.emplace_back(branch, deleteOne(ctx, repo, prompter, branch, dryRun));
        }
        return report;
    }

    int runCleanupCommand(
        const branchsweep::Context &ctx,
        git::Repository &repo,
        ui::Prompter &prompter,
        const CleanupOptions &options)
    {
        if (options.dryRun)
        {
            ctx.say(Tone::Warning, "Running in --dry-run mode. No branches will be deleted.");
            ctx.log();
        }

        if (!repo.isInsideWorkTree())
        {
            ctx.error("This is not a Git repository. Aborting.");
            return 1;
        }

        ctx.say(Tone::Info, "Fetching and pruning remote branches...");
        if (!repo.fetchPrune())
        {
            ctx.error("Failed to fetch from remote. Please check your connection and configuration.");
            return 1;
        }

        const std::string listing = repo.listBranchesVerbose();
        const auto protectedBranches = model::loadProtectedBranches(options.configFile, ctx);
        const auto candidates = model::findGoneBranches(listing, protectedBranches);

        if (candidates.empty())
        {
            ctx.log();
            ctx.say(Tone::Success, "Your local branches are clean. Nothing to do!");
            return 0;
        }

        const auto selection = prompter.selectMany(kSelectMessage, candidates);
        if (selection.empty())
        {
            ctx.say(Tone::Warning, "No branches selected. Operation cancelled.");
            return 0;
        }

        ctx.log();
        const DeletionReport report = deleteBranches(ctx, repo, prompter, selection, options.dryRun);

        ctx.log();
        ctx.say(Tone::Emphasis, "Cleanup complete!");
        ctx.say(Tone::Muted, report.summary());
        return 0;
    }

} // namespace branchsweep::commands
