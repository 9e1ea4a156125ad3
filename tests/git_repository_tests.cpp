#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

#include "core/context.hpp"
#include "git/repository.hpp"
#include "io/process.hpp"
#include "model/branches.hpp"
#include "model/protection.hpp"

namespace fs = std::filesystem;

using branchsweep::git::DeleteMode;

namespace
{

    // Commits need an identity and must not pick up the developer's config.
    const branchsweep::io::EnvOverrides &isolatedGit()
    {
        static const branchsweep::io::EnvOverrides kEnv = {
            {"GIT_AUTHOR_NAME", "Branch Sweep"},
            {"GIT_AUTHOR_EMAIL", "sweep@example.com"},
            {"GIT_COMMITTER_NAME", "Branch Sweep"},
            {"GIT_COMMITTER_EMAIL", "sweep@example.com"},
            {"GIT_CONFIG_NOSYSTEM", "1"},
            {"LC_ALL", "C"},
        };
        return kEnv;
    }

    // Sets environment variables for the test's lifetime and puts back the old values.
    class ScopedEnv
    {
    public:
        ScopedEnv(const std::string &name, const std::string &value) : name_(name)
        {
            if (const char *old = std::getenv(name.c_str()))
            {
                saved_ = std::string(old);
            }
            setenv(name.c_str(), value.c_str(), 1);
        }

        ~ScopedEnv()
        {
            if (saved_.has_value())
            {
                setenv(name_.c_str(), saved_->c_str(), 1);
            }
            else
            {
                unsetenv(name_.c_str());
            }
        }

        ScopedEnv(const ScopedEnv &) = delete;
        ScopedEnv &operator=(const ScopedEnv &) = delete;

    private:
        std::string name_;
        std::optional<std::string> saved_;
    };

    class GitRepositoryTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            const auto version = branchsweep::io::runCommandCapture("git", {"--version"}, {}, ctx);
            if (!version.ok())
            {
                GTEST_SKIP() << "git is not installed";
            }

            const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
            root = fs::temp_directory_path() /
                   ("branchsweep_git_test_" + std::to_string(getpid()) + "_" + std::to_string(now));
            work = root / "work";
            remote = root / "remote.git";
            fs::create_directories(work);
            fs::create_directories(remote);
        }

        void TearDown() override
        {
            std::error_code ec;
            if (!root.empty())
            {
                fs::remove_all(root, ec);
            }
        }

        void git(const fs::path &dir, const std::vector<std::string> &args)
        {
            std::vector<std::string> full = {"-c", "commit.gpgsign=false", "-c", "core.hooksPath=/dev/null"};
            full.insert(full.end(), args.begin(), args.end());
            const auto result = branchsweep::io::runCommandCapture("git", full, dir, ctx, isolatedGit());
            ASSERT_TRUE(result.ok()) << result.commandLine << "\n" << result.err;
        }

        // feature-x was pushed, then deleted on the remote; main stays.
        void prepareGoneUpstream()
        {
            git(remote, {"init", "-q", "--bare"});
            initWorkRepo();
            git(work, {"remote", "add", "origin", remote.string()});
            git(work, {"push", "-q", "-u", "origin", "main"});
            git(work, {"checkout", "-q", "-b", "feature-x"});
            git(work, {"commit", "-q", "--allow-empty", "-m", "feature work"});
            git(work, {"push", "-q", "-u", "origin", "feature-x"});
            git(work, {"checkout", "-q", "main"});
            git(remote, {"branch", "-D", "feature-x"});
        }

        void initWorkRepo()
        {
            git(work, {"init", "-q"});
            git(work, {"symbolic-ref", "HEAD", "refs/heads/main"});
            git(work, {"commit", "-q", "--allow-empty", "-m", "initial"});
        }

        std::ostringstream out;
        std::ostringstream err;
        branchsweep::Context ctx{false, false, out, err};
        fs::path root;
        fs::path work;
        fs::path remote;
    };

} // namespace

TEST_F(GitRepositoryTest, RecognisesWorkTree)
{
    initWorkRepo();
    branchsweep::git::CliRepository repo(ctx, work);
    EXPECT_TRUE(repo.isInsideWorkTree());
}

TEST_F(GitRepositoryTest, MissingGitBinaryIsNotAWorkTree)
{
    initWorkRepo();
    branchsweep::git::CliRepository repo(ctx, work, "git-binary-that-does-not-exist-12345");
    EXPECT_FALSE(repo.isInsideWorkTree());
}

TEST_F(GitRepositoryTest, SafeDeleteOfMergedBranchSucceeds)
{
    initWorkRepo();
    git(work, {"branch", "merged-topic"});

    branchsweep::git::CliRepository repo(ctx, work);
    const auto outcome = repo.deleteBranch("merged-topic", DeleteMode::Safe);
    EXPECT_TRUE(outcome.ok) << outcome.message;
}

TEST_F(GitRepositoryTest, SafeDeleteOfUnmergedBranchIsRefused)
{
    initWorkRepo();
    git(work, {"checkout", "-q", "-b", "wip"});
    git(work, {"commit", "-q", "--allow-empty", "-m", "unmerged work"});
    git(work, {"checkout", "-q", "main"});

    branchsweep::git::CliRepository repo(ctx, work);
    const auto safe = repo.deleteBranch("wip", DeleteMode::Safe);
    EXPECT_FALSE(safe.ok);
    EXPECT_TRUE(branchsweep::git::isNotFullyMerged(safe)) << safe.message;

    const auto forced = repo.deleteBranch("wip", DeleteMode::Force);
    EXPECT_TRUE(forced.ok) << forced.message;
}

TEST_F(GitRepositoryTest, DeletingUnknownBranchIsOtherFailure)
{
    initWorkRepo();
    branchsweep::git::CliRepository repo(ctx, work);
    const auto outcome = repo.deleteBranch("no-such-branch", DeleteMode::Safe);
    EXPECT_FALSE(outcome.ok);
    EXPECT_FALSE(branchsweep::git::isNotFullyMerged(outcome));
}

TEST_F(GitRepositoryTest, PrunedUpstreamShowsAsGone)
{
    prepareGoneUpstream();

    branchsweep::git::CliRepository repo(ctx, work);
    ASSERT_TRUE(repo.fetchPrune());

    const std::string listing = repo.listBranchesVerbose();
    const auto gone = branchsweep::model::findGoneBranches(
        listing, branchsweep::model::resolveProtectedBranches(std::nullopt, "defaults"));
    EXPECT_EQ(gone, (std::vector<std::string>{"feature-x"})) << listing;
}

TEST_F(GitRepositoryTest, GoneUpstreamIsFoundUnderTranslatedLocale)
{
    prepareGoneUpstream();

    ScopedEnv locale("LC_ALL", "C.UTF-8");
    ScopedEnv language("LANGUAGE", "de");
    branchsweep::git::CliRepository repo(ctx, work);
    ASSERT_TRUE(repo.fetchPrune());

    const std::string listing = repo.listBranchesVerbose();
    const auto gone = branchsweep::model::findGoneBranches(
        listing, branchsweep::model::resolveProtectedBranches(std::nullopt, "defaults"));
    EXPECT_EQ(gone, (std::vector<std::string>{"feature-x"})) << listing;
}
