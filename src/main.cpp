#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "commands/cleanup_command.hpp"
#include "core/context.hpp"
#include "git/repository.hpp"
#include "io/terminal.hpp"
#include "model/protection.hpp"
#include "ui/prompt.hpp"

namespace fs = std::filesystem;

namespace
{

    constexpr const char *kAppName = "branchsweep";
    constexpr const char *kVersion = "1.0.0";
    constexpr int kInterruptedExit = 130;

    struct CliOptions
    {
        branchsweep::commands::CleanupOptions cleanup;
        bool noColor = false;
        bool verbose = false;
        bool help = false;
        bool version = false;
    };

    void printHelp(std::ostream &out)
    {
        out << kAppName << " " << kVersion << "\n"
            << "Delete local git branches whose upstream branch is gone.\n"
            << "\n"
            << "Usage:\n"
            << "  " << kAppName << " [--dry-run] [--config FILE] [--no-color] [--verbose]\n"
            << "\n"
            << "Options:\n"
            << "  --dry-run      show what would be deleted without deleting anything\n"
            << "  --config FILE  protected branch list (default: ./" << branchsweep::model::kConfigFileName << ")\n"
            << "  --no-color     plain output\n"
            << "  --verbose      print every git command before running it\n"
            << "  -h, --help     show this help\n"
            << "  -v, --version  show the version\n";
    }

    bool parseOptions(const std::vector<std::string> &args, CliOptions &opt, std::string &problem)
    {
        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &arg = args[i];
            if (arg == "--dry-run")
            {
                opt.cleanup.dryRun = true;
                continue;
            }
            if (arg == "--config")
            {
                if (i + 1 >= args.size())
                {
                    problem = "--config requires value";
                    return false;
                }
                opt.cleanup.configFile = args[++i];
                continue;
            }
            if (arg == "--no-color")
            {
                opt.noColor = true;
                continue;
            }
            if (arg == "--verbose")
            {
                opt.verbose = true;
                continue;
            }
            if (arg == "help" || arg == "--help" || arg == "-h")
            {
                opt.help = true;
                continue;
            }
            if (arg == "version" || arg == "--version" || arg == "-v")
            {
                opt.version = true;
                continue;
            }
            problem = "Unknown option: " + arg;
            return false;
        }
        return true;
    }

    std::vector<std::string> collectArgs(int argc, char **argv, int startIndex)
    {
        std::vector<std::string> out;
        for (int i = startIndex; i < argc; ++i)
        {
            out.emplace_back(argv[i]);
        }
        return out;
    }

} // namespace

int main(int argc, char **argv)
{
    CliOptions opt;
    std::string problem;
    if (!parseOptions(collectArgs(argc, argv, 1), opt, problem))
    {
        const branchsweep::Context plain;
        plain.error(problem);
        printHelp(std::cerr);
        return 1;
    }

    if (opt.help)
    {
        printHelp(std::cout);
        return 0;
    }
    if (opt.version)
    {
        std::cout << kAppName << " " << kVersion << '\n';
        return 0;
    }

    const branchsweep::Context ctx(opt.verbose, !opt.noColor && branchsweep::io::supportsColor());

    try
    {
        const fs::path workDir = fs::current_path();
        if (opt.cleanup.configFile.empty())
        {
            opt.cleanup.configFile = workDir / branchsweep::model::kConfigFileName;
        }

        branchsweep::git::CliRepository repo(ctx, workDir);
        branchsweep::ui::TerminalPrompter prompter(ctx, std::cin, branchsweep::ui::TerminalPrompter::detectInputMode());
        return branchsweep::commands::runCleanupCommand(ctx, repo, prompter, opt.cleanup);
    }
    catch (const branchsweep::ui::PromptAborted &e)
    {
        ctx.error("Aborted: ", e.what());
        return kInterruptedExit;
    }
    catch (const std::exception &e)
    {
        ctx.error("An unexpected error occurred: ", e.what());
        return 1;
    }
}
