#include "ui/prompt.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <string>

#include <unistd.h>

#include "io/terminal.hpp"
#include "ui/checklist.hpp"

namespace branchsweep::ui
{

    namespace
    {

        constexpr std::size_t kPageSize = 10;
        constexpr std::size_t kPromptChrome = 4;

        constexpr const char *kHideCursor = "\033[?25l";
        constexpr const char *kShowCursor = "\033[?25h";
        constexpr const char *kClearBelow = "\033[J";

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        std::string trim(const std::string &value)
        {
            const auto first = value.find_first_not_of(" \t\r\n");
            if (first == std::string::npos)
            {
                return {};
            }
            const auto last = value.find_last_not_of(" \t\r\n");
            return value.substr(first, last - first + 1);
        }

        std::string joined(const std::vector<std::string> &items)
        {
            std::string out;
            for (std::size_t i = 0; i < items.size(); ++i)
            {
                if (i > 0)
                {
                    out += ", ";
                }
                out += items[i];
            }
            return out;
        }

        std::size_t pageSizeForTerminal()
        {
            const unsigned int rows = io::terminalRows();
            if (rows <= kPromptChrome + 1)
            {
                return kPageSize;
            }
            return std::min<std::size_t>(kPageSize, rows - kPromptChrome);
        }

        // Keeps the cursor hidden while the list is drawn, whatever way we leave.
        class CursorHider
        {
        public:
            explicit CursorHider(std::ostream &out) : out_(out)
            {
                out_ << kHideCursor << std::flush;
            }
            ~CursorHider()
            {
                out_ << kShowCursor << std::flush;
            }

            CursorHider(const CursorHider &) = delete;
            CursorHider &operator=(const CursorHider &) = delete;

        private:
            std::ostream &out_;
        };

    } // namespace

    TerminalPrompter::TerminalPrompter(const branchsweep::Context &ctx, std::istream &in, InputMode mode, int keyFd)
        : ctx_(ctx), in_(in), mode_(mode), keyFd_(keyFd)
    {
    }

    InputMode TerminalPrompter::detectInputMode()
    {
        return io::isTerminal(STDIN_FILENO) && io::isTerminal(STDOUT_FILENO) ? InputMode::Keys : InputMode::Lines;
    }

    std::vector<std::string> TerminalPrompter::selectMany(const std::string &message, const std::vector<std::string> &choices)
    {
        if (choices.empty())
        {
            return {};
        }
        if (mode_ == InputMode::Keys)
        {
            return selectWithKeys(message, choices);
        }
        return selectWithLines(message, choices);
    }

    std::vector<std::string> TerminalPrompter::selectWithKeys(const std::string &message, const std::vector<std::string> &choices)
    {
        std::ostream &out = ctx_.out();
        Checklist list(choices);
        const std::size_t pageSize = pageSizeForTerminal();

        {
            io::RawModeGuard raw(keyFd_);
            if (!raw.active())
            {
                ctx_.debug("Terminal raw mode unavailable, reading lines instead");
                return selectWithLines(message, choices);
            }

            CursorHider cursor(out);
            std::size_t drawn = 0;
            do
            {
                if (drawn > 0)
                {
                    out << "\033[" << drawn << "A\r" << kClearBelow;
                }
                const auto lines = renderChecklist(list, message, ctx_, pageSize, io::terminalColumns());
                for (const auto &line : lines)
                {
                    out << line << '\n';
                }
                out << std::flush;
                drawn = lines.size();
            } while (list.apply(decodeKey(io::readKeySequence(keyFd_))));

            out << "\033[" << drawn << "A\r" << kClearBelow << std::flush;
        }

        if (list.aborted())
        {
            throw PromptAborted("Selection prompt interrupted");
        }

        const auto selected = list.selection();
        ctx_.log(ctx_.paint(Tone::Success, "?"), " ", ctx_.paint(Tone::Emphasis, message), " ",
                 ctx_.paint(Tone::Info, joined(selected)));
        return selected;
    }

    std::vector<std::string> TerminalPrompter::selectWithLines(const std::string &message, const std::vector<std::string> &choices)
    {
        ctx_.log(ctx_.paint(Tone::Success, "?"), " ", ctx_.paint(Tone::Emphasis, message));
        for (std::size_t i = 0; i < choices.size(); ++i)
        {
            ctx_.log("  ", i + 1, ") ", choices[i]);
        }

        for (;;)
        {
            ctx_.out() << "Enter the numbers to select (e.g. 1 3), 'a' for all, or nothing for none: " << std::flush;
            const auto picked = parseSelectionInput(readLine(), choices.size());
            if (!picked.has_value())
            {
                ctx_.warn("Please enter numbers between 1 and ", choices.size(), ".");
                continue;
            }

            std::vector<std::string> out;
            out.reserve(picked->size());
            for (std::size_t index : picked.value())
            {
                out.push_back(choices[index]);
            }
            return out;
        }
    }

    bool TerminalPrompter::confirm(const std::string &message, bool defaultValue)
    {
        const char *hint = defaultValue ? "(Y/n)" : "(y/N)";
        for (;;)
        {
            ctx_.out() << ctx_.paint(Tone::Success, "?") << ' ' << ctx_.paint(Tone::Emphasis, message) << ' '
                       << ctx_.paint(Tone::Muted, hint) << ' ' << std::flush;

            const std::string answer = lower(trim(readLine()));
            if (answer.empty())
            {
                return defaultValue;
            }
            if (answer == "y" || answer == "yes")
            {
                return true;
            }
            if (answer == "n" || answer == "no")
            {
                return false;
            }
            ctx_.warn("Please answer y or n.");
        }
    }

    std::string TerminalPrompter::readLine()
    {
        std::string line;
        if (!std::getline(in_, line))
        {
            ctx_.out() << '\n';
            throw PromptAborted("Input ended before an answer was given");
        }
        return line;
    }

    std::optional<std::vector<std::size_t>> parseSelectionInput(const std::string &text, std::size_t count)
    {
        std::string normalized = text;
        std::replace(normalized.begin(), normalized.end(), ',', ' ');

        std::set<std::size_t> picked;
        std::size_t pos = 0;
        while (pos < normalized.size())
        {
            const auto start = normalized.find_first_not_of(" \t\r\n", pos);
            if (start == std::string::npos)
            {
                break;
            }
            auto end = normalized.find_first_of(" \t\r\n", start);
            if (end == std::string::npos)
            {
                end = normalized.size();
            }
            const std::string token = lower(normalized.substr(start, end - start));
            pos = end;

            if (token == "a" || token == "all")
            {
                for (std::size_t i = 0; i < count; ++i)
                {
                    picked.insert(i);
                }
                continue;
            }

            if (!std::all_of(token.begin(), token.end(), [](unsigned char c)
                             { return std::isdigit(c) != 0; }))
            {
                return std::nullopt;
            }
            if (token.size() > 9)
            {
                return std::nullopt;
            }
            const std::size_t number = static_cast<std::size_t>(std::stoul(token));
            if (number < 1 || number > count)
            {
                return std::nullopt;
            }
            picked.insert(number - 1);
        }

        return std::vector<std::size_t>(picked.begin(), picked.end());
    }

} // namespace branchsweep::ui
