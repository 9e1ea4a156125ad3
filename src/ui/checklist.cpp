#include "ui/checklist.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace branchsweep::ui
{

    namespace
    {

        constexpr const char *kKeyHint = "(Press <space> to select, <a> to toggle all, <i> to invert selection)";
        constexpr const char *kMoreHint = "(Move up and down to reveal more choices)";
        constexpr const char *kEllipsis = "...";
        // Visible columns taken by pointer, box and the space before a label.
        constexpr std::size_t kRowPrefix = 5;

        // Cuts plain text to at most `columns` characters, ending in "..." when cut.
        std::string fit(const std::string &text, std::size_t columns, std::size_t limit)
        {
            if (limit == 0 || text.size() <= columns)
            {
                return text;
            }
            const std::size_t ellipsis = std::char_traits<char>::length(kEllipsis);
            if (columns <= ellipsis)
            {
                return text.substr(0, columns);
            }
            return text.substr(0, columns - ellipsis) + kEllipsis;
        }

    } // namespace

    Key decodeKey(std::string_view bytes)
    {
        if (bytes == "\033[A" || bytes == "\033OA" || bytes == "k")
        {
            return Key::Up;
        }
        if (bytes == "\033[B" || bytes == "\033OB" || bytes == "j")
        {
            return Key::Down;
        }
        if (bytes == " ")
        {
            return Key::Toggle;
        }
        if (bytes == "a")
        {
            return Key::ToggleAll;
        }
        if (bytes == "i")
        {
            return Key::Invert;
        }
        if (bytes == "\r" || bytes == "\n")
        {
            return Key::Submit;
        }
        // Ctrl-C, Ctrl-D, or end of input.
        if (bytes.empty() || bytes == "\x03" || bytes == "\x04")
        {
            return Key::Abort;
        }
        return Key::Other;
    }

    Checklist::Checklist(std::vector<std::string> items)
        : items_(std::move(items)), checked_(items_.size(), false)
    {
    }

    bool Checklist::apply(Key key)
    {
        if (submitted_ || aborted_)
        {
            return false;
        }

        switch (key)
        {
        case Key::Up:
            if (cursor_ > 0)
            {
                --cursor_;
            }
            break;
        case Key::Down:
            if (cursor_ + 1 < items_.size())
            {
                ++cursor_;
            }
            break;
        case Key::Toggle:
            if (!items_.empty())
            {
                checked_[cursor_] = !checked_[cursor_];
            }
            break;
        case Key::ToggleAll:
        {
            const bool allChecked = std::all_of(checked_.begin(), checked_.end(), [](bool v)
                                                { return v; });
            std::fill(checked_.begin(), checked_.end(), !allChecked);
            break;
        }
        case Key::Invert:
            checked_.flip();
            break;
        case Key::Submit:
            submitted_ = true;
            return false;
        case Key::Abort:
            aborted_ = true;
            return false;
        case Key::Other:
            break;
        }
        return true;
    }

    std::vector<std::string> Checklist::selection() const
    {
        std::vector<std::string> out;
        for (std::size_t i = 0; i < items_.size(); ++i)
        {
            if (checked_[i])
            {
                out.push_back(items_[i]);
            }
        }
        return out;
    }

    std::vector<std::string> renderChecklist(
        const Checklist &list,
        const std::string &message,
        const branchsweep::Context &ctx,
        std::size_t pageSize,
        std::size_t width)
    {
        // The last column is left free: some terminals wrap on a full row.
        const std::size_t room = width > 1 ? width - 1 : width;
        const auto cols = [&](std::size_t prefix)
        { return room > prefix ? room - prefix : 1; };

        std::vector<std::string> lines;
        lines.push_back(ctx.paint(Tone::Success, "?") + " " + ctx.paint(Tone::Emphasis, fit(message, cols(2), room)));
        lines.push_back("  " + ctx.paint(Tone::Info, fit(kKeyHint, cols(2), room)));

        const std::size_t count = list.items().size();
        pageSize = std::max<std::size_t>(pageSize, 1);
        std::size_t first = 0;
        if (count > pageSize)
        {
            const std::size_t half = pageSize / 2;
            first = list.cursor() > half ? list.cursor() - half : 0;
            first = std::min(first, count - pageSize);
        }
        const std::size_t last = std::min(count, first + pageSize);

        for (std::size_t i = first; i < last; ++i)
        {
            const bool here = i == list.cursor();
            const std::string pointer = here ? ctx.paint(Tone::Info, ">") : " ";
            const std::string box = list.checked(i) ? ctx.paint(Tone::Success, "(*)") : "( )";
            const std::string name = fit(list.items()[i], cols(kRowPrefix), room);
            const std::string label = here ? ctx.paint(Tone::Info, name) : name;
            lines.push_back(pointer + box + " " + label);
        }

        if (count > pageSize)
        {
            lines.push_back(ctx.paint(Tone::Muted, fit(kMoreHint, cols(0), room)));
        }
        return lines;
    }

} // namespace branchsweep::ui
