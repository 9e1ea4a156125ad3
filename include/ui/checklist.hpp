#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "core/context.hpp"

namespace branchsweep::ui {

enum class Key {
    Up,
    Down,
    Toggle,
    ToggleAll,
    Invert,
    Submit,
    Abort,
    Other,
};

Key decodeKey(std::string_view bytes);

// Cursor and check marks of a multi-select list. The cursor stops at both
// ends instead of wrapping.
class Checklist {
public:
    explicit Checklist(std::vector<std::string> items);

    // Returns false once the list is submitted or aborted.
    bool apply(Key key);

    const std::vector<std::string> &items() const { return items_; }
    std::size_t cursor() const { return cursor_; }
    bool checked(std::size_t index) const { return checked_.at(index); }
    bool submitted() const { return submitted_; }
    bool aborted() const { return aborted_; }

    std::vector<std::string> selection() const;

private:
    std::vector<std::string> items_;
    std::vector<bool> checked_;
    std::size_t cursor_ = 0;
    bool submitted_ = false;
    bool aborted_ = false;
};

// Lines of the list as drawn: message, hint, then a window of at most
// `pageSize` entries around the cursor. With a non-zero `width` every line is
// cut to fit in `width - 1` columns so none wraps; 0 leaves lines whole.
std::vector<std::string> renderChecklist(
    const Checklist &list,
    const std::string &message,
    const branchsweep::Context &ctx,
    std::size_t pageSize,
    std::size_t width = 0
);

} // namespace branchsweep::ui
