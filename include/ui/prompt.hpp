#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/context.hpp"

namespace branchsweep::ui {

// The user interrupted a prompt (Ctrl-C) or input ended.
class PromptAborted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Prompter {
public:
    virtual ~Prompter() = default;

    // Returns the checked choices in list order.
    virtual std::vector<std::string> selectMany(const std::string &message, const std::vector<std::string> &choices) = 0;
    virtual bool confirm(const std::string &message, bool defaultValue) = 0;
};

enum class InputMode {
    Keys,
    Lines,
};

class TerminalPrompter : public Prompter {
public:
    TerminalPrompter(const branchsweep::Context &ctx, std::istream &in, InputMode mode, int keyFd = 0);

    static InputMode detectInputMode();

    std::vector<std::string> selectMany(const std::string &message, const std::vector<std::string> &choices) override;
    bool confirm(const std::string &message, bool defaultValue) override;

private:
    std::vector<std::string> selectWithKeys(const std::string &message, const std::vector<std::string> &choices);
    std::vector<std::string> selectWithLines(const std::string &message, const std::vector<std::string> &choices);
    std::string readLine();

    const branchsweep::Context &ctx_;
    std::istream &in_;
    InputMode mode_;
    int keyFd_;
};

// Parses a line-mode answer: 1-based numbers separated by spaces or commas,
// `a`/`all` for everything, blank for nothing. Returns 0-based indices in
// ascending order, or nullopt when any token is not a valid choice.
std::optional<std::vector<std::size_t>> parseSelectionInput(const std::string &text, std::size_t count);

} // namespace branchsweep::ui
