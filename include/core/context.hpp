#pragma once

#include <iostream>
#include <string>
#include <string_view>

namespace branchsweep {

enum class Tone {
    Plain,
    Info,
    Success,
    Warning,
    Danger,
    Muted,
    Accent,
    Emphasis,
};

namespace ansi {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kBold = "\033[1m";
constexpr std::string_view kGray = "\033[90m";
constexpr std::string_view kRed = "\033[31m";
constexpr std::string_view kGreen = "\033[32m";
constexpr std::string_view kYellow = "\033[33m";
constexpr std::string_view kBlue = "\033[34m";
constexpr std::string_view kMagenta = "\033[35m";

constexpr std::string_view toneCode(Tone tone) {
    switch (tone) {
    case Tone::Info:
        return kBlue;
    case Tone::Success:
        return kGreen;
    case Tone::Warning:
        return kYellow;
    case Tone::Danger:
        return kRed;
    case Tone::Muted:
        return kGray;
    case Tone::Accent:
        return kMagenta;
    case Tone::Emphasis:
        return kBold;
    case Tone::Plain:
        break;
    }
    return {};
}

} // namespace ansi

// Output sink shared by every step of a run. Streams are injectable so tests
// can capture what a command prints.
class Context {
public:
    explicit Context(bool verbose = false, bool color = false)
        : verbose_(verbose), color_(color), out_(&std::cout), err_(&std::cerr) {}

    Context(bool verbose, bool color, std::ostream &out, std::ostream &err)
        : verbose_(verbose), color_(color), out_(&out), err_(&err) {}

    template <typename... Args>
    void log(const Args &...args) const {
        (*out_ << ... << args) << '\n';
    }

    template <typename... Args>
    void say(Tone tone, const Args &...args) const {
        open(*out_, tone);
        (*out_ << ... << args);
        close(*out_, tone);
        *out_ << '\n';
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        open(*err_, Tone::Warning);
        *err_ << "[warn] ";
        (*err_ << ... << args);
        close(*err_, Tone::Warning);
        *err_ << '\n';
    }

    template <typename... Args>
    void error(const Args &...args) const {
        open(*err_, Tone::Danger);
        *err_ << "[error] ";
        (*err_ << ... << args);
        close(*err_, Tone::Danger);
        *err_ << '\n';
    }

    // Raw child-process text echoed back to the user, kept out of the way.
    void detail(std::string_view text) const {
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.remove_suffix(1);
        }
        if (text.empty()) {
            return;
        }
        open(*err_, Tone::Muted);
        *err_ << text;
        close(*err_, Tone::Muted);
        *err_ << '\n';
    }

    template <typename... Args>
    void debug(const Args &...args) const {
        if (!verbose_) {
            return;
        }
        open(*err_, Tone::Muted);
        *err_ << "[debug] ";
        (*err_ << ... << args);
        close(*err_, Tone::Muted);
        *err_ << '\n';
    }

    std::string paint(Tone tone, std::string_view text) const {
        if (!color_ || tone == Tone::Plain) {
            return std::string(text);
        }
        std::string out;
        out.reserve(text.size() + 10);
        out.append(ansi::toneCode(tone));
        out.append(text);
        out.append(ansi::kReset);
        return out;
    }

    std::ostream &out() const { return *out_; }
    std::ostream &err() const { return *err_; }


private:
    void open(std::ostream &stream, Tone tone) const {
        if (color_ && tone != Tone::Plain) {
            stream << ansi::toneCode(tone);
        }
    }

    void close(std::ostream &stream, Tone tone) const {
        if (color_ && tone != Tone::Plain) {
            stream << ansi::kReset;
        }
    }

    bool verbose_;
    bool color_;
    std::ostream *out_;
    std::ostream *err_;
};

} // namespace branchsweep
