#include "io/terminal.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace branchsweep::io
{
    namespace
    {

        constexpr int kEscape = 0x1b;
        constexpr int kSequenceTimeoutMs = 30;
        constexpr std::size_t kMaxSequence = 8;

        bool readByte(int fd, char &out)
        {
            for (;;)
            {
                const ssize_t n = read(fd, &out, 1);
                if (n == 1)
                {
                    return true;
                }
                if (n < 0 && errno == EINTR)
                {
                    continue;
                }
                return false;
            }
        }

        bool byteWaiting(int fd)
        {
            pollfd pfd{};
            pfd.fd = fd;
            pfd.events = POLLIN;
            return poll(&pfd, 1, kSequenceTimeoutMs) > 0 && (pfd.revents & POLLIN) != 0;
        }

    } // namespace

    bool isTerminal(int fd)
    {
        return isatty(fd) == 1;
    }

    bool supportsColor()
    {
        if (const char *noColor = std::getenv("NO_COLOR"))
        {
            if (*noColor != '\0')
            {
                return false;
            }
        }

        std::string term;
        if (const char *termEnv = std::getenv("TERM"))
        {
            term = termEnv;
        }
        if (term.empty() || term == "dumb")
        {
            return false;
        }
        return isTerminal(STDOUT_FILENO);
    }

    unsigned int terminalRows()
    {
        winsize ws{};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) < 0)
        {
            return 0;
        }
        return ws.ws_row;
    }

    unsigned int terminalColumns()
    {
        winsize ws{};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) < 0)
        {
            return 0;
        }
        return ws.ws_col;
    }

    RawModeGuard::RawModeGuard(int fd) : fd_(fd)
    {
        if (!isTerminal(fd_) || tcgetattr(fd_, &saved_) != 0)
        {
            return;
        }

        termios raw = saved_;
        raw.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON | ISIG | IEXTEN));
        raw.c_iflag &= static_cast<tcflag_t>(~(IXON | ICRNL));
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;
        active_ = tcsetattr(fd_, TCSAFLUSH, &raw) == 0;
    }

    RawModeGuard::~RawModeGuard()
    {
        if (active_)
        {
            tcsetattr(fd_, TCSAFLUSH, &saved_);
        }
    }

    std::string readKeySequence(int fd)
    {
        char ch = 0;
        if (!readByte(fd, ch))
        {
            return {};
        }

        std::string key(1, ch);
        if (static_cast<unsigned char>(ch) != kEscape)
        {
            return key;
        }

        while (key.size() < kMaxSequence && byteWaiting(fd))
        {
            if (!readByte(fd, ch))
            {
                break;
            }
            key.push_back(ch);
            // CSI and SS3 sequences end with a letter or '~'.
            if (key.size() >= 3 && ((ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || ch == '~'))
            {
                break;
            }
        }
        return key;
    }

} // namespace branchsweep::io
