#include "model/branches.hpp"

#include <sstream>
#include <utility>

namespace branchsweep::model
{

    namespace
    {

        bool isSpace(char c)
        {
            return c == ' ' || c == '\t' || c == '\r' || c == '\n';
        }

        std::string_view nextToken(std::string_view &text)
        {
            std::size_t start = 0;
            while (start < text.size() && isSpace(text[start]))
            {
                ++start;
            }
            std::size_t end = start;
            while (end < text.size() && !isSpace(text[end]))
            {
                ++end;
            }
            std::string_view token = text.substr(start, end - start);
            text.remove_prefix(end);
            return token;
        }

    } // namespace

    bool isGoneLine(std::string_view line)
    {
        return line.find(kGoneMarker) != std::string_view::npos;
    }

    std::string branchNameOf(std::string_view line)
    {
        std::string_view token = nextToken(line);
        if (token == "*" || token == "+")
        {
            token = nextToken(line);
        }
        return std::string(token);
    }

    std::vector<std::string> findGoneBranches(const std::string &listing, const ProtectedBranches &protectedBranches)
    {
        std::vector<std::string> out;
        std::istringstream input(listing);
        std::string line;
        while (std::getline(input, line))
        {
            if (!isGoneLine(line))
            {
                continue;
            }
            std::string name = branchNameOf(line);
            if (name.empty() || protectedBranches.contains(name))
            {
                continue;
            }
            out.push_back(std::move(name));
        }
        return out;
    }

} // namespace branchsweep::model
