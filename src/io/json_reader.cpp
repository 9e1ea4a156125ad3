#include "io/json_reader.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace branchsweep::io
{

    std::string readTextFile(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw std::runtime_error("Could not open file: " + path.string());
        }

        std::ostringstream text;
        text << in.rdbuf();
        if (in.bad())
        {
            throw std::runtime_error("Could not read file: " + path.string());
        }
        return text.str();
    }

    nlohmann::json parseJsonObject(const std::string &text, const std::string &origin)
    {
        nlohmann::json data;
        try
        {
            data = nlohmann::json::parse(text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            throw std::runtime_error("Invalid JSON in " + origin + ": " + e.what());
        }

        if (!data.is_object())
        {
            throw std::runtime_error("JSON root is not object: " + origin);
        }
        return data;
    }

} // namespace branchsweep::io
