#include "auth_bundle.hpp"

#include <fstream>
#include <set>
#include <sstream>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "config.hpp"

namespace
{
    std::string trim(const std::string &value)
    {
        auto begin = value.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos)
        {
            return {};
        }
        auto end = value.find_last_not_of(" \t\r\n");
        return value.substr(begin, end - begin + 1);
    }

    // Non-string values are rendered as their JSON text
    std::string scalarToString(const nlohmann::json &value)
    {
        return value.is_string() ? value.get<std::string>() : value.dump();
    }

    std::map<std::string, std::string> readStringMap(const nlohmann::json &object, const char *what)
    {
        if (!object.is_object())
        {
            throw ConfigError(fmt::format("Auth bundle field '{}' must be an object", what));
        }
        std::map<std::string, std::string> result;
        for (const auto &[name, value] : object.items())
        {
            if (value.is_null() || value.is_object() || value.is_array())
            {
                continue;
            }
            result[name] = scalarToString(value);
        }
        return result;
    }

    AuthBundle parseNetscape(const std::string &content)
    {
        AuthBundle bundle;
        std::istringstream lines(content);
        std::string line;
        while (std::getline(lines, line))
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            if (line.empty() || line[0] == '#')
            {
                continue;
            }

            // domain, flag, path, secure, expiry, name, value
            std::vector<std::string> fields;
            std::istringstream columns(line);
            std::string field;
            while (std::getline(columns, field, '\t'))
            {
                fields.push_back(field);
            }
            if (fields.size() >= 7)
            {
                bundle.cookies[fields[5]] = fields[6];
            }
        }
        return bundle;
    }
}

AuthBundle parseAuthBundle(const std::string &content)
{
    std::string text = trim(content);
    if (text.empty())
    {
        return {};
    }

    if (text.front() != '{' && text.front() != '[')
    {
        return parseNetscape(content);
    }

    nlohmann::json data;
    try
    {
        data = nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw ConfigError(fmt::format("Auth bundle is not valid JSON: {}", e.what()));
    }

    AuthBundle bundle;

    // Cookie-Editor export
    if (data.is_array())
    {
        for (const auto &cookie : data)
        {
            if (cookie.is_object() && cookie.contains("name") && cookie.contains("value"))
            {
                bundle.cookies[scalarToString(cookie["name"])] = scalarToString(cookie["value"]);
            }
        }
        return bundle;
    }

    bool structured = data.contains("cookies") || data.contains("headers");
    if (!structured)
    {
        // Legacy flat cookie map
        bundle.cookies = readStringMap(data, "cookies");
        return bundle;
    }

    if (data.contains("cookies"))
    {
        bundle.cookies = readStringMap(data["cookies"], "cookies");
    }
    if (data.contains("headers"))
    {
        bundle.headers = readStringMap(data["headers"], "headers");
    }
    return bundle;
}

AuthBundle loadAuthBundle(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw ConfigError(fmt::format("Cannot open auth file: {}", path.string()));
    }
    std::ostringstream content;
    content << in.rdbuf();
    return parseAuthBundle(content.str());
}

std::vector<std::string> loadUrlList(const std::filesystem::path &path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw ConfigError(fmt::format("Cannot open URLs file: {}", path.string()));
    }

    std::vector<std::string> urls;
    std::set<std::string> seen;
    std::string line;
    while (std::getline(in, line))
    {
        line = trim(line);
        if (line.rfind("http://", 0) != 0 && line.rfind("https://", 0) != 0)
        {
            continue;
        }
        if (seen.insert(line).second)
        {
            urls.push_back(line);
        }
    }
    return urls;
}
