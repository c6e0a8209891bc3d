#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

/**
 * Credentials attached to every archive request.
 * Cookies go out as request cookies, headers verbatim.
 */
struct AuthBundle
{
    std::map<std::string, std::string> cookies;
    std::map<std::string, std::string> headers;

    bool empty() const { return cookies.empty() && headers.empty(); }
};

/**
 * Load an authentication bundle.
 *
 * Accepted shapes:
 *   - {"cookies": {...}, "headers": {...}} (either key may be missing)
 *   - a flat {"name": "value"} object, read as cookies only
 *   - a JSON array of {"name": ..., "value": ...} cookie objects
 *   - a Netscape cookie file (tab-separated, '#' comments)
 *
 * @param path Bundle file
 * @return Parsed bundle
 * @throws ConfigError if the file cannot be read or is malformed JSON
 */
AuthBundle loadAuthBundle(const std::filesystem::path &path);

/**
 * Parse an authentication bundle from its text content (see loadAuthBundle).
 */
AuthBundle parseAuthBundle(const std::string &content);

/**
 * Load candidate URLs, one per line. Lines are trimmed; lines that do not
 * start with http:// or https:// are ignored. Duplicates are dropped, first occurrence wins.
 *
 * @throws ConfigError if the file cannot be opened
 */
std::vector<std::string> loadUrlList(const std::filesystem::path &path);
