#include "sshd_config.hpp"
#include "utils.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Postinstall {

namespace {

    std::string toLower(std::string value) {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return value;
    }

    bool sameKeyword(const std::string& a, const std::string& b) {
        return !a.empty() && toLower(a) == toLower(b);
    }
}

SshdConfig::Line SshdConfig::classify(const std::string& text, bool inMatch)
{
    Line line;
    line.text = text;
    line.inMatch = inMatch;

    size_t pos = text.find_first_not_of(" \t");
    if (pos == std::string::npos) {
        return line; // Blank
    }

    if (text[pos] == '#') {
        line.commented = true;
        pos++;
    }

    if (pos >= text.size() || !std::isalpha(static_cast<unsigned char>(text[pos]))) {
        return line; // Prose comment such as "# Logging"
    }

    size_t end = pos;
    while (end < text.size() && std::isalnum(static_cast<unsigned char>(text[end]))) {
        end++;
    }
    if (end < text.size() && text[end] != ' ' && text[end] != '\t' && text[end] != '=') {
        return line;
    }

    line.keyword = text.substr(pos, end - pos);

    std::string rest = trim(text.substr(end));
    if (!rest.empty() && rest[0] == '=') {
        rest = trim(rest.substr(1));
    }
    line.value = rest;
    return line;
}

SshdConfig SshdConfig::parse(std::istream& in)
{
    SshdConfig config;
    bool inMatch = false;

    std::string text;
    while (std::getline(in, text)) {
        if (!text.empty() && text.back() == '\r') {
            text.pop_back();
        }
        Line line = classify(text, inMatch);
        if (!line.commented && sameKeyword(line.keyword, "Match")) {
            line.inMatch = true;
            inMatch = true;
        }
        config.lines.push_back(line);
    }
    return config;
}

SshdConfig SshdConfig::loadFromFile(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open " + path);
    }
    return parse(file);
}

void SshdConfig::set(const std::string& keyword, const std::string& value)
{
    const std::string replacement = keyword + " " + value;

    std::vector<Line> result;
    result.reserve(lines.size() + 1);
    bool placed = false;

    for (const auto& line : lines) {
        if (!sameKeyword(line.keyword, keyword)) {
            result.push_back(line);
            continue;
        }

        if (line.inMatch) {
            if (line.commented) {
                result.push_back(line);
            } else {
                std::string indent = line.text.substr(0, line.text.find_first_not_of(" \t"));
                result.push_back(classify(indent + replacement, true));
            }
            continue;
        }

        if (!placed) {
            result.push_back(classify(replacement, false));
            placed = true;
        }
        // Later global occurrences are dropped.
    }

    if (!placed) {
        auto match = std::find_if(result.begin(), result.end(), [](const Line& line) {
            return !line.commented && sameKeyword(line.keyword, "Match");
        });
        result.insert(match, classify(replacement, false));
    }

    lines = std::move(result);
}

std::optional<std::string> SshdConfig::get(const std::string& keyword) const
{
    for (const auto& line : lines) {
        if (!line.inMatch && !line.commented && sameKeyword(line.keyword, keyword)) {
            return line.value;
        }
    }
    return std::nullopt;
}

std::string SshdConfig::serialize() const
{
    std::string out;
    for (const auto& line : lines) {
        out += line.text;
        out += '\n';
    }
    return out;
}

void SshdConfig::saveToFile(const std::string& path) const
{
    struct stat original;
    bool haveOriginal = stat(path.c_str(), &original) == 0;

    const std::string tempPath = path + ".tmp";
    {
        std::ofstream file(tempPath, std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Unable to open " + tempPath + " for writing");
        }
        file << serialize();
        file.flush();
        if (!file) {
            std::error_code ignored;
            fs::remove(tempPath, ignored);
            throw std::runtime_error("Write error on " + tempPath);
        }
    }

    std::error_code ec;
    if (haveOriginal) {
        fs::permissions(tempPath, static_cast<fs::perms>(original.st_mode & 07777),
                        fs::perm_options::replace, ec);
        if (!ec && chown(tempPath.c_str(), original.st_uid, original.st_gid) != 0) {
            ec = std::error_code(errno, std::system_category());
        }
    }
    if (!ec) {
        fs::rename(tempPath, path, ec);
    }
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        throw std::runtime_error("Unable to replace " + path + ": " + ec.message());
    }
}

} // namespace Postinstall
