#include "utils.hpp"
#include <curl/curl.h>
#include <stdexcept>
#include <iostream>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace Postinstall {

Logger::Logger(const std::string& logDir, std::ostream& consoleStream)
    : console(consoleStream)
{
    std::time_t now = std::time(nullptr);
    stamp = formatTime(now, "%Y%m%d_%H%M%S");

    std::error_code ec;
    fs::create_directories(logDir, ec);
    if (ec) {
        throw std::runtime_error("Unable to create log directory " + logDir +
                                 ": " + ec.message());
    }

    logPath = (fs::path(logDir) / ("postinstall_" + stamp + ".log")).string();
    file.open(logPath, std::ios::app);
    if (!file.is_open()) {
        throw std::runtime_error("Unable to open log file: " + logPath);
    }
}

void Logger::writeLine(const std::string& line)
{
    // Flushed per line: subprocesses append to the same file between writes.
    file << line << std::endl;
}

void Logger::log(const std::string& message)
{
    std::string line = "[" + formatTime(std::time(nullptr), "%Y-%m-%d %H:%M:%S") + "] " + message;
    writeLine(line);
    console << line << std::endl;
}

void Logger::warn(const std::string& message)
{
    std::string line = "[" + formatTime(std::time(nullptr), "%Y-%m-%d %H:%M:%S") + "] " + message;
    writeLine(line);
    console << COLOR_WARN << "[WARN] " << COLOR_RESET << line << std::endl;
}

void Logger::error(const std::string& message)
{
    std::string line = "[" + formatTime(std::time(nullptr), "%Y-%m-%d %H:%M:%S") + "] " + message;
    writeLine(line);
    console << COLOR_ERROR << "[ERROR] " << COLOR_RESET << line << std::endl;
}

std::string formatTime(std::time_t when, const char* format)
{
    char buffer[32];
    std::tm tmInfo{};
    localtime_r(&when, &tmInfo);
    size_t len = std::strftime(buffer, sizeof(buffer), format, &tmInfo);
    return std::string(buffer, len);
}

std::string trim(const std::string& s)
{
    const char *whitespace = " \t\n\r\f\v";
    size_t first = s.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(whitespace);
    return s.substr(first, last - first + 1);
}

/**
 * @brief libcurl callback function. Appends downloaded data into a std::string.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp)
{
    size_t totalSize      = size * nmemb;
    std::string* response = static_cast<std::string*>(userp);

    try {
        response->append(static_cast<char*>(contents), totalSize);
    } catch (const std::exception& e) {
        std::cerr << "Error appending data to response: "
                  << e.what() << std::endl;
        return 0; // Signal failure to libcurl
    }

    return totalSize;
}

/**
 * @brief Fetches a text document from a URL using libcurl. Throws on error,
 *        including HTTP status >= 400.
 */
std::string fetchRemoteText(const std::string& url)
{
    CURL* curl = curl_easy_init();
    if (!curl) {
        throw std::runtime_error("Failed to initialize libcurl");
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 60L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        curl_easy_cleanup(curl);
        throw std::runtime_error(
            "Failed to fetch " + url + ": " +
            std::string(curl_easy_strerror(res))
        );
    }

    curl_easy_cleanup(curl);
    return response;
}

} // namespace Postinstall
