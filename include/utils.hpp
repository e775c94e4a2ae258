#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <ostream>
#include <iostream>
#include <fstream>
#include <filesystem>
#include <ctime>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Postinstall {

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * Used before a run log exists (configuration loading).
 *
 * @param message The message to log.
 */
inline void log_message(const std::string &message)
{
    std::cerr << COLOR_INFO << "[INFO] " << COLOR_RESET << message << std::endl;
}

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
inline void log_error(const std::string &message)
{
    std::cerr << COLOR_ERROR << "[ERROR] " << COLOR_RESET << message << std::endl;
}

/**
 * @class Logger
 * @brief Run log: every line is timestamped, appended to the run's log file
 *        and echoed to the terminal.
 */
class Logger
{
public:
    /**
     * @brief Creates @p logDir if needed and opens
     *        `<logDir>/postinstall_<YYYYmmdd_HHMMSS>.log` for appending.
     *
     * @param logDir  Directory holding the run logs.
     * @param console Stream receiving the echoed lines (default std::cout).
     * @throws std::runtime_error if the directory or file cannot be created.
     */
    explicit Logger(const std::string& logDir, std::ostream& console = std::cout);

    /**
     * @brief Writes "[YYYY-mm-dd HH:MM:SS] message" to the file and console.
     */
    void log(const std::string& message);

    /**
     * @brief Same line in the file, prefixed with a yellow [WARN] on the console.
     */
    void warn(const std::string& message);

    /**
     * @brief Same line in the file, prefixed with a red [ERROR] on the console.
     */
    void error(const std::string& message);

    /**
     * @brief Path of the log file; subprocess output is appended to it.
     */
    const std::string& path() const { return logPath; }

    /**
     * @brief The YYYYmmdd_HHMMSS stamp the run was started with.
     */
    const std::string& runStamp() const { return stamp; }

private:
    void writeLine(const std::string& line);

    std::ostream& console;
    std::string stamp;
    std::string logPath;
    std::ofstream file;
};

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief Formats @p when with strftime in local time.
 *
 * @param when   The time to format.
 * @param format A strftime format string.
 * @return The formatted string.
 */
std::string formatTime(std::time_t when, const char* format);

/**
 * @brief Removes leading and trailing whitespace from the given string.
 */
std::string trim(const std::string& s);

/**
 * @brief libcurl write callback function.
 *
 * Appends data received from a libcurl request to a std::string.
 *
 * @param contents Pointer to the received data.
 * @param size Size of each element.
 * @param nmemb Number of elements.
 * @param userp Pointer to the std::string to append data to.
 * @return The total number of bytes processed.
 */
size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);

/**
 * @brief Downloads a small text document (e.g. a `.keys` listing).
 *
 * @param url The URL to fetch.
 * @return The response body.
 * @throws std::runtime_error on transport or HTTP errors.
 */
std::string fetchRemoteText(const std::string& url);

} // namespace Postinstall

#endif // UTILS_HPP
