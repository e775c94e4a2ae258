#ifndef PACKAGE_LIST_HPP
#define PACKAGE_LIST_HPP

#include <istream>
#include <string>
#include <vector>

namespace Postinstall {

/**
 * @class PackageList
 * @brief Reads the declared package set: one package per line, blank lines
 *        and lines whose first non-whitespace character is '#' ignored.
 */
class PackageList
{
public:
    /**
     * @brief Extracts package names from a stream, in order. Duplicates are
     *        kept; surrounding whitespace is trimmed.
     */
    static std::vector<std::string> parse(std::istream& in);

    /**
     * @brief Reads and parses a package list file.
     * @throws std::runtime_error if the file cannot be opened.
     */
    static std::vector<std::string> loadFromFile(const std::string& path);
};

} // namespace Postinstall

#endif // PACKAGE_LIST_HPP
