#ifndef SSHD_CONFIG_HPP
#define SSHD_CONFIG_HPP

#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace Postinstall {

/**
 * @class SshdConfig
 * @brief Line-preserving model of an sshd_config file.
 *
 * Every line is kept verbatim unless set() rewrites it. Lines of the form
 * `Keyword value` and `#Keyword value` (the '#' directly before the keyword)
 * are recognised as directives; keywords compare case-insensitively. Lines
 * after the first uncommented `Match` belong to conditional blocks.
 */
class SshdConfig
{
public:
    static SshdConfig parse(std::istream& in);

    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    static SshdConfig loadFromFile(const std::string& path);

    /**
     * @brief Forces @p keyword to @p value in the global section.
     *
     * The first global occurrence, commented or not, becomes
     * `keyword value`; further global occurrences are removed. Without any
     * occurrence the directive is inserted before the first Match block (or
     * appended). Uncommented occurrences inside Match blocks are rewritten to
     * the same value so no block re-enables what the global section forbids.
     */
    void set(const std::string& keyword, const std::string& value);

    /**
     * @brief Value of the first uncommented global occurrence of @p keyword.
     */
    std::optional<std::string> get(const std::string& keyword) const;

    /**
     * @brief Renders the file, one '\n'-terminated line per entry.
     */
    std::string serialize() const;

    /**
     * @brief Replaces @p path with serialize(), keeping its mode and owner.
     *
     * The content goes to `<path>.tmp` first and is renamed over @p path,
     * so a failed write leaves the original file untouched.
     *
     * @throws std::runtime_error on write errors.
     */
    void saveToFile(const std::string& path) const;

private:
    struct Line
    {
        std::string text;
        std::string keyword;   // Empty for comments, blanks and unparsable lines
        std::string value;
        bool commented = false;
        bool inMatch = false;
    };

    static Line classify(const std::string& text, bool inMatch);

    std::vector<Line> lines;
};

} // namespace Postinstall

#endif // SSHD_CONFIG_HPP
