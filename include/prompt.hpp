#ifndef PROMPT_HPP
#define PROMPT_HPP

#include <string>
#include <iostream>

namespace Postinstall {

/**
 * @brief True if the first non-blank character of @p answer is 'y' or 'Y'.
 */
bool isAffirmative(const std::string& answer);

/**
 * @class Prompt
 * @brief Operator interaction used by the optional steps.
 */
class Prompt
{
public:
    virtual ~Prompt() = default;

    /**
     * @brief Asks a yes/no question that defaults to no.
     *
     * @param question Text shown before the " [y/N]: " suffix.
     * @return True only for an affirmative answer. Empty input, anything
     *         else, and end of input all mean no.
     */
    virtual bool askYesNo(const std::string& question) = 0;

    /**
     * @brief Shows @p label and reads one line of raw text.
     *
     * @return The line without its terminator; empty at end of input.
     */
    virtual std::string readLine(const std::string& label) = 0;
};

/**
 * @class ConsolePrompt
 * @brief Prompt reading from and writing to standard streams.
 */
class ConsolePrompt : public Prompt
{
public:
    ConsolePrompt(std::istream& in = std::cin, std::ostream& out = std::cout);

    bool askYesNo(const std::string& question) override;
    std::string readLine(const std::string& label) override;

private:
    std::istream& in;
    std::ostream& out;
};

} // namespace Postinstall

#endif // PROMPT_HPP
