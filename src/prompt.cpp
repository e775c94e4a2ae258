#include "prompt.hpp"

#include <string>

namespace Postinstall {

bool isAffirmative(const std::string& answer)
{
    size_t pos = answer.find_first_not_of(" \t");
    return pos != std::string::npos && (answer[pos] == 'y' || answer[pos] == 'Y');
}

ConsolePrompt::ConsolePrompt(std::istream& inStream, std::ostream& outStream)
    : in(inStream), out(outStream)
{
}

bool ConsolePrompt::askYesNo(const std::string& question)
{
    out << question << " [y/N]: " << std::flush;

    std::string response;
    if (!std::getline(in, response)) {
        out << std::endl;
        return false; // EOF counts as the default answer
    }
    return isAffirmative(response);
}

std::string ConsolePrompt::readLine(const std::string& label)
{
    out << label << std::flush;

    std::string line;
    if (!std::getline(in, line)) {
        out << std::endl;
        return "";
    }
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return line;
}

} // namespace Postinstall
