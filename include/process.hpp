#ifndef PROCESS_HPP
#define PROCESS_HPP

#include <string>
#include <vector>

namespace Postinstall {
namespace Process {

/**
 * @brief Runs a command and waits for it.
 *
 * The command is looked up on PATH and started with
 * DEBIAN_FRONTEND=noninteractive and stdin bound to /dev/null.
 *
 * @param args       argv of the command; args[0] is the program.
 * @param outputPath File that stdout and stderr are appended to. When empty
 *                   both are discarded.
 * @return The exit status, or -1 if the command could not be started or was
 *         killed by a signal.
 */
int run(const std::vector<std::string>& args,
        const std::string& outputPath = "");

/**
 * @brief Runs a command and collects its standard output.
 *
 * stderr is discarded.
 *
 * @param args   argv of the command.
 * @param output Receives everything the command wrote to stdout.
 * @return The exit status, or -1 as for run().
 */
int capture(const std::vector<std::string>& args, std::string& output);

} // namespace Process
} // namespace Postinstall

#endif // PROCESS_HPP
