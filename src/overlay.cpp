#include "overlay.hpp"
#include "context.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <cerrno>
#include <cstring>
#include <unistd.h>

namespace fs = std::filesystem;

namespace Postinstall {

const char* const Overlay::kBlockBegin = "# >>> postinstall managed block >>>";
const char* const Overlay::kBlockEnd   = "# <<< postinstall managed block <<<";

namespace {

    std::string readWholeFile(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open()) {
            throw std::runtime_error("Unable to read " + path.string());
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    void writeWholeFile(const fs::path& path, const std::string& content, std::ios::openmode mode) {
        std::ofstream out(path, std::ios::binary | mode);
        if (!out.is_open()) {
            throw std::runtime_error("Unable to open " + path.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            throw std::runtime_error("Write error on " + path.string());
        }
    }

    // Finds `marker` at the start of a line, searching from `from`.
    size_t findLineStart(const std::string& text, const std::string& marker, size_t from) {
        size_t pos = text.find(marker, from);
        while (pos != std::string::npos && pos != 0 && text[pos - 1] != '\n') {
            pos = text.find(marker, pos + 1);
        }
        return pos;
    }
}

std::string Overlay::applyManagedBlock(const std::string& existing, const std::string& fragment)
{
    std::string block = std::string(kBlockBegin) + "\n" + fragment;
    if (!fragment.empty() && fragment.back() != '\n') {
        block += "\n";
    }
    block += std::string(kBlockEnd) + "\n";

    const std::string begin = kBlockBegin;
    const std::string end = kBlockEnd;

    size_t start = findLineStart(existing, begin, 0);
    if (start != std::string::npos) {
        size_t stop = findLineStart(existing, end, start + begin.size());
        if (stop != std::string::npos) {
            size_t after = stop + end.size();
            if (after < existing.size() && existing[after] == '\n') {
                after++;
            }
            return existing.substr(0, start) + block + existing.substr(after);
        }
        // Unterminated block: leave it alone and append a fresh one.
    }

    std::string result = existing;
    if (!result.empty() && result.back() != '\n') {
        result += "\n";
    }
    return result + block;
}

StepResult Overlay::updateMotd(RunContext& ctx)
{
    fs::path source = fs::path(ctx.config.configDir) / "motd.txt";
    if (!fs::is_regular_file(source)) {
        ctx.logger.log("motd.txt not found.");
        return StepResult::Skipped;
    }

    backupBeforeChange(ctx, ctx.config.motdTarget);

    std::error_code ec;
    fs::copy_file(source, ctx.config.motdTarget, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        ctx.logger.error("Failed to update MOTD: " + ec.message());
        return StepResult::Failed;
    }

    ctx.logger.log("MOTD updated.");
    return StepResult::Done;
}

StepResult Overlay::mergeUserRc(RunContext& ctx,
                                const std::string& sourceName,
                                const std::string& targetName)
{
    fs::path source = fs::path(ctx.config.configDir) / sourceName;
    if (!fs::is_regular_file(source)) {
        ctx.logger.log(sourceName + " not found.");
        return StepResult::Skipped;
    }

    if (!ctx.user) {
        ctx.logger.warn("Target user could not be resolved. Skipping " + targetName + ".");
        return StepResult::Skipped;
    }

    fs::path target = fs::path(ctx.user->home) / targetName;
    if (fs::is_symlink(target)) {
        ctx.logger.error("Refusing to customize " + target.string() + ": it is a symbolic link.");
        return StepResult::Failed;
    }
    backupBeforeChange(ctx, target.string());

    try {
        std::string fragment = readWholeFile(source);

        if (ctx.config.rcMode == RcMode::Managed) {
            std::string existing = fs::exists(target) ? readWholeFile(target) : "";
            writeWholeFile(target, applyManagedBlock(existing, fragment), std::ios::trunc);
        } else {
            writeWholeFile(target, fragment, std::ios::app);
        }
    } catch (const std::exception& e) {
        ctx.logger.error("Failed to customize " + targetName + ": " + e.what());
        return StepResult::Failed;
    }

    if (lchown(target.c_str(), ctx.user->uid, ctx.user->gid) != 0) {
        ctx.logger.error("Failed to change ownership of " + target.string() + ": " +
                         std::strerror(errno));
        return StepResult::Failed;
    }

    ctx.logger.log(targetName + " customized.");
    return StepResult::Done;
}

} // namespace Postinstall
