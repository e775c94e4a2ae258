#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <string>
#include <set>

struct archive;

namespace Postinstall {

/**
 * @class Backup
 * @brief Tar archive collecting the original content of every file a run is
 *        about to overwrite or append to.
 *
 * The archive is created on the first add() and finalized by the destructor.
 * Entries keep the file's absolute path (minus the leading '/'), mode, owner
 * and mtime.
 */
class Backup
{
public:
    explicit Backup(std::string archivePath);
    ~Backup();

    Backup(const Backup&) = delete;
    Backup& operator=(const Backup&) = delete;

    /**
     * @brief Archives the current content of @p path.
     *
     * Paths that do not exist, and paths already archived during this run,
     * are accepted without writing anything.
     *
     * @return False if the archive or the file could not be written/read;
     *         lastError() then describes why.
     */
    bool add(const std::string& path);

    /**
     * @brief Finalizes the archive. Called by the destructor as well.
     */
    void close();

    const std::string& path() const { return archivePath; }
    const std::string& lastError() const { return error; }

    /**
     * @brief Number of files written to the archive so far.
     */
    size_t size() const { return archived.size(); }

private:
    bool open();

    std::string archivePath;
    struct archive* writer = nullptr;
    std::set<std::string> archived;
    std::string error;
};

} // namespace Postinstall

#endif // BACKUP_HPP
