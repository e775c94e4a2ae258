#include "backup.hpp"

#include <archive.h>           // Libarchive writer
#include <archive_entry.h>     // Libarchive entry handling

#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace Postinstall {

Backup::Backup(std::string path)
    : archivePath(std::move(path))
{
}

Backup::~Backup()
{
    close();
}

bool Backup::open()
{
    if (writer) {
        return true;
    }

    writer = archive_write_new();
    if (!writer) {
        error = "archive_write_new failed";
        return false;
    }

    archive_write_set_format_pax_restricted(writer);
    if (archive_write_open_filename(writer, archivePath.c_str()) != ARCHIVE_OK) {
        error = "Cannot create " + archivePath + ": " + archive_error_string(writer);
        archive_write_free(writer);
        writer = nullptr;
        return false;
    }
    return true;
}

void Backup::close()
{
    if (!writer) {
        return;
    }
    archive_write_close(writer);
    archive_write_free(writer);
    writer = nullptr;
}

bool Backup::add(const std::string& path)
{
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        error = "Cannot resolve " + path + ": " + ec.message();
        return false;
    }
    std::string key = absolute.lexically_normal().string();

    if (archived.count(key) || !fs::is_regular_file(absolute, ec)) {
        return true; // Already saved, or nothing to save
    }

    struct stat st;
    if (stat(key.c_str(), &st) != 0) {
        error = "Cannot stat " + key;
        return false;
    }

    std::ifstream in(key, std::ios::binary);
    if (!in.is_open()) {
        error = "Cannot read " + key;
        return false;
    }

    if (!open()) {
        return false;
    }

    struct archive_entry* entry = archive_entry_new();
    archive_entry_copy_stat(entry, &st);
    archive_entry_set_pathname(entry, key.substr(key.find_first_not_of('/')).c_str());

    if (archive_write_header(writer, entry) != ARCHIVE_OK) {
        error = "archive_write_header for " + key + ": " + archive_error_string(writer);
        archive_entry_free(entry);
        return false;
    }
    archive_entry_free(entry);

    std::vector<char> buffer(16384);
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }
        if (archive_write_data(writer, buffer.data(), static_cast<size_t>(got)) < 0) {
            error = "archive_write_data for " + key + ": " + archive_error_string(writer);
            return false;
        }
    }

    archived.insert(key);
    return true;
}

} // namespace Postinstall
