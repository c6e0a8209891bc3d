#include "archive_validator.hpp"

#include <memory>
#include <system_error>

#include <archive.h>
#include <archive_entry.h>

bool ArchiveValidator::isValid(const std::filesystem::path &path) const
{
    // Size gate first: error pages are small, archives are not
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0 || size < minBytes_)
    {
        return false;
    }

    std::unique_ptr<struct archive, decltype(&archive_read_free)> reader(archive_read_new(), archive_read_free);
    if (!reader)
    {
        return false;
    }

    archive_read_support_format_zip(reader.get());

    if (archive_read_open_filename(reader.get(), path.c_str(), BLOCK_SIZE) != ARCHIVE_OK)
    {
        return false;
    }

    // Walk the member list; the archive is valid only if we reach a clean EOF
    struct archive_entry *entry = nullptr;
    int result = ARCHIVE_OK;
    while ((result = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK)
    {
        if (archive_read_data_skip(reader.get()) != ARCHIVE_OK)
        {
            return false;
        }
    }

    return result == ARCHIVE_EOF;
}
