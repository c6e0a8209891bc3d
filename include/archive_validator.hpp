#pragma once

#include <cstddef>
#include <filesystem>

/**
 * Structural check that a downloaded file is a real zip archive and not an
 * HTML login/error page served with a success status.
 * Stateless apart from its threshold, so one instance is shared by all workers.
 */
class ArchiveValidator
{
public:
    static constexpr std::size_t DEFAULT_MIN_BYTES = 50000;

    explicit ArchiveValidator(std::size_t minBytes = DEFAULT_MIN_BYTES) : minBytes_(minBytes) {}

    /**
     * Decide whether the file at path is a valid archive.
     * Files below the size threshold are rejected without being opened.
     * Otherwise the zip entry list is read with libarchive; reaching the end
     * of the archive without error means valid.
     *
     * @param path File to check (may be missing or partially written)
     * @return true if valid; any I/O or parse problem yields false
     */
    bool isValid(const std::filesystem::path &path) const;

private:
    std::size_t minBytes_;

    // libarchive read block size
    static constexpr std::size_t BLOCK_SIZE = 10240;
};
