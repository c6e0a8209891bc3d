#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "download_record.hpp"

/**
 * SHA-256 digests of completed archives, written as a sha256sum-compatible
 * manifest so a copy of the export can be checked later with `sha256sum -c`.
 */
class ChecksumManifest
{
public:
    static constexpr const char *MANIFEST_FILENAME = "SHA256SUMS";

    /**
     * Compute SHA-256 hash of a file.
     * Reads file in chunks to avoid loading entire file into memory.
     *
     * @param filePath Path to file to hash
     * @return Hex-encoded hash string (64 characters)
     * @throws std::runtime_error if file cannot be read
     */
    static std::string computeSHA256(const std::filesystem::path &filePath);

    /**
     * Write "<hex>  <filename>" lines, sorted by filename, for every
     * Completed record whose file exists in outputDir.
     *
     * @return Number of entries written
     * @throws std::runtime_error if a file cannot be hashed or the manifest written
     */
    static std::size_t write(const std::filesystem::path &outputDir,
                             const std::vector<DownloadRecord> &records);

private:
    /**
     * Convert binary data to hex string.
     * Example: {0x01, 0xFF} → "01ff"
     */
    static std::string toHex(const unsigned char *data, std::size_t length);

    // Chunk size for file reading (1 MB)
    static constexpr std::size_t CHUNK_SIZE = 1024 * 1024;
};
