#include "checksum.hpp"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fmt/core.h>

// OpenSSL EVP digest API
#include <openssl/evp.h>

std::string ChecksumManifest::computeSHA256(const std::filesystem::path &filePath)
{
    std::ifstream file(filePath, std::ios::binary);
    if (!file)
    {
        throw std::runtime_error(
            fmt::format("Cannot open file for checksum: {}", filePath.string()));
    }

    // RAII wrapper to ensure context is freed even if exception occurs
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> context(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!context)
    {
        throw std::runtime_error("Failed to create OpenSSL context");
    }

    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1)
    {
        throw std::runtime_error("Failed to initialize SHA-256 digest");
    }

    std::vector<char> buffer(CHUNK_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0)
    {
        auto bytesRead = static_cast<std::size_t>(file.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), bytesRead) != 1)
        {
            throw std::runtime_error("Failed to update SHA-256 digest");
        }
    }
    if (file.bad())
    {
        throw std::runtime_error(fmt::format("Read error while hashing {}", filePath.string()));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLength = 0;
    if (EVP_DigestFinal_ex(context.get(), hash, &hashLength) != 1)
    {
        throw std::runtime_error("Failed to finalize SHA-256 digest");
    }

    return toHex(hash, hashLength);
}

std::size_t ChecksumManifest::write(const std::filesystem::path &outputDir,
                                    const std::vector<DownloadRecord> &records)
{
    std::vector<std::pair<std::string, std::string>> entries; // filename, digest
    for (const auto &record : records)
    {
        if (record.status != DownloadStatus::Completed)
        {
            continue;
        }
        std::filesystem::path filePath = outputDir / record.filename;
        std::error_code ec;
        if (!std::filesystem::exists(filePath, ec))
        {
            continue;
        }
        entries.emplace_back(record.filename, computeSHA256(filePath));
    }

    std::sort(entries.begin(), entries.end());

    std::filesystem::path manifestPath = outputDir / MANIFEST_FILENAME;
    std::ofstream out(manifestPath, std::ios::trunc);
    if (!out)
    {
        throw std::runtime_error(fmt::format("Cannot write manifest: {}", manifestPath.string()));
    }
    for (const auto &[filename, digest] : entries)
    {
        out << digest << "  " << filename << '\n';
    }
    out.close();
    if (out.fail())
    {
        throw std::runtime_error(fmt::format("Failed to write manifest: {}", manifestPath.string()));
    }

    return entries.size();
}

std::string ChecksumManifest::toHex(const unsigned char *data, std::size_t length)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');

    for (std::size_t i = 0; i < length; ++i)
    {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
    }

    return oss.str();
}
