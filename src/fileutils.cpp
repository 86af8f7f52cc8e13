#include "fileutils.h"

#include <filesystem>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <atomic>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <botan/hash.h>
#include <botan/hex.h>

#include <unistd.h>

namespace fileutils {

std::string makeTempPartPath(const std::string& path, bool pathIsDir)
{
    static std::atomic<uint32_t> g_seq{0};
    namespace fs = std::filesystem;

    fs::path abs = fs::absolute(path);
    fs::path dir = pathIsDir ? abs : abs.parent_path();

    std::string utf8 = abs.u8string();
    auto crc = Botan::HashFunction::create("CRC32");
    if (!crc)
        throw std::runtime_error("makeTempPartPath: CRC32 not available");
    crc->update(reinterpret_cast<const uint8_t*>(utf8.data()), utf8.size());
    auto digest = crc->final();

    std::string crcHex = Botan::hex_encode(digest, false);
    if (crcHex.size() > 8)
        crcHex = crcHex.substr(0, 8);

    using namespace std::chrono;

    auto now  = system_clock::now();
    auto tt   = system_clock::to_time_t(now);
    auto us   = duration_cast<microseconds>(now.time_since_epoch()) % 1000000; // 0–999999

    std::tm tm{};
    localtime_r(&tt, &tm);

    std::ostringstream tbuf;
    tbuf << std::setw(2) << std::setfill('0') << tm.tm_min
         << std::setw(2) << tm.tm_sec
         << std::setw(6) << std::setfill('0') << us.count();

    constexpr uint32_t SEQ_MOD = 10'000;
    uint32_t seq = g_seq.fetch_add(1, std::memory_order_relaxed) % SEQ_MOD;

    std::ostringstream name;
    name << '.' << crcHex << getpid() << tbuf.str() << seq << ".part";

    return (dir / name.str()).string();
}


std::string compute_file_hash(const std::filesystem::path& file_path,
                              std::size_t buffer_size,
                              std::string_view algorithm,
                              HashProgressCallback progress_cb)
{
    if (buffer_size == 0) {
        // Zero buffer size is a logic error in the caller.
        throw std::logic_error("compute_file_hash: buffer_size must be > 0");
    }

    // Obtain file size for progress reporting.
    std::uintmax_t total_size = 0;
    try {
        total_size = std::filesystem::file_size(file_path);
    } catch (const std::filesystem::filesystem_error& e) {
        throw std::runtime_error(
            std::string("compute_file_hash: unable to get file size: ") + e.what());
    }

    std::ifstream in(file_path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("compute_file_hash: unable to open file for reading");
    }

    auto hash = Botan::HashFunction::create(std::string(algorithm));
    if (!hash) {
        throw std::runtime_error(
            std::string("compute_file_hash: unsupported algorithm: ") +
            std::string(algorithm));
    }

    std::vector<std::uint8_t> buffer(buffer_size);
    std::uintmax_t processed = 0;

    if (progress_cb) {
        progress_cb(total_size, processed);
    }

    while (in) {
        in.read(reinterpret_cast<char*>(buffer.data()),
                static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = in.gcount();
        if (got <= 0) {
            break;
        }

        hash->update(buffer.data(), static_cast<std::size_t>(got));
        processed += static_cast<std::uintmax_t>(got);

        if (progress_cb) {
            progress_cb(total_size, processed);
        }
    }

    if (in.bad()) {
        throw std::runtime_error("compute_file_hash: read error");
    }

    const auto digest = hash->final();
    return Botan::hex_encode(digest, false /*lowercase*/);
}

bool files_have_same_hash(const std::filesystem::path& a,
                          const std::filesystem::path& b,
                          std::string_view algorithm,
                          std::size_t buffer_size)
{
    std::error_code ecA, ecB;
    const auto sizeA = std::filesystem::file_size(a, ecA);
    const auto sizeB = std::filesystem::file_size(b, ecB);
    if (ecA || ecB) {
        throw std::runtime_error("files_have_same_hash: unable to get file size");
    }
    if (sizeA != sizeB) {
        return false;
    }

    return compute_file_hash(a, buffer_size, algorithm) ==
           compute_file_hash(b, buffer_size, algorithm);
}

}
