#include <array>
#include <fstream>
#include <stdexcept>
#include "../include/trailer_verify.hpp"
#include "../include/file_io.hpp"
#include "../include/gzip_header.hpp"
#include "../include/hashing.hpp"


namespace healer::recovery {

    std::optional<GzipTrailer> readGzipTrailer(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path)) io::throwNotFound("compressed file not found", path);

        const auto size = std::filesystem::file_size(path);
        if (size < gzipfmt::kTrailerSize) return std::nullopt;

        const Bytes tail = io::readRange(path, size - gzipfmt::kTrailerSize, gzipfmt::kTrailerSize);
        if (tail.size() != gzipfmt::kTrailerSize) return std::nullopt;
        return GzipTrailer{gzipfmt::readLe32(tail.data()), gzipfmt::readLe32(tail.data() + 4)};
    }

    GzipTrailer computeRawCrc32AndIsize(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            if (!std::filesystem::exists(path)) io::throwNotFound("raw file not found", path);
            throw std::runtime_error("cannot open " + path.string());
        }

        Crc32Accumulator acc;
        std::array<std::uint8_t, kCrcChunkSize> buf{};
        while (in) {
            in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
            const auto n = static_cast<std::size_t>(in.gcount());
            if (n == 0) break;
            acc.update(std::span<const std::uint8_t>(buf.data(), n));
        }
        if (in.bad()) throw std::runtime_error("read failed: " + path.string());
        return acc.trailer();
    }

    bool verifyRawAgainstGz(const std::filesystem::path& raw, const std::filesystem::path& gz) {
        if (!std::filesystem::exists(raw)) io::throwNotFound("raw file not found", raw);
        if (!std::filesystem::exists(gz)) io::throwNotFound("compressed file not found", gz);

        const auto trailer = readGzipTrailer(gz);
        if (!trailer) return false;
        return *trailer == computeRawCrc32AndIsize(raw);
    }

    std::map<std::string, bool> verifyLastPieceAgainstRaw(const metainfo::TorrentMeta& meta,
                                                          const std::filesystem::path& rawDir,
                                                          const std::filesystem::path& partialDir)
    {
        std::map<std::string, bool> results;

        for (const auto& f : meta.files) {
            if (f.path.extension() != ".gz" || !f.length) continue;

            const auto partial = partialDir / f.path;
            std::error_code ec;
            const auto size = std::filesystem::file_size(partial, ec);
            if (ec || size < *f.length) continue;   // trailer not downloaded yet

            auto rawRel = f.path;
            rawRel.replace_extension();
            const auto raw = rawDir / rawRel;

            const auto key = f.path.generic_string();
            results[key] = std::filesystem::exists(raw) && verifyRawAgainstGz(raw, partial);
        }
        return results;
    }

} // namespace healer::recovery
