#pragma once
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "types.hpp"
#include "../../metainfo/metainfo.hpp"


namespace healer::recovery {

    inline constexpr std::size_t kCrcChunkSize = 8192;

    // Final 8 bytes read as little-endian (crc32, isize). No structural
    // validation; nullopt only when the file is shorter than 8 bytes.
    std::optional<GzipTrailer> readGzipTrailer(const std::filesystem::path& path);

    // Empty file yields (0, 0).
    GzipTrailer computeRawCrc32AndIsize(const std::filesystem::path& path);

    // Both files must exist (std::filesystem::filesystem_error otherwise).
    bool verifyRawAgainstGz(const std::filesystem::path& raw, const std::filesystem::path& gz);

    // Keyed by the torrent-relative path (generic form). Only .gz entries with a
    // known length and a partial at least that long are included; a missing raw
    // file maps to false.
    std::map<std::string, bool> verifyLastPieceAgainstRaw(const metainfo::TorrentMeta& meta,
                                                          const std::filesystem::path& rawDir,
                                                          const std::filesystem::path& partialDir);

} // namespace healer::recovery
