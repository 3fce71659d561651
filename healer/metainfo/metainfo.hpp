#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>


namespace healer::metainfo {

    using Sha1Hash = std::array<uint8_t,20>;

    enum class TorrentVersion { v1, v2, hybrid };

    const char* versionName(TorrentVersion v);

    // One path component that stays inside its parent: not empty, `.` or
    // `..`, no separators, no root.
    bool isSafePathSegment(std::string_view seg);

    // Non-empty relative path made only of safe segments.
    bool isSafeRelativePath(const std::filesystem::path& p);

    class MetainfoError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct TorrentFile
    {
        std::filesystem::path path;                      // relative to the torrent root
        std::optional<uint64_t> length;                  // absent when the torrent omits it
        uint64_t offset{0};                              // in the concatenation of all files
        std::optional<Sha1Hash> sha1;                    // BEP 47
        std::optional<std::string> attr;                 // BEP 47: l=link x=exec h=hidden p=padding
        std::optional<std::vector<std::string>> symlinkPath;

        bool isPadding() const { return attr && attr->find('p') != std::string::npos; }
    };

    struct TorrentMeta
    {
        std::string name;
        std::vector<TorrentFile> files;
        uint64_t pieceLength{0};
        std::vector<Sha1Hash> pieces;                    // empty for pure v2
        TorrentVersion version{TorrentVersion::v1};
        Sha1Hash infoHash{};

        uint64_t totalLength() const noexcept {
            uint64_t total = 0;
            for (const auto& f : files) total += f.length.value_or(0);
            return total;
        }

        std::size_t pieceCount() const noexcept { return pieces.size(); }
    };

    class Metainfo
    {
    public:
        static constexpr uint64_t kDefaultV2PieceLength = 16384;

        // fallbackName is used when info.name is absent. File entries with an
        // unsafe path segment are skipped; an unsafe name throws MetainfoError.
        static TorrentMeta fromTorrent(std::string_view data, const std::string& fallbackName = {});
        static TorrentMeta fromFile(const std::filesystem::path& torrentPath);
    };

}
