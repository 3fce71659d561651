#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "candidates.hpp"
#include "compressors.hpp"
#include "process_runner.hpp"
#include "types.hpp"
#include "../../logger/logger.hpp"
#include "../../metainfo/metainfo.hpp"


namespace healer::recovery {

    struct RecoveryOptions
    {
        bool rawFallback{false};
        bool overwrite{false};
        bool dryRun{false};
    };

    enum class FileOutcome { recovered, gzipped, skipped, missing };

    const char* outcomeName(FileOutcome o);


    // A piece lying wholly inside one file, in file-relative coordinates.
    struct ContainedPiece
    {
        std::size_t index{0};
        std::uint64_t offset{0};
        std::uint64_t length{0};
    };

    // Pieces whose whole range lies inside the file, in order. The last piece
    // of the torrent may be shorter than the piece length.
    std::vector<ContainedPiece> containedPieces(const metainfo::TorrentMeta& meta,
                                                const metainfo::TorrentFile& file);


    // What a candidate is matched against: a digest and the candidate window it covers.
    struct MatchTarget
    {
        Bytes digest;
        MatchWindow window;
        std::optional<std::size_t> piece;    // unset for a per-file SHA-1 target
    };

    // The first contained piece, else the BEP 47 per-file SHA-1 over the whole file.
    std::optional<MatchTarget> matchTargetFor(const metainfo::TorrentMeta& meta,
                                              const metainfo::TorrentFile& file);


    /**
     * @brief Per-file recovery state machine.
     *
     * For each .gz / .bz2 entry of the torrent: skip an existing target unless
     * overwrite is set; accept a partial that is already complete and correct;
     * otherwise search compressor candidates built from the raw file for one
     * whose bytes hash to the owning piece; fall back to direct compression
     * when allowed. Dry-run elides only the final write.
     */
    class RecoveryOrchestrator
    {
    public:
        explicit RecoveryOrchestrator(std::shared_ptr<IProcessRunner> runner,
                                      std::shared_ptr<logger::Logger> log = nullptr,
                                      CompressorRegistry* registry = nullptr);

        RecoveryResult run(const metainfo::TorrentMeta& meta,
                           const std::filesystem::path& rawDir,
                           const std::filesystem::path& partialDir,
                           const std::filesystem::path& targetDir,
                           const RecoveryOptions& opts);

        // nullopt for files that are not compressed containers. A path that
        // would leave the target, raw or partial directory counts as missing.
        std::optional<FileOutcome> processFile(const metainfo::TorrentMeta& meta,
                                               const metainfo::TorrentFile& file,
                                               const std::filesystem::path& rawDir,
                                               const std::filesystem::path& partialDir,
                                               const std::filesystem::path& targetDir,
                                               const RecoveryOptions& opts);

    private:
        bool partialIsComplete(const metainfo::TorrentMeta& meta,
                               const metainfo::TorrentFile& file,
                               const std::filesystem::path& partial,
                               const std::filesystem::path& raw) const;

        std::optional<Candidate> searchCandidates(const metainfo::TorrentMeta& meta,
                                                  const metainfo::TorrentFile& file,
                                                  ContainerFormat format,
                                                  const std::filesystem::path& raw,
                                                  const std::filesystem::path& partial);

        void logOutcome(const metainfo::TorrentFile& file, FileOutcome outcome,
                        const std::string& candidate, const std::string& msg,
                        std::optional<std::size_t> piece = std::nullopt) const;

        CandidateEngine engine_;
        std::shared_ptr<logger::Logger> log_;
        CompressorRegistry* registry_;
    };


    // Entry point used by the CLI: POSIX process runner, global compressor registry.
    RecoveryResult recover(const metainfo::TorrentMeta& meta,
                           const std::filesystem::path& rawDir,
                           const std::filesystem::path& partialDir,
                           const std::filesystem::path& targetDir,
                           bool rawFallback, bool overwrite, bool dryRun,
                           std::shared_ptr<logger::Logger> log = nullptr);

} // namespace healer::recovery
