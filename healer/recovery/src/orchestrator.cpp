#include <algorithm>
#include <stdexcept>
#include <system_error>
#include "../include/orchestrator.hpp"
#include "../include/bzip2_header.hpp"
#include "../include/file_io.hpp"
#include "../include/gzip_header.hpp"
#include "../include/hashing.hpp"
#include "../include/trailer_verify.hpp"


namespace healer::recovery {

    using logger::LogLevel;
    using metainfo::TorrentFile;
    using metainfo::TorrentMeta;

    namespace {

        const char* const kLoggerName = "Recovery";

        std::optional<ContainerFormat> format_for(const std::filesystem::path& p) {
            const auto ext = p.extension();
            if (ext == ".gz") return ContainerFormat::gzip;
            if (ext == ".bz2") return ContainerFormat::bzip2;
            return std::nullopt;
        }

        bool piece_matches(const TorrentMeta& meta, const ContainedPiece& cp, std::span<const std::uint8_t> data) {
            if (data.size() < cp.offset + cp.length) return false;
            const auto h = sha1(data.subspan(static_cast<std::size_t>(cp.offset), static_cast<std::size_t>(cp.length)));
            return h == meta.pieces[cp.index];
        }

        bool file_sha1_matches(const TorrentFile& f, std::span<const std::uint8_t> data) {
            return f.sha1 && sha1(data) == *f.sha1;
        }

    } // namespace


    const char* outcomeName(FileOutcome o) {
        switch (o) {
            case FileOutcome::recovered: return "recovered";
            case FileOutcome::gzipped:   return "gzipped";
            case FileOutcome::skipped:   return "skipped";
            case FileOutcome::missing:   return "missing";
        }
        return "missing";
    }


    // ---------- Piece geometry ----------

    std::vector<ContainedPiece> containedPieces(const TorrentMeta& meta, const TorrentFile& file) {
        std::vector<ContainedPiece> out;
        if (!file.length || meta.pieces.empty() || meta.pieceLength == 0) return out;

        const std::uint64_t pl = meta.pieceLength;
        const std::uint64_t total = meta.totalLength();
        const std::uint64_t fileEnd = file.offset + *file.length;

        for (std::uint64_t idx = (file.offset + pl - 1) / pl; idx < meta.pieces.size(); ++idx) {
            const std::uint64_t start = idx * pl;
            if (start >= total) break;
            const std::uint64_t len = std::min(pl, total - start);
            if (start + len > fileEnd) break;
            out.push_back(ContainedPiece{static_cast<std::size_t>(idx), start - file.offset, len});
        }
        return out;
    }

    std::optional<MatchTarget> matchTargetFor(const TorrentMeta& meta, const TorrentFile& file) {
        const auto pieces = containedPieces(meta, file);
        if (!pieces.empty()) {
            const auto& first = pieces.front();
            const auto& h = meta.pieces[first.index];
            return MatchTarget{Bytes(h.begin(), h.end()), MatchWindow{first.offset, first.length}, first.index};
        }
        if (file.sha1) {
            return MatchTarget{Bytes(file.sha1->begin(), file.sha1->end()), MatchWindow{0, std::nullopt}, std::nullopt};
        }
        return std::nullopt;
    }


    // ---------- RecoveryOrchestrator ----------

    RecoveryOrchestrator::RecoveryOrchestrator(std::shared_ptr<IProcessRunner> runner,
                                               std::shared_ptr<logger::Logger> log,
                                               CompressorRegistry* registry)
    : engine_(std::move(runner), log),
      log_(std::move(log)),
      registry_(registry ? registry : &CompressorRegistry::global()) {}

    void RecoveryOrchestrator::logOutcome(const TorrentFile& file, FileOutcome outcome,
                                          const std::string& candidate, const std::string& msg,
                                          std::optional<std::size_t> piece) const
    {
        if (!log_) return;
        logger::LogRecord rec;
        rec.level = outcome == FileOutcome::missing ? LogLevel::warn : LogLevel::info;
        rec.logger = kLoggerName;
        rec.msg = msg;
        rec.file = file.path.generic_string();
        rec.candidate = candidate;
        rec.outcome = outcomeName(outcome);
        if (file.length) rec.bytes = static_cast<int64_t>(*file.length);
        if (piece) rec.piece = static_cast<int64_t>(*piece);
        log_->log(std::move(rec));
    }

    bool RecoveryOrchestrator::partialIsComplete(const TorrentMeta& meta, const TorrentFile& file,
                                                 const std::filesystem::path& partial,
                                                 const std::filesystem::path& raw) const
    {
        if (!file.length) return false;
        std::error_code ec;
        if (std::filesystem::file_size(partial, ec) != *file.length || ec) return false;

        const auto pieces = containedPieces(meta, file);
        if (!pieces.empty() || file.sha1) {
            const Bytes data = io::readAll(partial);
            for (const auto& cp : pieces) {
                if (!piece_matches(meta, cp, data)) return false;
            }
            return !file.sha1 || file_sha1_matches(file, data);
        }

        // no hash data at all: the gzip trailer is the only evidence left
        if (file.path.extension() == ".gz" && std::filesystem::is_regular_file(raw)) {
            return verifyRawAgainstGz(raw, partial);
        }
        return false;
    }

    std::optional<Candidate> RecoveryOrchestrator::searchCandidates(const TorrentMeta& meta,
                                                                    const TorrentFile& file,
                                                                    ContainerFormat format,
                                                                    const std::filesystem::path& raw,
                                                                    const std::filesystem::path& partial)
    {
        const auto target = matchTargetFor(meta, file);
        if (!target) {
            TH_LOG(log_, LogLevel::info, kLoggerName) << file.path.generic_string()
                << ": no piece or file hash covers this file, candidate search skipped";
            return std::nullopt;
        }

        const bool hasPartial = std::filesystem::is_regular_file(partial);
        std::vector<CandidatePlan> plans;
        if (format == ContainerFormat::gzip) {
            std::optional<GzipHeader> header;
            if (hasPartial) header = GzipHeaderCodec::parse(partial);
            TH_LOG(log_, LogLevel::debug, kLoggerName) << file.path.generic_string()
                << (header ? ": using captured gzip header" : ": no gzip header hint");
            plans = engine_.planGzip(raw, header);
        } else {
            std::optional<Bzip2Header> header;
            if (hasPartial) header = Bzip2HeaderCodec::parse(partial);
            plans = engine_.planBzip2(raw, header);
        }

        const auto pieces = containedPieces(meta, file);
        auto accept = [&](const Candidate& c) {
            if (file.length && c.data.size() != *file.length) return false;
            for (std::size_t i = 1; i < pieces.size(); ++i) {
                if (!piece_matches(meta, pieces[i], c.data)) return false;
            }
            if (file.sha1 && !file_sha1_matches(file, c.data)) return false;
            return true;
        };

        return findFirstMatch(plans, target->digest, target->window, HashAlgo::sha1, accept);
    }

    std::optional<FileOutcome> RecoveryOrchestrator::processFile(const TorrentMeta& meta,
                                                                 const TorrentFile& file,
                                                                 const std::filesystem::path& rawDir,
                                                                 const std::filesystem::path& partialDir,
                                                                 const std::filesystem::path& targetDir,
                                                                 const RecoveryOptions& opts)
    {
        const auto format = format_for(file.path);
        if (!format || file.isPadding()) return std::nullopt;

        if (!metainfo::isSafeRelativePath(file.path) ||
            (!meta.name.empty() && !metainfo::isSafePathSegment(meta.name))) {
            logOutcome(file, FileOutcome::missing, {}, "path escapes the output directory");
            return FileOutcome::missing;
        }

        const auto target = targetDir / meta.name / file.path;
        const auto partial = partialDir / file.path;
        auto rawRel = file.path;
        rawRel.replace_extension();
        const auto raw = rawDir / rawRel;

        if (std::filesystem::exists(target) && !opts.overwrite) {
            logOutcome(file, FileOutcome::skipped, {}, "target exists");
            return FileOutcome::skipped;
        }

        const bool hasPartial = std::filesystem::is_regular_file(partial);
        const bool hasRaw = std::filesystem::is_regular_file(raw);

        if (!hasPartial && !hasRaw) {
            logOutcome(file, FileOutcome::missing, {}, "neither partial nor raw file present");
            return FileOutcome::missing;
        }

        if (hasPartial && partialIsComplete(meta, file, partial, raw)) {
            if (!opts.dryRun) {
                std::filesystem::create_directories(target.parent_path());
                std::filesystem::copy_file(partial, target, std::filesystem::copy_options::overwrite_existing);
            }
            logOutcome(file, FileOutcome::recovered, "partial", "partial file already complete");
            return FileOutcome::recovered;
        }

        if (!hasRaw) {
            logOutcome(file, FileOutcome::missing, {}, "partial incomplete and no raw file");
            return FileOutcome::missing;
        }

        if (auto match = searchCandidates(meta, file, *format, raw, partial)) {
            if (!opts.dryRun) io::writeAll(target, match->data);
            const auto owner = matchTargetFor(meta, file);
            logOutcome(file, FileOutcome::recovered, match->label, "candidate matched",
                       owner ? owner->piece : std::nullopt);
            return FileOutcome::recovered;
        }

        if (opts.rawFallback) {
            const auto ext = file.path.extension().string();
            registry_->get(ext)(raw, target, opts.dryRun);
            logOutcome(file, FileOutcome::gzipped, "raw-fallback", "no candidate matched, compressed raw file");
            return FileOutcome::gzipped;
        }

        logOutcome(file, FileOutcome::missing, {}, "no candidate matched");
        return FileOutcome::missing;
    }

    RecoveryResult RecoveryOrchestrator::run(const TorrentMeta& meta,
                                             const std::filesystem::path& rawDir,
                                             const std::filesystem::path& partialDir,
                                             const std::filesystem::path& targetDir,
                                             const RecoveryOptions& opts)
    {
        RecoveryResult result;
        for (const auto& file : meta.files) {
            std::optional<FileOutcome> outcome;
            try {
                outcome = processFile(meta, file, rawDir, partialDir, targetDir, opts);
            } catch (const std::filesystem::filesystem_error& e) {
                if (e.code() == std::errc::no_such_file_or_directory) throw;
                logOutcome(file, FileOutcome::missing, {}, e.what());
                outcome = FileOutcome::missing;
            } catch (const std::runtime_error& e) {
                // write failures stay with their file
                logOutcome(file, FileOutcome::missing, {}, e.what());
                outcome = FileOutcome::missing;
            }
            if (!outcome) continue;
            switch (*outcome) {
                case FileOutcome::recovered: ++result.recovered; break;
                case FileOutcome::gzipped:   ++result.gzipped;   break;
                case FileOutcome::skipped:   ++result.skipped;   break;
                case FileOutcome::missing:   ++result.missing;   break;
            }
        }

        TH_LOG(log_, LogLevel::info, kLoggerName) << "recovered=" << result.recovered
            << " gzipped=" << result.gzipped << " skipped=" << result.skipped
            << " missing=" << result.missing << (opts.dryRun ? " (dry run)" : "");
        return result;
    }


    RecoveryResult recover(const TorrentMeta& meta,
                           const std::filesystem::path& rawDir,
                           const std::filesystem::path& partialDir,
                           const std::filesystem::path& targetDir,
                           bool rawFallback, bool overwrite, bool dryRun,
                           std::shared_ptr<logger::Logger> log)
    {
        RecoveryOrchestrator orch(makePosixRunner(), std::move(log));
        return orch.run(meta, rawDir, partialDir, targetDir, RecoveryOptions{rawFallback, overwrite, dryRun});
    }

} // namespace healer::recovery
