#include <algorithm>
#include <array>
#include <cstring>
#include <bzlib.h>
#include <zlib.h>
#include "../include/native_compress.hpp"


namespace healer::recovery {

    namespace {

        constexpr std::size_t kChunk = 64 * 1024;

        // Pulls from an istream (or a fixed span) in kChunk slices.
        class ChunkSource
        {
        public:
            explicit ChunkSource(std::istream& in) : in_(&in) {}
            explicit ChunkSource(std::span<const std::uint8_t> d) : data_(d) {}

            // Returns the next slice; empty once exhausted.
            std::span<const std::uint8_t> next() {
                if (in_) {
                    in_->read(reinterpret_cast<char*>(buf_.data()), static_cast<std::streamsize>(buf_.size()));
                    return {buf_.data(), static_cast<std::size_t>(in_->gcount())};
                }
                const std::size_t n = std::min(kChunk, data_.size() - pos_);
                auto s = data_.subspan(pos_, n);
                pos_ += n;
                return s;
            }

            bool failed() const { return in_ && in_->bad(); }

        private:
            std::istream* in_{nullptr};
            std::span<const std::uint8_t> data_;
            std::size_t pos_{0};
            std::array<std::uint8_t, kChunk> buf_{};
        };

        using Sink = void (*)(void* ctx, const std::uint8_t* p, std::size_t n);

        void to_bytes(void* ctx, const std::uint8_t* p, std::size_t n) {
            auto* b = static_cast<Bytes*>(ctx);
            b->insert(b->end(), p, p + n);
        }

        void to_stream(void* ctx, const std::uint8_t* p, std::size_t n) {
            static_cast<std::ostream*>(ctx)->write(reinterpret_cast<const char*>(p), static_cast<std::streamsize>(n));
        }


        Expected<void> deflate_gzip(ChunkSource& src, Sink sink, void* ctx, int level, std::uint32_t mtime) {
            if (level < 1 || level > 9) return Expected<void>::failure("gzip level out of range: " + std::to_string(level));

            z_stream zs;
            std::memset(&zs, 0, sizeof(zs));
            // windowBits 15 + 16 selects the gzip wrapper
            if (deflateInit2(&zs, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
                return Expected<void>::failure("deflateInit2 failed");
            }

            gz_header hdr;
            std::memset(&hdr, 0, sizeof(hdr));
            hdr.time = mtime;
            hdr.os = 255;
            if (deflateSetHeader(&zs, &hdr) != Z_OK) {
                deflateEnd(&zs);
                return Expected<void>::failure("deflateSetHeader failed");
            }

            std::array<std::uint8_t, kChunk> out{};
            int flush = Z_NO_FLUSH;
            int ret = Z_OK;
            do {
                auto in = src.next();
                if (src.failed()) { deflateEnd(&zs); return Expected<void>::failure("read error"); }
                flush = in.empty() ? Z_FINISH : Z_NO_FLUSH;
                zs.next_in = const_cast<Bytef*>(in.data());
                zs.avail_in = static_cast<uInt>(in.size());
                do {
                    zs.next_out = out.data();
                    zs.avail_out = static_cast<uInt>(out.size());
                    ret = deflate(&zs, flush);
                    if (ret == Z_STREAM_ERROR) { deflateEnd(&zs); return Expected<void>::failure("deflate failed"); }
                    sink(ctx, out.data(), out.size() - zs.avail_out);
                } while (zs.avail_out == 0);
            } while (flush != Z_FINISH);

            deflateEnd(&zs);
            if (ret != Z_STREAM_END) return Expected<void>::failure("deflate did not finish");
            return Expected<void>::success();
        }


        Expected<void> compress_bzip2(ChunkSource& src, Sink sink, void* ctx, int level) {
            if (level < 1 || level > 9) return Expected<void>::failure("bzip2 level out of range: " + std::to_string(level));

            bz_stream bs;
            std::memset(&bs, 0, sizeof(bs));
            if (BZ2_bzCompressInit(&bs, level, 0, 0) != BZ_OK) {
                return Expected<void>::failure("BZ2_bzCompressInit failed");
            }

            std::array<char, kChunk> out{};
            int ret = BZ_RUN_OK;
            for (;;) {
                auto in = src.next();
                if (src.failed()) { BZ2_bzCompressEnd(&bs); return Expected<void>::failure("read error"); }
                const int action = in.empty() ? BZ_FINISH : BZ_RUN;
                bs.next_in = const_cast<char*>(reinterpret_cast<const char*>(in.data()));
                bs.avail_in = static_cast<unsigned>(in.size());
                do {
                    bs.next_out = out.data();
                    bs.avail_out = static_cast<unsigned>(out.size());
                    ret = BZ2_bzCompress(&bs, action);
                    if (ret < 0) { BZ2_bzCompressEnd(&bs); return Expected<void>::failure("BZ2_bzCompress failed"); }
                    sink(ctx, reinterpret_cast<const std::uint8_t*>(out.data()), out.size() - bs.avail_out);
                } while (action == BZ_RUN ? bs.avail_in > 0 : ret != BZ_STREAM_END);
                if (ret == BZ_STREAM_END) break;
            }

            BZ2_bzCompressEnd(&bs);
            return Expected<void>::success();
        }

    } // namespace


    Expected<Bytes> nativeGzip(std::span<const std::uint8_t> data, int level, std::uint32_t mtime) {
        ChunkSource src(data);
        Bytes out;
        auto r = deflate_gzip(src, &to_bytes, &out, level, mtime);
        if (!r.has_value()) return Expected<Bytes>::failure(r.error->message);
        return Expected<Bytes>::success(std::move(out));
    }

    Expected<Bytes> nativeBzip2(std::span<const std::uint8_t> data, int level) {
        ChunkSource src(data);
        Bytes out;
        auto r = compress_bzip2(src, &to_bytes, &out, level);
        if (!r.has_value()) return Expected<Bytes>::failure(r.error->message);
        return Expected<Bytes>::success(std::move(out));
    }

    Expected<void> gzipStream(std::istream& in, std::ostream& out, int level, std::uint32_t mtime) {
        ChunkSource src(in);
        auto r = deflate_gzip(src, &to_stream, &out, level, mtime);
        if (r.has_value() && !out) return Expected<void>::failure("write error");
        return r;
    }

    Expected<void> bzip2Stream(std::istream& in, std::ostream& out, int level) {
        ChunkSource src(in);
        auto r = compress_bzip2(src, &to_stream, &out, level);
        if (r.has_value() && !out) return Expected<void>::failure("write error");
        return r;
    }

} // namespace healer::recovery
