#include <fstream>
#include <stdexcept>
#include <system_error>
#include "../include/compressors.hpp"
#include "../include/native_compress.hpp"


namespace healer::recovery {

    namespace {

        constexpr int kFallbackLevel = 9;

        struct Streams
        {
            std::ifstream in;
            std::ofstream out;
        };

        Streams open_pair(const std::filesystem::path& source, const std::filesystem::path& dest) {
            Streams s;
            s.in.open(source, std::ios::binary);
            if (!s.in) {
                throw std::filesystem::filesystem_error("cannot open source", source,
                    std::make_error_code(std::errc::no_such_file_or_directory));
            }
            if (dest.has_parent_path()) std::filesystem::create_directories(dest.parent_path());
            s.out.open(dest, std::ios::binary | std::ios::trunc);
            if (!s.out) throw std::runtime_error("cannot open for writing: " + dest.string());
            return s;
        }

        void check(const Expected<void>& r, const std::filesystem::path& dest) {
            if (!r.has_value()) throw std::runtime_error("compressing " + dest.string() + ": " + r.error->message);
        }

    } // namespace


    void gzipFile(const std::filesystem::path& source, const std::filesystem::path& dest, bool dryRun) {
        if (dryRun) return;
        auto s = open_pair(source, dest);
        check(gzipStream(s.in, s.out, kFallbackLevel, 0), dest);
    }

    void bzip2File(const std::filesystem::path& source, const std::filesystem::path& dest, bool dryRun) {
        if (dryRun) return;
        auto s = open_pair(source, dest);
        check(bzip2Stream(s.in, s.out, kFallbackLevel), dest);
    }


    void CompressorRegistry::registerCompressor(const std::string& ext, CompressFn fn) {
        std::scoped_lock lk(mu_);
        fns_[ext] = std::move(fn);
    }

    CompressFn CompressorRegistry::get(const std::string& ext) const {
        std::scoped_lock lk(mu_);
        auto it = fns_.find(ext);
        if (it == fns_.end()) throw std::invalid_argument("no compressor registered for extension " + ext);
        return it->second;
    }

    bool CompressorRegistry::contains(const std::string& ext) const {
        std::scoped_lock lk(mu_);
        return fns_.contains(ext);
    }

    std::vector<std::string> CompressorRegistry::extensions() const {
        std::scoped_lock lk(mu_);
        std::vector<std::string> out;
        for (const auto& [ext, fn] : fns_) out.push_back(ext);
        return out;
    }

    CompressorRegistry& CompressorRegistry::global() {
        static CompressorRegistry reg;
        static std::once_flag once;
        std::call_once(once, [] {
            reg.registerCompressor(".gz", &gzipFile);
            reg.registerCompressor(".bz2", &bzip2File);
        });
        return reg;
    }

} // namespace healer::recovery
