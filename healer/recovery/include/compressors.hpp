#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>


namespace healer::recovery {

    // compress(source, destination, dryRun). Creates parent directories;
    // writes nothing in dry-run mode.
    using CompressFn = std::function<void(const std::filesystem::path&, const std::filesystem::path&, bool)>;

    void gzipFile(const std::filesystem::path& source, const std::filesystem::path& dest, bool dryRun);
    void bzip2File(const std::filesystem::path& source, const std::filesystem::path& dest, bool dryRun);


    // Extension -> raw-fallback compressor. Extensible at runtime.
    class CompressorRegistry
    {
    public:
        // Replaces any compressor already registered for ext.
        void registerCompressor(const std::string& ext, CompressFn fn);

        // Throws std::invalid_argument for unknown extensions.
        CompressFn get(const std::string& ext) const;

        bool contains(const std::string& ext) const;
        std::vector<std::string> extensions() const;

        // Process-wide registry holding ".gz" and ".bz2".
        static CompressorRegistry& global();

    private:
        mutable std::mutex mu_;
        std::map<std::string, CompressFn> fns_;
    };

} // namespace healer::recovery
