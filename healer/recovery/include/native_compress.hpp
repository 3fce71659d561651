#pragma once
#include <cstdint>
#include <istream>
#include <ostream>
#include <span>
#include "expected.hpp"
#include "types.hpp"


namespace healer::recovery {

    // gzip stream via zlib: no file name, OS 255, the given mtime.
    Expected<Bytes> nativeGzip(std::span<const std::uint8_t> data, int level, std::uint32_t mtime);

    // bzip2 stream via libbz2 with block size level * 100k.
    Expected<Bytes> nativeBzip2(std::span<const std::uint8_t> data, int level);

    // Streaming variants; bounded memory regardless of input size.
    Expected<void> gzipStream(std::istream& in, std::ostream& out, int level, std::uint32_t mtime);
    Expected<void> bzip2Stream(std::istream& in, std::ostream& out, int level);

} // namespace healer::recovery
