#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include "types.hpp"


namespace healer::recovery::io {

    // Throws std::filesystem::filesystem_error (errc::no_such_file_or_directory).
    [[noreturn]] void throwNotFound(const std::string& what, const std::filesystem::path& p);

    // Reads at most maxBytes from the start of the file.
    Bytes readHead(const std::filesystem::path& p, std::size_t maxBytes);

    // Reads [offset, offset + length) or less when the file ends first.
    Bytes readRange(const std::filesystem::path& p, std::uint64_t offset, std::size_t length);

    Bytes readAll(const std::filesystem::path& p);

    // Creates parent directories as needed; throws std::runtime_error on I/O failure.
    void writeAll(const std::filesystem::path& p, std::span<const std::uint8_t> data);

} // namespace healer::recovery::io
