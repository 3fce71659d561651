#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>
#include "../include/file_io.hpp"


namespace healer::recovery::io {

    void throwNotFound(const std::string& what, const std::filesystem::path& p) {
        throw std::filesystem::filesystem_error(what, p,
            std::make_error_code(std::errc::no_such_file_or_directory));
    }

    static std::ifstream openForRead(const std::filesystem::path& p) {
        std::ifstream in(p, std::ios::binary);
        if (!in) {
            if (!std::filesystem::exists(p)) throwNotFound("file not found", p);
            throw std::runtime_error("cannot open " + p.string());
        }
        return in;
    }

    Bytes readRange(const std::filesystem::path& p, std::uint64_t offset, std::size_t length) {
        auto in = openForRead(p);
        in.seekg(static_cast<std::streamoff>(offset));
        if (!in) return {};

        Bytes out(length);
        in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(length));
        out.resize(static_cast<std::size_t>(in.gcount()));
        return out;
    }

    Bytes readHead(const std::filesystem::path& p, std::size_t maxBytes) {
        return readRange(p, 0, maxBytes);
    }

    Bytes readAll(const std::filesystem::path& p) {
        auto in = openForRead(p);
        return Bytes(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    void writeAll(const std::filesystem::path& p, std::span<const std::uint8_t> data) {
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());

        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        if (!out) throw std::runtime_error("cannot open for writing: " + p.string());
        out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        out.flush();
        if (!out) throw std::runtime_error("write failed: " + p.string());
    }

} // namespace healer::recovery::io
