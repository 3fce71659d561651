#include "metainfo.hpp"
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <openssl/sha.h>
#include "../../include/bencode/bencode.hpp"


using namespace healer::metainfo;
using bencode::BencodeValue;


static Sha1Hash sha1_bytes(std::string_view data) {
    Sha1Hash out;
    SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(), out.data());
    return out;
}

static const BencodeValue& expect_dict(const BencodeValue& v, const char* where) {
    if (!v.isDict()) throw MetainfoError(std::string(where) + ": expected dict");
    return v;
}

static std::optional<uint64_t> opt_length(const BencodeValue& dict) {
    const auto* v = dict.find("length");
    if (!v || !v->isInt() || v->asInt() < 0) return std::nullopt;
    return static_cast<uint64_t>(v->asInt());
}

static std::optional<Sha1Hash> opt_sha1(const BencodeValue& dict) {
    const auto* v = dict.find("sha1");
    if (!v || !v->isString() || v->asString().size() != 20) return std::nullopt;
    Sha1Hash h{};
    std::memcpy(h.data(), v->asString().data(), 20);
    return h;
}

static std::optional<std::string> opt_string(const BencodeValue& dict, const char* key) {
    const auto* v = dict.find(key);
    if (!v || !v->isString()) return std::nullopt;
    return v->asString();
}

static std::optional<std::vector<std::string>> opt_symlink(const BencodeValue& dict) {
    const auto* v = dict.find("symlink path");
    if (!v || !v->isList()) return std::nullopt;
    std::vector<std::string> parts;
    for (const auto& seg : v->asList()) {
        if (seg.isString()) parts.push_back(seg.asString());
    }
    return parts;
}

static std::vector<Sha1Hash> split_pieces_blob(const std::string& blob) {
    if (blob.size() % 20 != 0) throw MetainfoError("pieces blob not multiple of 20");

    std::vector<Sha1Hash> out;
    out.reserve(blob.size() / 20);

    for (size_t i = 0; i < blob.size(); i += 20) {
        Sha1Hash a{};
        std::memcpy(a.data(), blob.data() + i, 20);
        out.push_back(a);
    }
    return out;
}

static TorrentFile single_file_entry(const BencodeValue& info, const std::string& name) {
    TorrentFile fe;
    fe.path = std::filesystem::path(name);
    fe.length = opt_length(info);
    fe.offset = 0;
    fe.sha1 = opt_sha1(info);
    fe.attr = opt_string(info, "attr");
    return fe;
}

// v1 "files" list. Malformed entries are skipped, unknown lengths count as 0.
static std::vector<TorrentFile> multi_file_entries(const BencodeValue& filesv) {
    if (!filesv.isList()) throw MetainfoError("info.files: expected list");

    std::vector<TorrentFile> out;
    uint64_t running = 0;

    for (const auto& fd : filesv.asList()) {
        if (!fd.isDict()) continue;

        const auto* pathv = fd.find("path");
        if (!pathv || !pathv->isList() || pathv->asList().empty()) continue;

        std::filesystem::path p;
        bool ok = true;
        for (const auto& seg : pathv->asList()) {
            if (!seg.isString() || !isSafePathSegment(seg.asString())) { ok = false; break; }
            p /= seg.asString();
        }
        if (!ok) continue;

        TorrentFile fe;
        fe.path = p;
        fe.length = opt_length(fd);
        fe.offset = running;
        fe.sha1 = opt_sha1(fd);
        fe.attr = opt_string(fd, "attr");
        fe.symlinkPath = opt_symlink(fd);
        running += fe.length.value_or(0);
        out.push_back(std::move(fe));
    }

    return out;
}

// v2 "file tree": a leaf is a dict holding the empty key.
static void walk_file_tree(const BencodeValue& tree, const std::filesystem::path& prefix,
                           uint64_t& running, std::vector<TorrentFile>& out) {
    for (const auto& [key, node] : tree.asDict()) {
        if (!node.isDict() || !isSafePathSegment(key)) continue;
        const auto path = prefix.empty() ? std::filesystem::path(key) : prefix / key;

        if (const auto* leaf = node.find(""); leaf && leaf->isDict()) {
            TorrentFile fe;
            fe.path = path;
            fe.length = opt_length(*leaf);
            fe.offset = running;
            fe.sha1 = opt_sha1(*leaf);
            fe.attr = opt_string(*leaf, "attr");
            running += fe.length.value_or(0);
            out.push_back(std::move(fe));
        } else {
            walk_file_tree(node, path, running, out);
        }
    }
}

static TorrentVersion detect_version(const BencodeValue& info) {
    const auto* mv = info.find("meta version");
    if (!mv || !mv->isInt() || mv->asInt() != 2) return TorrentVersion::v1;
    return info.find("pieces") ? TorrentVersion::hybrid : TorrentVersion::v2;
}

static uint64_t required_piece_length(const BencodeValue& info) {
    const auto* plv = info.find("piece length");
    if (!plv) throw MetainfoError("info.piece length missing");
    if (!plv->isInt()) throw MetainfoError("info.piece length not int");
    if (plv->asInt() <= 0) throw MetainfoError("info.piece length <= 0");
    return static_cast<uint64_t>(plv->asInt());
}


namespace healer::metainfo {

    const char* versionName(TorrentVersion v) {
        switch (v) {
            case TorrentVersion::v1:     return "v1";
            case TorrentVersion::v2:     return "v2";
            case TorrentVersion::hybrid: return "hybrid";
        }
        return "v1";
    }

    bool isSafePathSegment(std::string_view seg) {
        if (seg.empty() || seg == "." || seg == "..") return false;
        if (seg.find_first_of(std::string_view("/\\\0", 3)) != std::string_view::npos) return false;
        return !std::filesystem::path(seg).has_root_path();
    }

    bool isSafeRelativePath(const std::filesystem::path& p) {
        if (p.empty() || p.has_root_path()) return false;
        for (const auto& part : p) {
            if (!isSafePathSegment(part.string())) return false;
        }
        return true;
    }

    TorrentMeta Metainfo::fromTorrent(std::string_view data, const std::string& fallbackName) {
        auto pr = bencode::BencodeParser::parseWithInfoSlice(data);
        const auto& root = expect_dict(pr.root, "root");

        const auto* infop = root.find("info");
        if (!infop || !pr.infoSlice) throw MetainfoError("missing 'info' dictionary");
        const auto& info = expect_dict(*infop, "info");

        TorrentMeta meta;
        meta.infoHash = sha1_bytes(*pr.infoSlice);
        meta.name = opt_string(info, "name").value_or(fallbackName);
        if (!meta.name.empty() && !isSafePathSegment(meta.name)) {
            throw MetainfoError("info.name: not a single path component");
        }
        meta.version = detect_version(info);

        if (meta.version == TorrentVersion::v2) {
            const auto* plv = info.find("piece length");
            meta.pieceLength = (plv && plv->isInt() && plv->asInt() > 0)
                ? static_cast<uint64_t>(plv->asInt()) : kDefaultV2PieceLength;

            const auto* tree = info.find("file tree");
            if (tree && tree->isDict()) {
                uint64_t running = 0;
                walk_file_tree(*tree, {}, running, meta.files);
            } else {
                meta.files.push_back(single_file_entry(info, meta.name));
            }
            return meta;
        }

        // v1 and hybrid share the v1 layout
        meta.pieceLength = required_piece_length(info);

        const auto* pv = info.find("pieces");
        if (!pv || !pv->isString()) throw MetainfoError("info.pieces missing or not string");
        meta.pieces = split_pieces_blob(pv->asString());

        if (const auto* filesv = info.find("files")) {
            meta.files = multi_file_entries(*filesv);
        } else {
            meta.files.push_back(single_file_entry(info, meta.name));
        }

        return meta;
    }

    TorrentMeta Metainfo::fromFile(const std::filesystem::path& torrentPath) {
        std::ifstream in(torrentPath, std::ios::binary);
        if (!in) {
            throw std::filesystem::filesystem_error("cannot open torrent", torrentPath,
                std::make_error_code(std::errc::no_such_file_or_directory));
        }
        std::ostringstream oss;
        oss << in.rdbuf();
        return fromTorrent(oss.str(), torrentPath.stem().string());
    }

} // namespace healer::metainfo
