#include "bencode.hpp"
#include <limits>
#include <sstream>

namespace bencode {

    // ---------- BencodeError ----------

    static std::string describe(const std::string& what, std::size_t pos) {
        std::ostringstream oss;
        oss << "bencode parse error at " << pos << ": " << what;
        return oss.str();
    }

    BencodeError::BencodeError(const std::string& what, std::size_t pos)
        : std::runtime_error(describe(what, pos)), pos_(pos) {}


    // ---------- BencodeValue ----------

    BencodeValue::BencodeValue() = default;
    BencodeValue::BencodeValue(int64_t i) : type_(Type::Int), intValue_(i) {}
    BencodeValue::BencodeValue(const char* s) : type_(Type::String), strValue_(s) {}
    BencodeValue::BencodeValue(std::string s) : type_(Type::String), strValue_(std::move(s)) {}
    BencodeValue::BencodeValue(List l) : type_(Type::List), listValue_(std::move(l)) {}
    BencodeValue::BencodeValue(Dict d) : type_(Type::Dict), dictValue_(std::move(d)) {}

    int64_t BencodeValue::asInt() const {
        if (!isInt()) throw std::runtime_error("BencodeValue: not an int");
        return intValue_;
    }

    const std::string& BencodeValue::asString() const {
        if (!isString()) throw std::runtime_error("BencodeValue: not a string");
        return strValue_;
    }

    const BencodeValue::List& BencodeValue::asList() const {
        if (!isList()) throw std::runtime_error("BencodeValue: not a list");
        return listValue_;
    }

    const BencodeValue::Dict& BencodeValue::asDict() const {
        if (!isDict()) throw std::runtime_error("BencodeValue: not a dict");
        return dictValue_;
    }

    const BencodeValue* BencodeValue::find(std::string_view key) const {
        if (!isDict()) return nullptr;
        auto it = dictValue_.find(std::string(key));
        return it == dictValue_.end() ? nullptr : &it->second;
    }


    // ---------- BencodeParser ----------

    static bool isDigit(char c) { return c >= '0' && c <= '9'; }

    BencodeValue BencodeParser::parse(std::string_view input) {
        BencodeParser p(input);
        BencodeValue v = p.parseValue();
        p.finish();
        return v;
    }

    ParseResult BencodeParser::parseWithInfoSlice(std::string_view input) {
        BencodeParser p(input);
        p.captureInfo_ = true;
        BencodeValue v = p.parseValue();
        p.finish();

        ParseResult r{std::move(v), std::nullopt};
        if (p.infoSpan_) {
            auto [b, e] = *p.infoSpan_;
            r.infoSlice = input.substr(b, e - b);
        }
        return r;
    }

    void BencodeParser::finish() const {
        if (pos_ != input_.size()) throw BencodeError("trailing data after valid bencode", pos_);
    }

    char BencodeParser::peek() const {
        if (pos_ >= input_.size()) throw BencodeError("unexpected end of input", pos_);
        return input_[pos_];
    }

    char BencodeParser::get() {
        char c = peek();
        ++pos_;
        return c;
    }

    void BencodeParser::expect(char c) {
        if (get() != c) throw BencodeError(std::string("expected '") + c + "'", pos_ - 1);
    }

    BencodeValue BencodeParser::parseValue() {
        if (depth_ >= kMaxDepth) throw BencodeError("nesting too deep", pos_);

        char c = peek();
        if (c == 'i') return parseInt();
        if (c == 'l') return parseList();
        if (c == 'd') return parseDict();
        if (isDigit(c)) return parseString();
        throw BencodeError("invalid value prefix", pos_);
    }

    BencodeValue BencodeParser::parseInt() {
        expect('i');
        const std::size_t start = pos_;
        bool neg = false;
        if (peek() == '-') { get(); neg = true; }

        if (!isDigit(peek())) throw BencodeError("integer missing digits", pos_);

        // "i0e" is the only integer allowed to start with 0
        if (peek() == '0') {
            get();
            expect('e');
            if (neg) throw BencodeError("negative zero not allowed", start);
            return BencodeValue(int64_t(0));
        }

        uint64_t mag = 0;
        while (isDigit(peek())) {
            const uint64_t d = uint64_t(get() - '0');
            if (mag > (std::numeric_limits<uint64_t>::max() - d) / 10ULL) {
                throw BencodeError("integer overflow", start);
            }
            mag = mag * 10ULL + d;
        }
        expect('e');

        constexpr uint64_t kMaxPositive = uint64_t(std::numeric_limits<int64_t>::max());
        if (!neg) {
            if (mag > kMaxPositive) throw BencodeError("integer overflow", start);
            return BencodeValue(static_cast<int64_t>(mag));
        }
        if (mag == kMaxPositive + 1) return BencodeValue(std::numeric_limits<int64_t>::min());
        if (mag > kMaxPositive) throw BencodeError("integer overflow", start);
        return BencodeValue(-static_cast<int64_t>(mag));
    }

    std::size_t BencodeParser::readLength() {
        const std::size_t start = pos_;
        if (peek() == '0') {
            get();
            return 0;
        }

        std::size_t len = 0;
        while (isDigit(peek())) {
            const std::size_t d = std::size_t(get() - '0');
            if (len > (std::numeric_limits<std::size_t>::max() - d) / 10) {
                throw BencodeError("string length overflow", start);
            }
            len = len * 10 + d;
        }
        return len;
    }

    BencodeValue BencodeParser::parseString() {
        const std::size_t len = readLength();
        expect(':');

        if (input_.size() - pos_ < len) throw BencodeError("string length exceeds input", pos_);

        std::string out(input_.substr(pos_, len));
        pos_ += len;
        return BencodeValue(std::move(out));
    }

    BencodeValue BencodeParser::parseList() {
        expect('l');
        ++depth_;
        BencodeValue::List lst;
        while (peek() != 'e') {
            lst.push_back(parseValue());
        }
        get();
        --depth_;
        return BencodeValue(std::move(lst));
    }

    BencodeValue BencodeParser::parseDict() {
        expect('d');
        ++depth_;
        BencodeValue::Dict dict;

        while (peek() != 'e') {
            if (!isDigit(peek())) throw BencodeError("dict key is not a string", pos_);
            const std::size_t keyPos = pos_;
            std::string key = parseString().asString();

            if (dict.count(key) != 0) throw BencodeError("duplicate dict key", keyPos);

            const std::size_t valBegin = pos_;
            BencodeValue val = parseValue();

            // only the top-level dictionary's "info" feeds the info-hash
            if (captureInfo_ && depth_ == 1 && key == "info" && !infoSpan_) {
                infoSpan_ = std::make_pair(valBegin, pos_);
            }
            dict.emplace(std::move(key), std::move(val));
        }
        get();
        --depth_;
        return BencodeValue(std::move(dict));
    }


    // ---- Encoder ----

    static void encodeInto(const BencodeValue& v, std::string& out);

    static void encodeString(const std::string& s, std::string& out) {
        out += std::to_string(s.size());
        out.push_back(':');
        out.append(s);
    }

    static void encodeInto(const BencodeValue& v, std::string& out) {
        switch (v.type()) {
            case BencodeValue::Type::None:
                throw std::runtime_error("cannot encode None");
            case BencodeValue::Type::Int:
                out.push_back('i');
                out += std::to_string(v.asInt());
                out.push_back('e');
                break;
            case BencodeValue::Type::String:
                encodeString(v.asString(), out);
                break;
            case BencodeValue::Type::List:
                out.push_back('l');
                for (const auto& e : v.asList()) encodeInto(e, out);
                out.push_back('e');
                break;
            case BencodeValue::Type::Dict:
                // std::map iterates keys in byte order, which is the canonical order
                out.push_back('d');
                for (const auto& [k, val] : v.asDict()) {
                    encodeString(k, out);
                    encodeInto(val, out);
                }
                out.push_back('e');
                break;
        }
    }

    std::string BencodeParser::encode(const BencodeValue& val) {
        std::string out;
        out.reserve(256);
        encodeInto(val, out);
        return out;
    }

} // namespace bencode
