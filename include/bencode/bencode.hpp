#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>


namespace bencode {

    class BencodeError : public std::runtime_error
    {
    public:
        BencodeError(const std::string& what, std::size_t pos);
        std::size_t position() const noexcept { return pos_; }

    private:
        std::size_t pos_{0};
    };

    class BencodeValue
    {
    public:
        enum class Type { None, Int, String, List, Dict };

        using List = std::vector<BencodeValue>;
        using Dict = std::map<std::string, BencodeValue>;

        BencodeValue();
        BencodeValue(int64_t i);
        BencodeValue(const char* s);
        BencodeValue(std::string s);
        BencodeValue(List l);
        BencodeValue(Dict d);

        bool isInt() const noexcept { return type_ == Type::Int; }
        bool isString() const noexcept { return type_ == Type::String; }
        bool isList() const noexcept { return type_ == Type::List; }
        bool isDict() const noexcept { return type_ == Type::Dict; }

        int64_t asInt() const;
        const std::string& asString() const;
        const List& asList() const;
        const Dict& asDict() const;

        // Dict lookup; nullptr when this is not a dict or the key is absent.
        const BencodeValue* find(std::string_view key) const;

        Type type() const noexcept { return type_; }

    private:
        Type type_{Type::None};
        int64_t intValue_{0};
        std::string strValue_;
        List listValue_;
        Dict dictValue_;
    };

    struct ParseResult
    {
        BencodeValue root;
        std::optional<std::string_view> infoSlice;   // exact bytes of the top-level "info" value
    };


    class BencodeParser
    {
    public:
        static constexpr std::size_t kMaxDepth = 512;

        static BencodeValue parse(std::string_view input);
        static ParseResult parseWithInfoSlice(std::string_view input);
        static std::string encode(const BencodeValue& val);

    private:
        explicit BencodeParser(std::string_view input) : input_(input) {}

        BencodeValue parseValue();
        BencodeValue parseInt();
        BencodeValue parseString();
        BencodeValue parseList();
        BencodeValue parseDict();

        std::size_t readLength();
        char peek() const;
        char get();
        void expect(char c);
        void finish() const;

        std::string_view input_;
        std::size_t pos_{0};
        std::size_t depth_{0};

        bool captureInfo_{false};
        std::optional<std::pair<std::size_t, std::size_t>> infoSpan_;
    };

} // namespace bencode
