#pragma once
#include <optional>
#include <string>
#include <utility>


namespace healer::recovery {

    struct Error {
        std::string message;
    };


    // Value-or-message result for operations whose failure is an expected,
    // recoverable outcome (a missing tool, a non-zero exit status).
    template <typename T>
    struct Expected
    {
        std::optional<T> value;
        std::optional<Error> error;


        static Expected success(T v) {
            Expected e; e.value = std::move(v);
            return e;
        }
        static Expected failure(std::string msg) {
            Expected e; e.error = Error{std::move(msg)};
            return e;
        }
        bool has_value() const { return value.has_value(); }
        T& get() { return *value; }
        const T& get() const { return *value; }
        T take() { return std::move(*value); }
        const std::string& message() const {
            static const std::string empty;
            return error ? error->message : empty;
        }
    };


    template <>
    struct Expected<void>
    {
        std::optional<Error> error;
        static Expected success() { return {}; }
        static Expected failure(std::string msg) { Expected e; e.error = Error{std::move(msg)}; return e; }
        bool has_value() const { return !error.has_value(); }
    };


} // namespace healer::recovery
