#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using std::string;
using std::string_view;
using std::runtime_error;

namespace jqp {
    /*
     JQPError
     - extends std::runtime_error for compatibility with std::exception catchers
     - stores the path expression (or file name) the failure refers to
    */
    struct JQPError : public runtime_error {
    public:
        explicit JQPError(const string &msg, string path = {})
            : runtime_error(msg), _path(std::move(path)) {
        }

        [[nodiscard]] string_view path() const noexcept { return _path; }

    private:
        string _path;
    };

    // malformed path expression
    struct ParseError final : public JQPError {
    public:
        enum class Kind {
            MissingLeadingDot,
            EmptySegment,
            InvalidIndex,
            UnterminatedBracket,
            UnexpectedCharacter
        };

        explicit ParseError(const Kind kind_, const string &msg, string path)
            : JQPError(msg, std::move(path)), _kind(kind_) {
        }

        [[nodiscard]] Kind kind() const noexcept { return _kind; }

    private:
        Kind _kind;
    };

    // path does not resolve against the current tree
    struct NotFoundError final : public JQPError {
        using JQPError::JQPError;
    };

    // absent/unreadable source, invalid JSON, null root or bad configuration
    struct InvalidInputError final : public JQPError {
        using JQPError::JQPError;
    };

    /*
     PathStep
     - one navigation instruction: Field(name) or Index(i)
    */
    struct PathStep {
        enum class Type { Field, Index };

        Type type = Type::Field;
        string name;
        size_t index = 0;

        static PathStep field(string name_) { return {Type::Field, std::move(name_), 0}; }
        static PathStep index_of(const size_t i) { return {Type::Index, {}, i}; }

        [[nodiscard]] bool is_field() const noexcept { return type == Type::Field; }
        [[nodiscard]] bool is_index() const noexcept { return type == Type::Index; }

        bool operator==(const PathStep &) const = default;
    };

    /*
     PathParser
     - static utility class translating a jq-style path (".a.b[0].c", ".a[].b", ".")
       into a sequence of PathStep.
     - only syntax is checked here, existence is checked while navigating.
    */
    struct PathParser {
        // Throws ParseError on malformed input.
        static std::vector<PathStep> parse(string_view path);

        // Canonical text for a step sequence: ".a.b[0]" (empty sequence -> ".")
        static string to_string(const std::vector<PathStep> &steps);

        // Same as to_string, limited to the first `count` steps
        static string to_string(const std::vector<PathStep> &steps, size_t count);

        // Remove every literal "[]" (optional array flatten marker)
        static string strip_flatten(string_view path);

        static bool is_identifier_part(char c) noexcept;
    };
} // namespace jqp
