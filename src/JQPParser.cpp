#include "JQPParser.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>

using namespace std;

namespace jqp {
    /* -------------------------
       Scanner over the normalized path (flatten markers already removed)
       ------------------------- */
    struct Scanner {
        string_view s;
        size_t i = 0;

        explicit Scanner(const string_view src) : s(src) {
        }

        bool eof() const noexcept { return i >= s.size(); }

        char peek() const noexcept { return i < s.size() ? s[i] : '\0'; }

        char next() noexcept { return eof() ? '\0' : s[i++]; }

        size_t pos() const noexcept { return i; }
    };

    bool PathParser::is_identifier_part(const char c) noexcept {
        return c != '.' && c != '[';
    }

    string PathParser::strip_flatten(const string_view path) {
        string out;
        out.reserve(path.size());
        for (size_t i = 0; i < path.size(); ++i) {
            if (path[i] == '[' && i + 1 < path.size() && path[i + 1] == ']') {
                ++i;
                continue;
            }
            out.push_back(path[i]);
        }
        return out;
    }

    /* parse:
       - path must start with '.', "." alone is the root
       - "[]" markers are dropped before splitting
       - ".name" -> Field, "[N]" -> Index (N non-negative integer)
       - the first segment may be made of indices only (".[0]" addresses a root array)
       - ']' outside an index is an ordinary field name character
    */
    vector<PathStep> PathParser::parse(const string_view path) {
        if (path.empty() || path.front() != '.')
            throw ParseError(ParseError::Kind::MissingLeadingDot,
                             std::format("Invalid path '{}': must start with '.'", path), string(path));

        string normalized = strip_flatten(path);
        // ".[].name" flattens a root array, same as ".name"
        if (path.starts_with(".[]") && normalized.starts_with("..")) normalized.erase(0, 1);
        vector<PathStep> steps;
        if (normalized == ".") return steps;

        Scanner sc{normalized};
        bool first = true;
        while (!sc.eof()) {
            // every segment starts with '.'
            if (sc.next() != '.')
                throw ParseError(ParseError::Kind::UnexpectedCharacter,
                                 std::format("Invalid path '{}': expected '.' at offset {}", path, sc.pos() - 1),
                                 string(path));

            const size_t start = sc.pos();
            while (!sc.eof() && is_identifier_part(sc.peek())) sc.next();
            string name(normalized.substr(start, sc.pos() - start));

            if (name.empty() && !(first && sc.peek() == '['))
                throw ParseError(ParseError::Kind::EmptySegment,
                                 std::format("Invalid path '{}': empty field name", path), string(path));
            if (!name.empty()) steps.push_back(PathStep::field(std::move(name)));
            first = false;

            while (sc.peek() == '[') {
                sc.next();
                const size_t digits_start = sc.pos();
                while (!sc.eof() && sc.peek() != ']' && sc.peek() != '[' && sc.peek() != '.') sc.next();
                if (sc.peek() != ']')
                    throw ParseError(ParseError::Kind::UnterminatedBracket,
                                     std::format("Invalid path '{}': missing ']'", path), string(path));
                const string_view digits = string_view(normalized).substr(digits_start, sc.pos() - digits_start);
                sc.next();

                size_t idx = 0;
                const auto [ptr, ec] = from_chars(digits.data(), digits.data() + digits.size(), idx);
                const bool all_digits = ranges::all_of(digits, [](const unsigned char c) { return isdigit(c) != 0; });
                if (digits.empty() || !all_digits || ec != errc() || ptr != digits.data() + digits.size())
                    throw ParseError(ParseError::Kind::InvalidIndex,
                                     std::format("Invalid path '{}': array index '{}' is not a non-negative integer",
                                                 path, digits), string(path));
                steps.push_back(PathStep::index_of(idx));
            }

            if (!sc.eof() && sc.peek() != '.')
                throw ParseError(ParseError::Kind::UnexpectedCharacter,
                                 std::format("Invalid path '{}': unexpected '{}' at offset {}", path, sc.peek(),
                                             sc.pos()), string(path));
        }
        return steps;
    }

    string PathParser::to_string(const vector<PathStep> &steps) {
        return to_string(steps, steps.size());
    }

    string PathParser::to_string(const vector<PathStep> &steps, const size_t count) {
        string out;
        for (size_t i = 0; i < count && i < steps.size(); ++i) {
            if (steps[i].is_field())
                out += "." + steps[i].name;
            else
                out += std::format("[{}]", steps[i].index);
        }
        if (out.empty() || out.front() == '[') out.insert(out.begin(), '.');
        return out;
    }
} // namespace jqp
