#pragma once

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

#include "DocumentOptions.hpp"
#include "JQPParser.hpp"

using std::string;
using std::string_view;
using ordered_json = nlohmann::ordered_json;

namespace jqp {
    /*
     Document
     - owns a JSON root value and answers jq-like path queries on it:
       query/get (read), set_path (write), paths (leaf enumeration), get_paths_to_value (search)
     - failures are governed by DocumentOptions: warning line on the diagnostics stream
       unless suppressDiagnostics, exception unless suppressErrors
     - not synchronized, callers sharing a Document across threads must lock around each call
    */
    class Document {
    public:
        // Throws InvalidInputError if root is null.
        explicit Document(ordered_json root, DocumentOptions options = {}, std::ostream &diagnostics = std::cerr);

        // Load helpers. Throw InvalidInputError on unreadable source, invalid JSON or null content.
        static Document from_file(const std::filesystem::path &file, DocumentOptions options = {},
                                  std::ostream &diagnostics = std::cerr);

        static Document from_stream(std::istream &in, DocumentOptions options = {},
                                    std::ostream &diagnostics = std::cerr);

        static Document from_string(string_view text, DocumentOptions options = {},
                                    std::ostream &diagnostics = std::cerr);

        // Value at `path` serialized as JSON text; "" on a suppressed failure.
        [[nodiscard]] string query(string_view path) const;

        // Value at `path`; null on a suppressed failure.
        [[nodiscard]] ordered_json get(string_view path) const;

        // Assign `value` at `path`, every step but the last must already exist.
        // Returns false on a suppressed failure (document left unchanged).
        bool set_path(string_view path, ordered_json value);

        // Canonical leaf path -> value, rebuilt on every call.
        const ordered_json &paths();

        // Every leaf path whose value equals `target` (same type and value), in enumeration order.
        std::vector<string> get_paths_to_value(const ordered_json &target);

        // Write the root as JSON text, indent < 0 means compact.
        void save(const std::filesystem::path &file, int indent = 4) const;

        void save(std::ostream &out, int indent = 4) const;

        [[nodiscard]] const ordered_json &root() const noexcept { return _root; }
        [[nodiscard]] const DocumentOptions &options() const noexcept { return _options; }
        void set_options(const DocumentOptions &options) noexcept { _options = options; }

    private:
        // Read navigation, Field steps on arrays are mapped over the elements.
        static ordered_json resolve(const ordered_json &root, const std::vector<PathStep> &steps, string_view path);

        // Strict navigation through the first `count` steps, no flattening.
        static ordered_json &locate(ordered_json &root, const std::vector<PathStep> &steps, size_t count,
                                    string_view path);

        using Leaf = std::pair<string, ordered_json>;

        static void collect_leaves(const ordered_json &node, const string &prefix, std::vector<Leaf> &leaves);

        // Called from a catch block: warn, then rethrow unless errors are suppressed.
        void handle_failure(const JQPError &e) const;

        ordered_json _root;
        DocumentOptions _options;
        std::ostream *_diagnostics;
        std::optional<ordered_json> _leafIndex;
    };
} // namespace jqp
