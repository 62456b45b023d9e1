#include "JQPDocument.hpp"

#include <format>
#include <fstream>
#include <unordered_map>

using namespace std;

namespace jqp {
    /* -------------------------
       Construction / loading
       ------------------------- */
    Document::Document(ordered_json root, DocumentOptions options, ostream &diagnostics)
        : _root(std::move(root)), _options(options), _diagnostics(&diagnostics) {
        if (_root.is_null())
            throw InvalidInputError("Cannot create a document from a null JSON value");
    }

    Document Document::from_file(const filesystem::path &file, DocumentOptions options, ostream &diagnostics) {
        ifstream in(file);
        if (!in)
            throw InvalidInputError(std::format("Cannot open JSON file '{}'", file.string()), file.string());
        try {
            return from_stream(in, options, diagnostics);
        } catch (const InvalidInputError &e) {
            throw InvalidInputError(std::format("{}: {}", file.string(), e.what()), file.string());
        }
    }

    Document Document::from_stream(istream &in, DocumentOptions options, ostream &diagnostics) {
        ordered_json root;
        try {
            root = ordered_json::parse(in);
        } catch (const ordered_json::parse_error &e) {
            throw InvalidInputError(std::format("Invalid JSON: {}", e.what()));
        }
        return Document(std::move(root), options, diagnostics);
    }

    Document Document::from_string(const string_view text, DocumentOptions options, ostream &diagnostics) {
        ordered_json root;
        try {
            root = ordered_json::parse(text.begin(), text.end());
        } catch (const ordered_json::parse_error &e) {
            throw InvalidInputError(std::format("Invalid JSON: {}", e.what()));
        }
        return Document(std::move(root), options, diagnostics);
    }

    /* -------------------------
       Saving
       ------------------------- */
    void Document::save(const filesystem::path &file, const int indent) const {
        ofstream out(file, ios::out | ios::trunc);
        if (!out)
            throw InvalidInputError(std::format("Cannot open '{}' for writing", file.string()), file.string());
        save(out, indent);
        out.flush();
        if (!out)
            throw InvalidInputError(std::format("Failed writing JSON to '{}'", file.string()), file.string());
    }

    void Document::save(ostream &out, const int indent) const {
        out << _root.dump(indent) << '\n';
    }

    /* -------------------------
       Failure policy
       ------------------------- */
    void Document::handle_failure(const JQPError &e) const {
        if (!_options.suppressDiagnostics)
            *_diagnostics << "jqp warning: " << e.what() << '\n';
        if (!_options.suppressErrors)
            throw;
    }

    /* -------------------------
       Navigation
       ------------------------- */

    /* resolve:
       - Field on object: member lookup
       - Field on array: lookup applied to every element, found values collected into a new array;
         elements that are not objects or lack the field are skipped, none found -> not found
       - Index on array: bounds-checked element access
       - anything else -> not found
    */
    ordered_json Document::resolve(const ordered_json &root, const vector<PathStep> &steps, const string_view path) {
        const ordered_json *cur = &root;
        ordered_json owned;
        for (size_t i = 0; i < steps.size(); ++i) {
            const PathStep &step = steps[i];
            if (step.is_field()) {
                if (cur->is_object()) {
                    const auto it = cur->find(step.name);
                    if (it == cur->end())
                        throw NotFoundError(std::format("Path '{}' not found: no field '{}' under '{}'", path,
                                                        step.name, PathParser::to_string(steps, i)), string(path));
                    cur = &(*it);
                } else if (cur->is_array()) {
                    ordered_json collected = ordered_json::array();
                    for (const auto &el: *cur) {
                        if (!el.is_object()) continue;
                        const auto it = el.find(step.name);
                        if (it != el.end()) collected.push_back(*it);
                    }
                    if (collected.empty())
                        throw NotFoundError(std::format("Path '{}' not found: no element of array '{}' has field '{}'",
                                                        path, PathParser::to_string(steps, i), step.name),
                                            string(path));
                    owned = std::move(collected);
                    cur = &owned;
                } else {
                    throw NotFoundError(std::format("Path '{}' not found: '{}' is a {}, not an object", path,
                                                    PathParser::to_string(steps, i), cur->type_name()), string(path));
                }
            } else {
                if (!cur->is_array())
                    throw NotFoundError(std::format("Path '{}' not found: '{}' is a {}, not an array", path,
                                                    PathParser::to_string(steps, i), cur->type_name()), string(path));
                if (step.index >= cur->size())
                    throw NotFoundError(std::format("Path '{}' not found: index {} out of range for '{}' (size {})",
                                                    path, step.index, PathParser::to_string(steps, i), cur->size()),
                                        string(path));
                // element lives inside owned, move it out before reassigning
                if (cur == &owned) {
                    ordered_json element = std::move(owned[step.index]);
                    owned = std::move(element);
                } else {
                    cur = &(*cur)[step.index];
                }
            }
        }
        return *cur;
    }

    ordered_json &Document::locate(ordered_json &root, const vector<PathStep> &steps, const size_t count,
                                   const string_view path) {
        ordered_json *cur = &root;
        for (size_t i = 0; i < count && i < steps.size(); ++i) {
            const PathStep &step = steps[i];
            if (step.is_field()) {
                if (!cur->is_object())
                    throw NotFoundError(std::format("Path '{}' not found: '{}' is a {}, not an object", path,
                                                    PathParser::to_string(steps, i), cur->type_name()), string(path));
                const auto it = cur->find(step.name);
                if (it == cur->end())
                    throw NotFoundError(std::format("Path '{}' not found: no field '{}' under '{}'", path,
                                                    step.name, PathParser::to_string(steps, i)), string(path));
                cur = &(*it);
            } else {
                if (!cur->is_array())
                    throw NotFoundError(std::format("Path '{}' not found: '{}' is a {}, not an array", path,
                                                    PathParser::to_string(steps, i), cur->type_name()), string(path));
                if (step.index >= cur->size())
                    throw NotFoundError(std::format("Path '{}' not found: index {} out of range for '{}' (size {})",
                                                    path, step.index, PathParser::to_string(steps, i), cur->size()),
                                        string(path));
                cur = &(*cur)[step.index];
            }
        }
        return *cur;
    }

    /* -------------------------
       Public API
       ------------------------- */
    ordered_json Document::get(const string_view path) const {
        try {
            return resolve(_root, PathParser::parse(path), path);
        } catch (const JQPError &e) {
            handle_failure(e);
            return nullptr;
        }
    }

    string Document::query(const string_view path) const {
        try {
            const ordered_json value = resolve(_root, PathParser::parse(path), path);
            try {
                return value.dump();
            } catch (const ordered_json::type_error &e) {
                throw InvalidInputError(std::format("Cannot serialize value at '{}': {}", path, e.what()),
                                        string(path));
            }
        } catch (const JQPError &e) {
            handle_failure(e);
            return {};
        }
    }

    bool Document::set_path(const string_view path, ordered_json value) {
        try {
            const vector<PathStep> steps = PathParser::parse(path);
            if (steps.empty()) {
                if (value.is_null())
                    throw InvalidInputError("Cannot replace the document root with null", string(path));
                _root = std::move(value);
            } else {
                ordered_json &parent = locate(_root, steps, steps.size() - 1, path);
                const PathStep &last = steps.back();
                const string parent_path = PathParser::to_string(steps, steps.size() - 1);
                if (last.is_field()) {
                    if (!parent.is_object())
                        throw NotFoundError(std::format("Cannot set '{}': '{}' is a {}, not an object", path,
                                                        parent_path, parent.type_name()), string(path));
                    parent[last.name] = std::move(value);
                } else {
                    if (!parent.is_array())
                        throw NotFoundError(std::format("Cannot set '{}': '{}' is a {}, not an array", path,
                                                        parent_path, parent.type_name()), string(path));
                    if (last.index >= parent.size())
                        throw NotFoundError(std::format("Cannot set '{}': index {} out of range for '{}' (size {})",
                                                        path, last.index, parent_path, parent.size()), string(path));
                    parent[last.index] = std::move(value);
                }
            }
            _leafIndex.reset();
            return true;
        } catch (const JQPError &e) {
            handle_failure(e);
            return false;
        }
    }

    /* collect_leaves:
       - non-empty object: recurse with ".key"
       - non-empty array: recurse with "[i]"
       - everything else (null, scalars, empty containers) is a leaf
    */
    void Document::collect_leaves(const ordered_json &node, const string &prefix, vector<Leaf> &leaves) {
        switch (node.type()) {
            case ordered_json::value_t::object:
                if (node.empty()) break;
                for (auto it = node.begin(); it != node.end(); ++it)
                    collect_leaves(it.value(), prefix + "." + it.key(), leaves);
                return;
            case ordered_json::value_t::array:
                if (node.empty()) break;
                for (size_t i = 0; i < node.size(); ++i)
                    collect_leaves(node[i], std::format("{}[{}]", prefix, i), leaves);
                return;
            case ordered_json::value_t::null:
            case ordered_json::value_t::string:
            case ordered_json::value_t::boolean:
            case ordered_json::value_t::number_integer:
            case ordered_json::value_t::number_unsigned:
            case ordered_json::value_t::number_float:
            case ordered_json::value_t::binary:
            case ordered_json::value_t::discarded:
                break;
        }
        // root leaf is ".", root array elements are ".[i]"
        if (prefix.empty() || prefix.front() == '[')
            leaves.emplace_back("." + prefix, node);
        else
            leaves.emplace_back(prefix, node);
    }

    /* paths:
       - leaves are appended straight into the object storage, ordered_json's keyed insert is a linear scan
       - keys holding '.' or '[' can render the same path as a nested leaf ({"a[0]": 1, "a": [2]}),
         the later leaf then replaces the earlier one in place
    */
    const ordered_json &Document::paths() {
        vector<Leaf> leaves;
        collect_leaves(_root, "", leaves);

        ordered_json index = ordered_json::object();
        auto &entries = index.get_ref<ordered_json::object_t &>();
        entries.reserve(leaves.size());
        unordered_map<string, size_t> positions;
        positions.reserve(leaves.size());
        for (auto &[path, value]: leaves) {
            const auto [it, inserted] = positions.try_emplace(path, entries.size());
            if (inserted)
                entries.emplace_back(std::move(path), std::move(value));
            else
                (entries.begin() + static_cast<ptrdiff_t>(it->second))->second = std::move(value);
        }
        _leafIndex = std::move(index);
        return *_leafIndex;
    }

    vector<string> Document::get_paths_to_value(const ordered_json &target) {
        try {
            vector<string> matches;
            for (const auto &leaf: paths().items()) {
                if (leaf.value() == target) matches.push_back(leaf.key());
            }
            if (matches.empty())
                throw NotFoundError(std::format("No path holds the value {}",
                                                target.dump(-1, ' ', false, ordered_json::error_handler_t::replace)));
            return matches;
        } catch (const JQPError &e) {
            handle_failure(e);
            return {};
        }
    }
} // namespace jqp
