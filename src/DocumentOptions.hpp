#pragma once

#include <string>
#include <nlohmann/json.hpp>

using ordered_json = nlohmann::ordered_json;

namespace jqp {
    /*
     DocumentOptions
     - per-document failure policy, the two flags are independent:
       suppressErrors: failing operations return an empty/default result instead of throwing
       suppressDiagnostics: no warning line is written on failure
    */
    struct DocumentOptions {
        bool suppressErrors = false;
        bool suppressDiagnostics = false;

        // Read options from a JSON object, e.g. {"suppressErrors": true}.
        // Missing keys keep their default, a non-object yields the defaults.
        // Throws InvalidInputError if a known key does not hold a boolean.
        static DocumentOptions from_json(const ordered_json &config);

        [[nodiscard]] ordered_json to_json() const;

        template<typename T>
        static T get_option(const ordered_json &options, const std::string &name, const T &defaultValue) {
            if (options.is_object() && options.contains(name))
                return options.at(name).get<T>();
            return defaultValue;
        }

        bool operator==(const DocumentOptions &) const = default;
    };
} // namespace jqp
