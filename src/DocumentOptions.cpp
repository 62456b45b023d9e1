#include "DocumentOptions.hpp"
#include "JQPParser.hpp"

#include <format>

using namespace std;

namespace jqp {
    static bool read_flag(const ordered_json &config, const string &name, const bool defaultValue) {
        if (config.is_object() && config.contains(name) && !config.at(name).is_boolean())
            throw InvalidInputError(std::format("Option '{}' must be a boolean, got {}", name, config.at(name).dump()));
        return DocumentOptions::get_option(config, name, defaultValue);
    }

    DocumentOptions DocumentOptions::from_json(const ordered_json &config) {
        DocumentOptions options;
        options.suppressErrors = read_flag(config, "suppressErrors", options.suppressErrors);
        options.suppressDiagnostics = read_flag(config, "suppressDiagnostics", options.suppressDiagnostics);
        return options;
    }

    ordered_json DocumentOptions::to_json() const {
        return {{"suppressErrors", suppressErrors}, {"suppressDiagnostics", suppressDiagnostics}};
    }
} // namespace jqp
