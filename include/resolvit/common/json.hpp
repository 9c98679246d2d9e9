#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace resolvit::json {

    using Value = nlohmann::ordered_json;

    /// Serialize with ", " and ": " separators, ASCII escaping and insertion-ordered keys.
    /// Ledger nodes hash state values in exactly this layout.
    inline std::string dumps(const Value &value) {
        if (value.is_object()) {
            std::string out = "{";
            bool first = true;
            for (auto it = value.begin(); it != value.end(); ++it) {
                if (!first)
                    out += ", ";
                first = false;
                out += Value(it.key()).dump(-1, ' ', true);
                out += ": ";
                out += dumps(it.value());
            }
            out += "}";
            return out;
        }
        if (value.is_array()) {
            std::string out = "[";
            bool first = true;
            for (const auto &item : value) {
                if (!first)
                    out += ", ";
                first = false;
                out += dumps(item);
            }
            out += "]";
            return out;
        }
        return value.dump(-1, ' ', true);
    }

    /// Parse without throwing; discarded value on malformed text
    inline Value parse(const std::string &text) { return Value::parse(text, nullptr, false); }

} // namespace resolvit::json
