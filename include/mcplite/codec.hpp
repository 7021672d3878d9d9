#pragma once
#include "error.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace mcplite {

class Codec {
public:
    /// Parse a serialized request envelope. Any JSON value is returned; the
    /// object check belongs to request handling. Throws McpParseError on
    /// invalid JSON or trailing content.
    [[nodiscard]] static nlohmann::json parse(std::string_view raw);

    /// Serialize an envelope to compact JSON text.
    [[nodiscard]] static std::string serialize(const nlohmann::json& envelope);
};

} // namespace mcplite
