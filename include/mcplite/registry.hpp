#pragma once
#include "types.hpp"
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mcplite {

/// Invokes a tool with its arguments keyed by parameter name.
using ToolInvoker = std::function<nlohmann::json(const nlohmann::json& arguments)>;

struct ToolRecord {
    std::string name;
    std::optional<std::string> title;
    std::string description;
    std::vector<ParameterSpec> parameters;
    /// Parameters without a default, in declaration order.
    std::vector<std::string> required;
    ToolInvoker invoke;

    /// Required parameters absent from `arguments`, in declaration order.
    [[nodiscard]] std::vector<std::string> missing_required(const nlohmann::json& arguments) const;

    /// {"type":"object","properties":{...},"required":[...]}
    [[nodiscard]] nlohmann::json input_schema() const;
};

/// {"name", "description", "inputSchema"} as listed by tools/list.
void to_json(nlohmann::json& j, const ToolRecord& t);

/// Ordered name -> ToolRecord map. Re-adding a name replaces the record but
/// keeps its original position. Not synchronised: finish registration before
/// serving requests.
class ToolRegistry {
public:
    /// Returns true when an existing record was replaced.
    bool add(ToolRecord record);

    [[nodiscard]] const ToolRecord* find(const std::string& name) const;
    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] const std::vector<ToolRecord>& records() const { return records_; }

    [[nodiscard]] size_t size() const { return records_.size(); }
    [[nodiscard]] bool empty() const { return records_.empty(); }

private:
    std::vector<ToolRecord> records_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace mcplite
