#include "mcplite/registry.hpp"

namespace mcplite {

std::vector<std::string> ToolRecord::missing_required(const nlohmann::json& arguments) const {
    std::vector<std::string> missing;
    for (const auto& name : required) {
        if (!arguments.is_object() || !arguments.contains(name)) {
            missing.push_back(name);
        }
    }
    return missing;
}

nlohmann::json ToolRecord::input_schema() const {
    nlohmann::json properties = nlohmann::json::object();
    for (const auto& p : parameters) {
        properties[p.name] = p;
    }
    return {
        {"type", "object"},
        {"properties", properties},
        {"required", required}
    };
}

void to_json(nlohmann::json& j, const ToolRecord& t) {
    j = {
        {"name", t.name},
        {"description", t.description},
        {"inputSchema", t.input_schema()}
    };
}

bool ToolRegistry::add(ToolRecord record) {
    auto it = index_.find(record.name);
    if (it != index_.end()) {
        records_[it->second] = std::move(record);
        return true;
    }
    index_.emplace(record.name, records_.size());
    records_.push_back(std::move(record));
    return false;
}

const ToolRecord* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) return nullptr;
    return &records_[it->second];
}

bool ToolRegistry::contains(const std::string& name) const {
    return index_.count(name) > 0;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(records_.size());
    for (const auto& r : records_) out.push_back(r.name);
    return out;
}

} // namespace mcplite
