#include "mcplite/codec.hpp"
#include "mcplite/error.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace mcplite {

namespace {

namespace od = simdjson::ondemand;

// The on-demand parser validates lazily: structural errors only surface while
// the document is walked, so every step reports its error code.
simdjson::error_code convert(od::value value, nlohmann::json& out);

simdjson::error_code convert_object(od::object object, nlohmann::json& out) {
    out = nlohmann::json::object();
    for (auto field : object) {
        std::string_view key;
        if (auto err = field.unescaped_key().get(key)) return err;
        od::value member;
        if (auto err = field.value().get(member)) return err;
        if (auto err = convert(member, out[std::string(key)])) return err;
    }
    return simdjson::SUCCESS;
}

simdjson::error_code convert_array(od::array array, nlohmann::json& out) {
    out = nlohmann::json::array();
    for (auto element : array) {
        od::value item;
        if (auto err = element.get(item)) return err;
        out.push_back(nullptr);
        if (auto err = convert(item, out.back())) return err;
    }
    return simdjson::SUCCESS;
}

// Shared by nested values and the document root, whose accessors match.
template <typename Source>
simdjson::error_code convert_number(Source& value, nlohmann::json& out) {
    od::number_type kind;
    if (auto err = value.get_number_type().get(kind)) return err;

    if (kind == od::number_type::signed_integer) {
        int64_t n;
        if (auto err = value.get_int64().get(n)) return err;
        out = n;
    } else if (kind == od::number_type::unsigned_integer) {
        uint64_t n;
        if (auto err = value.get_uint64().get(n)) return err;
        out = n;
    } else {
        double n;
        if (auto err = value.get_double().get(n)) return err;
        out = n;
    }
    return simdjson::SUCCESS;
}

template <typename Source>
simdjson::error_code convert_any(Source& value, nlohmann::json& out) {
    od::json_type type;
    if (auto err = value.type().get(type)) return err;

    switch (type) {
        case od::json_type::object: {
            od::object object;
            if (auto err = value.get_object().get(object)) return err;
            return convert_object(object, out);
        }
        case od::json_type::array: {
            od::array array;
            if (auto err = value.get_array().get(array)) return err;
            return convert_array(array, out);
        }
        case od::json_type::string: {
            std::string_view text;
            if (auto err = value.get_string().get(text)) return err;
            out = std::string(text);
            return simdjson::SUCCESS;
        }
        case od::json_type::number:
            return convert_number(value, out);
        case od::json_type::boolean: {
            bool flag;
            if (auto err = value.get_bool().get(flag)) return err;
            out = flag;
            return simdjson::SUCCESS;
        }
        case od::json_type::null:
            out = nullptr;
            return simdjson::SUCCESS;
    }
    return simdjson::INCORRECT_TYPE;
}

simdjson::error_code convert(od::value value, nlohmann::json& out) {
    return convert_any(value, out);
}

[[noreturn]] void fail(simdjson::error_code err) {
    throw McpParseError(simdjson::error_message(err));
}

} // anonymous namespace

nlohmann::json Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw McpParseError("Empty input");
    }

    od::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    od::document doc;
    if (auto err = parser.iterate(padded).get(doc)) fail(err);

    nlohmann::json envelope;
    if (auto err = convert_any(doc, envelope)) fail(err);

    // A null root is typed but never consumed, so the iterator cannot vouch
    // for what follows it.
    if (envelope.is_null()) {
        auto first = raw.find_first_not_of(" \t\r\n");
        auto last = raw.find_last_not_of(" \t\r\n");
        if (raw.substr(first, last - first + 1) != "null") {
            throw McpParseError("Trailing content after JSON document");
        }
        return envelope;
    }
    if (!doc.at_end()) {
        throw McpParseError("Trailing content after JSON document");
    }
    return envelope;
}

std::string Codec::serialize(const nlohmann::json& envelope) {
    return envelope.dump();
}

} // namespace mcplite
