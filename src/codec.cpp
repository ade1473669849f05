#include "fsgate/codec.hpp"
#include "fsgate/error.hpp"
#include "fsgate/sanitizer.hpp"
#include "fsgate/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>

namespace fsgate {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            auto object = val.get_object();
            for (auto field : object) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json simdjson_doc_to_nlohmann(simdjson::ondemand::document& doc) {
    auto val = doc.get_value();
    if (val.error()) {
        throw FormatError(std::string("JSON parse error: ") + simdjson::error_message(val.error()));
    }
    nlohmann::json j = simdjson_to_nlohmann(val.value());
    if (!doc.at_end()) {
        throw FormatError("JSON parse error: trailing content after value");
    }
    return j;
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    // jsonrpc is optional, but when present it must name 2.0
    if (j.contains("jsonrpc")) {
        const auto& version = j.at("jsonrpc");
        if (!version.is_string() || version.get<std::string>() != JSONRPC_VERSION) {
            throw FormatError("Invalid jsonrpc version, expected '2.0'");
        }
    }

    bool has_id = j.contains("id") && !j.at("id").is_null();
    bool has_method = j.contains("method");

    if (has_method && !j.at("method").is_string()) {
        throw FormatError("'method' must be a string");
    }

    std::optional<nlohmann::json> params;
    if (j.contains("params") && !j.at("params").is_null()) {
        if (!j.at("params").is_object()) {
            throw FormatError("'params' must be an object");
        }
        params = j.at("params");
    }

    RequestId id;
    if (has_id) {
        from_json(j.at("id"), id);
    }

    if (has_method && has_id) {
        JsonRpcRequest req;
        req.id = std::move(id);
        req.method = j.at("method").get<std::string>();
        req.params = std::move(params);
        return req;
    } else if (has_method) {
        // No id, or an explicit null id: a notification
        JsonRpcNotification notif;
        notif.method = j.at("method").get<std::string>();
        notif.params = std::move(params);
        return notif;
    } else if (has_id) {
        // A response from the client side
        JsonRpcResponse resp;
        resp.id = std::move(id);
        if (j.contains("result")) resp.result = j.at("result");
        if (j.contains("error")) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                throw FormatError(std::string("Malformed error object: ") + e.what());
            }
        }
        return resp;
    }
    throw FormatError("Cannot determine message type: missing 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw FormatError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw FormatError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    nlohmann::json j;
    try {
        j = simdjson_doc_to_nlohmann(doc);
    } catch (const FormatError&) {
        throw;
    } catch (const std::exception& e) {
        throw FormatError(std::string("JSON parse error: ") + e.what());
    }

    if (!j.is_object()) {
        throw FormatError("Message must be a JSON object");
    }

    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    std::string encoded = Sanitizer::sanitize(j).dump();
    return Sanitizer::scrub_encoded(encoded);
}

std::string Codec::serialize_safe(const JsonRpcMessage& msg) noexcept {
    try {
        std::string line = serialize(msg);
        if (!line.empty()) return line;
        spdlog::error("Serializer produced an empty frame");
    } catch (const std::exception& e) {
        spdlog::error("Response serialization failed: {}", e.what());
    }

    auto id = message_id(msg);
    if (id) {
        try {
            std::string line = serialize(make_error_response(
                *id, error::InternalError, "Internal error: response could not be serialized"));
            if (!line.empty()) return line;
        } catch (const std::exception& e) {
            spdlog::error("Error response serialization failed: {}", e.what());
        }
    }
    return std::string(FALLBACK_ERROR_LINE);
}

} // namespace fsgate
