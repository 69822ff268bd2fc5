#include "mcpconn/codec.hpp"
#include "mcpconn/error.hpp"
#include "mcpconn/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace mcpconn {

namespace {

nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
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
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json to_nlohmann(std::string_view raw) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw ParseError(std::string("JSON parse error: ")
                             + simdjson::error_message(val.error()));
        }
        nlohmann::json j = simdjson_to_nlohmann(val.value());
        if (!doc.at_end()) {
            throw ParseError("Trailing content after JSON document");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }
}

RequestId parse_id(const nlohmann::json& j) {
    try {
        RequestId id;
        from_json(j, id);
        return id;
    } catch (const std::exception& e) {
        throw ParseError(e.what());
    }
}

} // anonymous namespace

JsonRpcResponse Codec::parse_response(const nlohmann::json& j) {
    JsonRpcResponse resp;
    if (j.contains("id") && !j.at("id").is_null()) {
        resp.id = parse_id(j.at("id"));
    }
    if (j.contains("result")) resp.result = j.at("result");
    if (j.contains("error")) {
        const auto& err = j.at("error");
        resp.raw_error = err;
        if (err.is_object() && err.contains("code") && err.contains("message")
            && err.at("code").is_number_integer() && err.at("message").is_string()) {
            resp.error = err.get<JsonRpcError>();
        } else {
            // Not a conforming error object; keep it readable for callers.
            resp.error = JsonRpcError{error::InternalError,
                                      err.is_string() ? err.get<std::string>() : err.dump(),
                                      err};
        }
    }
    return resp;
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    if (j.contains("jsonrpc")) {
        const auto& v = j.at("jsonrpc");
        if (!v.is_string() || v.get<std::string>() != JSONRPC_VERSION) {
            throw ParseError("Invalid jsonrpc version, expected '2.0'");
        }
    }

    const bool has_id = j.contains("id");
    const bool has_method = j.contains("method");

    if (has_method) {
        if (!j.contains("jsonrpc")) {
            throw ParseError("Missing 'jsonrpc' field");
        }
        if (!j.at("method").is_string()) {
            throw ParseError("'method' must be a string");
        }
        if (has_id) {
            if (j.at("id").is_null()) {
                throw ParseError("Request ID must not be null");
            }
            JsonRpcRequest req;
            req.id = parse_id(j.at("id"));
            req.method = j.at("method").get<std::string>();
            if (j.contains("params")) req.params = j.at("params");
            return req;
        }
        JsonRpcNotification notif;
        notif.method = j.at("method").get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    }

    if (has_id || j.contains("result") || j.contains("error")) {
        return parse_response(j);
    }

    throw ParseError("Cannot determine message type: missing 'id', 'method' and 'result'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    nlohmann::json j = to_nlohmann(raw);
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace mcpconn
