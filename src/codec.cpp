#include "toolsrv/codec.hpp"
#include "toolsrv/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace toolsrv {

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

ProtocolError invalid_request(const std::string& msg) {
    return ProtocolError(error::InvalidRequest, msg);
}

void check_params(const nlohmann::json& j) {
    if (j.contains("params") && !j.at("params").is_object() && !j.at("params").is_array()) {
        throw invalid_request("'params' must be an object or array");
    }
}

} // anonymous namespace

nlohmann::json Codec::decode(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto error = parser.iterate(padded).get(doc);
    if (error) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(error));
    }

    // The on-demand API reports most syntax errors lazily, during traversal.
    try {
        simdjson::ondemand::json_type type;
        auto type_error = doc.type().get(type);
        if (type_error) {
            throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(type_error));
        }
        if (type != simdjson::ondemand::json_type::object
            && type != simdjson::ondemand::json_type::array) {
            // Scalar documents are never a valid envelope; keep the value so
            // the dispatcher can answer with invalid-request.
            try {
                return nlohmann::json::parse(raw);
            } catch (const nlohmann::json::parse_error& e) {
                throw ParseError(std::string("JSON parse error: ") + e.what());
            }
        }

        simdjson::ondemand::value val;
        auto val_error = doc.get_value().get(val);
        if (val_error) {
            throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(val_error));
        }
        nlohmann::json j = simdjson_to_nlohmann(val);
        if (!doc.at_end()) {
            throw ParseError("JSON parse error: trailing content after document");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(std::string("JSON parse error: ") + e.what());
    }
}

JsonRpcMessage Codec::to_message(const nlohmann::json& j) {
    if (j.is_array()) {
        throw invalid_request("Batch requests are not supported");
    }
    if (!j.is_object()) {
        throw invalid_request("Message must be a JSON object");
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()
        || version->get<std::string>() != JSONRPC_VERSION) {
        throw invalid_request("Missing or invalid 'jsonrpc' version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method) {
        if (!j.at("method").is_string()) {
            throw invalid_request("'method' must be a string");
        }
        check_params(j);

        if (!has_id) {
            JsonRpcNotification notif;
            notif.method = j.at("method").get<std::string>();
            if (j.contains("params")) notif.params = j.at("params");
            return notif;
        }

        auto id = parse_request_id(j.at("id"));
        if (!id) {
            throw invalid_request("Request id must be a string or a number");
        }
        JsonRpcRequest req;
        req.id = std::move(*id);
        req.method = j.at("method").get<std::string>();
        if (j.contains("params")) req.params = j.at("params");
        return req;
    }

    if (has_id && (j.contains("result") || j.contains("error"))) {
        JsonRpcResponse resp;
        try {
            from_json(j, resp);
        } catch (const nlohmann::json::exception& e) {
            throw invalid_request(std::string("Malformed response: ") + e.what());
        } catch (const std::invalid_argument& e) {
            throw invalid_request(std::string("Malformed response: ") + e.what());
        }
        return resp;
    }

    throw invalid_request("Missing 'method'");
}

std::optional<RequestId> Codec::extract_id(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    auto it = j.find("id");
    if (it == j.end()) return std::nullopt;
    return parse_request_id(*it);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Replace invalid UTF-8 rather than throwing mid-frame.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool Codec::valid_utf8(std::string_view raw) {
    return simdjson::validate_utf8(raw.data(), raw.size());
}

} // namespace toolsrv
