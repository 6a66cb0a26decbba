#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace toolsrv {

class Codec {
public:
    /// Decode one textual frame into a JSON value.
    /// Throws ParseError on syntactically invalid JSON.
    [[nodiscard]] static nlohmann::json decode(std::string_view raw);

    /// Classify a decoded value as request, notification or response.
    /// Throws ProtocolError(InvalidRequest) when the envelope is malformed.
    [[nodiscard]] static JsonRpcMessage to_message(const nlohmann::json& j);

    /// Best-effort id extraction, used to address error responses.
    [[nodiscard]] static std::optional<RequestId> extract_id(const nlohmann::json& j);

    /// Serialize a message to a single-line JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// True when the bytes are well-formed UTF-8.
    [[nodiscard]] static bool valid_utf8(std::string_view raw);
};

} // namespace toolsrv
