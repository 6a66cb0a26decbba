#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include <optional>
#include <string>

namespace toolsrv {

struct ValidationError {
    std::string field;
    std::string message;
    std::optional<std::string> expected;
    std::optional<std::string> actual;

    JsonRpcError to_rpc_error() const;
};

/// Check tool arguments against a schema: required parameters must be
/// present and every declared parameter must have its primitive type.
/// Undeclared extra arguments are accepted. A null optional parameter
/// counts as absent.
[[nodiscard]] std::optional<ValidationError> validate(const InputSchema& schema,
                                                      const nlohmann::json& arguments);

} // namespace toolsrv
