#include "toolsrv/schema.hpp"
#include "toolsrv/error.hpp"

namespace toolsrv {

namespace {

bool matches(ParamType type, const nlohmann::json& value) {
    switch (type) {
        case ParamType::String:  return value.is_string();
        case ParamType::Integer: return value.is_number_integer();
        case ParamType::Number:  return value.is_number();
        case ParamType::Boolean: return value.is_boolean();
        case ParamType::Object:  return value.is_object();
        case ParamType::Array:   return value.is_array();
    }
    return false;
}

} // anonymous namespace

JsonRpcError ValidationError::to_rpc_error() const {
    nlohmann::json data = {{"field", field}};
    if (expected) data["expected"] = *expected;
    if (actual) data["actual"] = *actual;
    return JsonRpcError{error::InvalidParams, "Invalid arguments: " + message, std::move(data)};
}

std::optional<ValidationError> validate(const InputSchema& schema,
                                        const nlohmann::json& arguments) {
    if (!arguments.is_object()) {
        return ValidationError{
            "arguments",
            "'arguments' must be an object, got " + std::string(json_type_name(arguments)),
            std::string("object"),
            std::string(json_type_name(arguments))
        };
    }

    for (const auto& param : schema.params) {
        auto it = arguments.find(param.name);
        bool absent = it == arguments.end() || (it->is_null() && !param.required);
        if (absent) {
            if (param.required) {
                return ValidationError{
                    param.name,
                    "missing required argument '" + param.name + "'",
                    std::string(param_type_name(param.type)),
                    std::nullopt
                };
            }
            continue;
        }
        if (!matches(param.type, *it)) {
            std::string expected(param_type_name(param.type));
            std::string actual(json_type_name(*it));
            return ValidationError{
                param.name,
                "argument '" + param.name + "' must be " + expected + ", got " + actual,
                expected,
                actual
            };
        }
    }
    return std::nullopt;
}

} // namespace toolsrv
