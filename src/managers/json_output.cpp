#include "managers/json_output.hpp"

#include "localization.hpp"
#include "utils.hpp"

json parse_json_output(std::string_view tool, std::string_view text) {
    const std::string body = trim(std::string(text));
    if (body.empty()) return json();
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw unexpected_json(tool, e);
    }
}

InvocationError unexpected_json(std::string_view tool, const json::exception& e) {
    return InvocationError(InvocationError::Kind::Failed,
                           string_format("error.unparseable_output", std::string(tool), e.what()));
}
