#pragma once

#include "exception.hpp"

#include <nlohmann/json.hpp>

#include <string_view>

using json = nlohmann::json;

// Parses the --json output of `tool`. Empty output yields a null value.
json parse_json_output(std::string_view tool, std::string_view text);

// Wraps a schema mismatch found while walking parsed output.
InvocationError unexpected_json(std::string_view tool, const json::exception& e);
