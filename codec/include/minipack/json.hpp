/**
 * MiniPack - JSON rendering of decoded values for diagnostics.
 */
#pragma once

#include <nlohmann/json.hpp>

#include "minipack/value.hpp"

namespace minipack
{

    // Keeps object members in encounter order.
    using Json = nlohmann::ordered_json;

    /// Binary payloads become base64 strings and ext values `{"type", "data"}` objects
    /// (timestamps also carry `"timestamp"`). Maps whose keys are distinct strings become
    /// objects; any other map becomes an array of `[key, value]` pairs.
    Json to_json_value(const Value &value);

} // namespace minipack
