/**
 * @file codec.hpp
 * @brief JSON request/response documents exchanged with callers.
 *
 * Request:  {"code": string, "input": string?, "time_limit_ms": number?}
 * Response: {"status": string, "output": string,
 *            "execution_time_ms": integer, "memory_used_kb": integer}
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace exec_sandbox {

using json = nlohmann::json;

/**
 * @brief Build a request from an already parsed document.
 *
 * Missing or null fields take their defaults. A non-object document or a
 * field of the wrong JSON type fails with ErrorKind::Parse.
 */
Result<ExecutionRequest> request_from_json(const json& document,
                                           Milliseconds default_limit = kDefaultTimeLimit);

/// Parse and validate a request document.
Result<ExecutionRequest> decode_request(std::string_view text,
                                        Milliseconds default_limit = kDefaultTimeLimit);

json request_to_json(const ExecutionRequest& request);
std::string encode_request(const ExecutionRequest& request);

/// Only the four wire fields; diagnostics stay internal.
json outcome_to_json(const ExecutionOutcome& outcome);

/**
 * @brief Serialize an outcome. Bytes that are not valid UTF-8 (binary
 *        program output) become U+FFFD instead of failing the dump.
 */
std::string encode_response(const ExecutionOutcome& outcome);

/// Client side of encode_response().
Result<ExecutionOutcome> decode_response(std::string_view text);

}  // namespace exec_sandbox
