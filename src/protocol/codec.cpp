/**
 * @file codec.cpp
 * @brief JSON codec for execution requests and responses.
 */

#include "protocol/codec.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace exec_sandbox {

namespace {

constexpr int kCompactIndent = -1;

Result<std::string> optional_string(const json& document, const char* key) {
    auto it = document.find(key);
    if (it == document.end() || it->is_null()) return std::string{};
    if (!it->is_string()) {
        return Error{ErrorKind::Parse, std::string{"'"} + key + "' must be a string"};
    }
    return it->get<std::string>();
}

Result<Milliseconds> optional_limit(const json& document, Milliseconds fallback) {
    auto it = document.find("time_limit_ms");
    if (it == document.end() || it->is_null()) return fallback;

    // Unsigned also satisfies is_number_integer(); check it first so values
    // past INT64_MAX saturate instead of wrapping negative.
    if (it->is_number_unsigned()) {
        auto value = it->get<uint64_t>();
        constexpr auto max = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
        return Milliseconds{static_cast<int64_t>(std::min(value, max))};
    }
    if (it->is_number_integer()) {
        return Milliseconds{it->get<int64_t>()};
    }
    if (it->is_number_float()) {
        double value = it->get<double>();
        if (!std::isfinite(value)) {
            return Error{ErrorKind::Parse, "'time_limit_ms' must be finite"};
        }
        // Saturate; the supervisor clamps to its own ceiling anyway.
        constexpr auto max = static_cast<double>(std::numeric_limits<int64_t>::max() / 2);
        value = std::clamp(value, -max, max);
        return Milliseconds{static_cast<int64_t>(value)};
    }
    return Error{ErrorKind::Parse, "'time_limit_ms' must be a number"};
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────

Result<ExecutionRequest> request_from_json(const json& document, Milliseconds default_limit) {
    if (!document.is_object()) {
        return Error{ErrorKind::Parse, "Request must be a JSON object"};
    }

    auto code = optional_string(document, "code");
    if (!code) return code.error();
    auto input = optional_string(document, "input");
    if (!input) return input.error();
    auto limit = optional_limit(document, default_limit);
    if (!limit) return limit.error();

    ExecutionRequest request;
    request.code = std::move(code).value();
    request.input = std::move(input).value();
    request.time_limit = *limit;
    return request;
}

Result<ExecutionRequest> decode_request(std::string_view text, Milliseconds default_limit) {
    json document = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded()) {
        return Error{ErrorKind::Parse, "Malformed request: not valid JSON"};
    }
    return request_from_json(document, default_limit);
}

json request_to_json(const ExecutionRequest& request) {
    return json{
        {"code", request.code},
        {"input", request.input},
        {"time_limit_ms", request.time_limit.count()},
    };
}

std::string encode_request(const ExecutionRequest& request) {
    return request_to_json(request).dump(kCompactIndent, ' ', false,
                                          json::error_handler_t::replace);
}

// ─────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────

json outcome_to_json(const ExecutionOutcome& outcome) {
    return json{
        {"status", std::string{to_string(outcome.status)}},
        {"output", outcome.output},
        {"execution_time_ms", outcome.elapsed.count()},
        {"memory_used_kb", outcome.memory_kb},
    };
}

std::string encode_response(const ExecutionOutcome& outcome) {
    return outcome_to_json(outcome).dump(kCompactIndent, ' ', false,
                                         json::error_handler_t::replace);
}

Result<ExecutionOutcome> decode_response(std::string_view text) {
    json document = json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded() || !document.is_object()) {
        return Error{ErrorKind::Parse, "Malformed response document"};
    }

    auto status_it = document.find("status");
    if (status_it == document.end() || !status_it->is_string()) {
        return Error{ErrorKind::Parse, "Response has no status"};
    }
    auto status = status_from_string(status_it->get<std::string>());
    if (!status) {
        return Error{ErrorKind::Parse, "Unknown status: " + status_it->get<std::string>()};
    }

    auto output = optional_string(document, "output");
    if (!output) return output.error();

    ExecutionOutcome outcome;
    outcome.status = *status;
    outcome.output = std::move(output).value();
    if (auto it = document.find("execution_time_ms"); it != document.end() && it->is_number()) {
        outcome.elapsed = Milliseconds{it->get<int64_t>()};
    }
    if (auto it = document.find("memory_used_kb"); it != document.end() && it->is_number_unsigned()) {
        outcome.memory_kb = it->get<uint64_t>();
    }
    return outcome;
}

}  // namespace exec_sandbox
