#pragma once

#include <string_view>

#include "types.hpp"

namespace courier::infra::parsers {

/**
 * @brief Evaluates a dotted path expression against a JSON document.
 *
 * Supported forms: `a.b.c`, indexes `a[0]` / `a[-1]`, and flattening
 * projections `a[].b` (nested projections are flattened into one array).
 * Missing members, out-of-range indexes and type mismatches yield `null`.
 *
 * @throws std::invalid_argument for a malformed expression.
 */
json::value Search(const json::value& root, std::string_view expression);

// True for null, empty string, empty array and empty object.
bool IsEmpty(const json::value& value) noexcept;

}  // namespace courier::infra::parsers
