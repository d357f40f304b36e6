#pragma once

#include "Errors.hpp"
#include "Result.hpp"
#include "ServiceDescription.hpp"

namespace courier::core {

/**
 * @brief Evaluates one acceptor against the outcome of a poll.
 *
 * Exactly one of `result` and `error` is non-null. `path`, `pathAll` and
 * `pathAny` only match results; `error` only matches errors (by error code);
 * `status` matches the HTTP status of either.
 */
bool AcceptorMatches(const models::AcceptorConfig& acceptor, const models::Result* result,
                     const ServiceException* error);

}  // namespace courier::core
