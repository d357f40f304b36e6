#pragma once

#include <string>
#include <string_view>

#include "types.hpp"

namespace courier::app {

// Parses the JSON object given on the command line; empty text gives {}.
// @throws std::invalid_argument for anything but a JSON object.
json::object ParseParams(std::string_view text);

// The line printed once a waiter reached its success state.
std::string WaiterSuccessLine(std::string_view waiter);

}  // namespace courier::app
