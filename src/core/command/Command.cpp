#include "Command.hpp"

#include <utility>

namespace courier::core {

Command::Command(std::string name, json::object params, CommandOptions options, bool is_async)
    : name_(std::move(name)),
      params_(std::move(params)),
      options_(std::move(options)),
      is_async_(is_async) {}

Command Command::AsAsync() const { return Command(name_, params_, options_, true); }

}  // namespace courier::core
