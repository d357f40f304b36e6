#include "Cli.hpp"

#include <stdexcept>
#include <utility>

namespace courier::app {

json::object ParseParams(std::string_view text) {
    if (text.empty()) return {};
    boost::system::error_code ec;
    json::value jv = json::parse(text, ec);
    if (ec || !jv.is_object()) {
        throw std::invalid_argument("Parameters must be a JSON object: " + std::string(text));
    }
    return std::move(jv.get_object());
}

std::string WaiterSuccessLine(std::string_view waiter) {
    json::object line;
    line["waiter"] = json::string(waiter.data(), waiter.size());
    line["state"] = "success";
    return json::serialize(line);
}

}  // namespace courier::app
