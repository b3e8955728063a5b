#include "wscls/connection/connection_config.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <string_view>

namespace wscls {

namespace {

bool same_header_name(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

}  // namespace

ConnectionConfig& ConnectionConfig::set_header(std::string name, std::string value) {
    auto matches = [&name](const Header& header) { return same_header_name(header.name, name); };

    auto first = std::find_if(headers.begin(), headers.end(), matches);
    if (first == headers.end()) {
        headers.push_back(Header{std::move(name), std::move(value)});
        return *this;
    }

    first->name = std::move(name);
    first->value = std::move(value);

    const std::string& kept = first->name;
    headers.erase(
        std::remove_if(std::next(first), headers.end(),
                       [&kept](const Header& header) { return same_header_name(header.name, kept); }),
        headers.end());
    return *this;
}

Result<void> validate(const ConnectionConfig& config) {
    if (config.endpoint.empty()) {
        return tl::unexpected(Error::invalid_argument("Endpoint URL is empty"));
    }

    for (const auto& header : config.headers) {
        if (header.name.empty()) {
            return tl::unexpected(Error::invalid_argument("Header name is empty"));
        }
    }

    const bool empty_context = config.active_context.has_value() && config.active_context->empty();
    if (empty_context) {
        return tl::unexpected(Error::invalid_argument("Context name is empty"));
    }

    return {};
}

}  // namespace wscls
