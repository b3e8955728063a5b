#pragma once

#include "wscls/variables/variable_store.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wscls {

/// Output of a render pass together with the placeholders left untouched.
struct RenderResult {
    std::string text;
    std::vector<std::string> unresolved;  // In order of appearance, may repeat
};

/// Substitutes `$name` and `${name}` placeholders.
///
/// Syntax:
///   $$        literal '$', no lookup
///   $name     longest run of [A-Za-z0-9_] after '$'
///   ${name}   everything up to the first '}' (no nesting)
///
/// Unknown names are left in the output exactly as written so partially
/// configured templates stay visible. Substituted values are not rescanned.
///
/// Usage:
///   TemplateResolver resolver(store);
///   auto url = resolver.render("ws://$host/u/${user}", "prod");
///
class TemplateResolver {
public:
    explicit TemplateResolver(const IVariableSource& variables)
        : variables_(variables)
    {}

    [[nodiscard]] std::string render(
        std::string_view text,
        const std::optional<std::string>& context = std::nullopt
    ) const;

    [[nodiscard]] RenderResult render_detailed(
        std::string_view text,
        const std::optional<std::string>& context = std::nullopt
    ) const;

    /// True if `text` contains at least one '$'.
    [[nodiscard]] static bool may_contain_placeholders(std::string_view text) noexcept {
        return text.find('$') != std::string_view::npos;
    }

private:
    const IVariableSource& variables_;
};

}  // namespace wscls
