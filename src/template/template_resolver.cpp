#include "wscls/template/template_resolver.hpp"

namespace wscls {

namespace {

[[nodiscard]] constexpr bool is_identifier_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') ||
           (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') ||
           (c == '_');
}

}  // namespace

std::string TemplateResolver::render(
    std::string_view text,
    const std::optional<std::string>& context
) const {
    return render_detailed(text, context).text;
}

RenderResult TemplateResolver::render_detailed(
    std::string_view text,
    const std::optional<std::string>& context
) const {
    RenderResult result;

    if (!may_contain_placeholders(text)) {
        result.text.assign(text);
        return result;
    }

    result.text.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t dollar = text.find('$', pos);
        if (dollar == std::string_view::npos) {
            result.text.append(text.substr(pos));
            break;
        }

        result.text.append(text.substr(pos, dollar - pos));
        const std::size_t after = dollar + 1;

        // "$" at end of input
        if (after >= text.size()) {
            result.text.push_back('$');
            break;
        }

        // "$$" escape
        if (text[after] == '$') {
            result.text.push_back('$');
            pos = after + 1;
            continue;
        }

        std::string_view name;
        std::size_t end = after;

        if (text[after] == '{') {
            const std::size_t close = text.find('}', after + 1);
            const bool unterminated = (close == std::string_view::npos);
            if (unterminated || close == after + 1) {
                // "${" without "}" or "${}": copy the '$' and keep scanning
                result.text.push_back('$');
                pos = after;
                continue;
            }
            name = text.substr(after + 1, close - after - 1);
            end = close + 1;
        } else {
            while (end < text.size() && is_identifier_char(text[end])) {
                ++end;
            }
            if (end == after) {
                result.text.push_back('$');
                pos = after;
                continue;
            }
            name = text.substr(after, end - after);
        }

        auto value = variables_.resolve(context, name);
        if (value.has_value()) {
            result.text.append(*value);
        } else {
            result.text.append(text.substr(dollar, end - dollar));
            result.unresolved.emplace_back(name);
        }
        pos = end;
    }

    return result;
}

}  // namespace wscls
