#include "wscls/config/profile_store.hpp"
#include "wscls/log/logger.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <map>
#include <system_error>

namespace wscls {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Field helpers
// ─────────────────────────────────────────────────────────────────────────────

Result<bool> read_bool(const Json& j, const char* key, bool fallback) {
    if (j.contains(key) == false) {
        return fallback;
    }
    const auto& node = j.at(key);
    if (node.is_boolean() == false) {
        return tl::unexpected(Error::config_error(std::string("'") + key + "' must be a boolean"));
    }
    return node.get<bool>();
}

Result<std::string> read_string(const Json& j, const char* key) {
    if (j.contains(key) == false) {
        return std::string{};
    }
    const auto& node = j.at(key);
    if (node.is_string() == false) {
        return tl::unexpected(Error::config_error(std::string("'") + key + "' must be a string"));
    }
    return node.get<std::string>();
}

// Accepts [["name", "value"], ...] or {"name": "value", ...}
Result<HeaderList> read_headers(const Json& j) {
    HeaderList headers;
    if (j.contains("headers") == false) {
        return headers;
    }

    const auto& node = j.at("headers");
    if (node.is_object()) {
        for (const auto& [name, value] : node.items()) {
            if (value.is_string() == false) {
                return tl::unexpected(Error::config_error("Header '" + name + "' must have a string value"));
            }
            headers.push_back(Header{name, value.get<std::string>()});
        }
        return headers;
    }

    if (node.is_array() == false) {
        return tl::unexpected(Error::config_error("'headers' must be an array or object"));
    }

    for (const auto& pair : node) {
        const bool well_formed = pair.is_array() && (pair.size() == 2) &&
                                 pair[0].is_string() && pair[1].is_string();
        if (well_formed == false) {
            return tl::unexpected(Error::config_error("Each header must be a [name, value] pair of strings"));
        }
        headers.push_back(Header{pair[0].get<std::string>(), pair[1].get<std::string>()});
    }
    return headers;
}

Result<VariableMap> read_variable_map(const Json& node, const std::string& where) {
    if (node.is_object() == false) {
        return tl::unexpected(Error::config_error(where + " must be an object"));
    }
    VariableMap out;
    for (const auto& [name, value] : node.items()) {
        if (name.empty()) {
            return tl::unexpected(Error::config_error(where + " has a variable with an empty name"));
        }
        if (value.is_string() == false) {
            return tl::unexpected(Error::config_error(where + "." + name + " must be a string"));
        }
        out.emplace(name, value.get<std::string>());
    }
    return out;
}

Json variable_map_to_json(const VariableMap& map) {
    Json j = Json::object();
    for (const auto& [name, value] : map) {
        j[name] = value;
    }
    return j;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Profile
// ═══════════════════════════════════════════════════════════════════════════

Json Profile::to_json() const {
    Json headers = Json::array();
    for (const auto& header : connection.headers) {
        headers.push_back(Json::array({header.name, header.value}));
    }

    return Json{
        {"url", connection.endpoint},
        {"headers", std::move(headers)},
        {"autoping", connection.auto_ping},
        {"auto_reconnect", connection.auto_reconnect},
        {"ssl_check", connection.ssl_verify},
        {"text", draft_text},
        {"use_template_for_url", connection.use_template_for_url},
        {"use_template_for_data", connection.use_template_for_data}
    };
}

Result<Profile> Profile::from_json(const Json& j) {
    if (j.is_object() == false) {
        return tl::unexpected(Error::config_error("Profile must be an object"));
    }

    Profile profile;
    auto& connection = profile.connection;

    auto url = read_string(j, "url");
    if (url.has_value() == false) {
        return tl::unexpected(url.error());
    }
    connection.endpoint = std::move(*url);

    auto text = read_string(j, "text");
    if (text.has_value() == false) {
        return tl::unexpected(text.error());
    }
    profile.draft_text = std::move(*text);

    auto headers = read_headers(j);
    if (headers.has_value() == false) {
        return tl::unexpected(headers.error());
    }
    connection.headers = std::move(*headers);

    struct Flag {
        const char* key;
        bool* target;
    };
    const Flag flags[] = {
        {"autoping", &connection.auto_ping},
        {"auto_reconnect", &connection.auto_reconnect},
        {"ssl_check", &connection.ssl_verify},
        {"use_template_for_url", &connection.use_template_for_url},
        {"use_template_for_data", &connection.use_template_for_data},
    };
    for (const auto& flag : flags) {
        auto value = read_bool(j, flag.key, *flag.target);
        if (value.has_value() == false) {
            return tl::unexpected(value.error());
        }
        *flag.target = *value;
    }

    return profile;
}

// ═══════════════════════════════════════════════════════════════════════════
// ProfileStore
// ═══════════════════════════════════════════════════════════════════════════

ProfileStore::ProfileStore()
    : entries_{Entry{std::string(kDefaultName), Profile{}}}
    , selected_(kDefaultName)
{}

Result<void> ProfileStore::add(std::string name, Profile profile) {
    if (name.empty()) {
        return tl::unexpected(Error::invalid_argument("Profile name must not be empty"));
    }

    if (auto* existing = find(name)) {
        *existing = std::move(profile);
        return {};
    }

    entries_.push_back(Entry{std::move(name), std::move(profile)});
    return {};
}

bool ProfileStore::remove(std::string_view name) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [name](const Entry& entry) { return entry.name == name; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);

    if (entries_.empty()) {
        entries_.push_back(Entry{std::string(kDefaultName), Profile{}});
    }

    const bool removed_selected = (selected_ == name) || (contains(selected_) == false);
    if (removed_selected) {
        selected_ = entries_.front().name;
    }
    return true;
}

Result<void> ProfileStore::select(std::string_view name) {
    if (contains(name) == false) {
        return tl::unexpected(Error::invalid_argument("No profile named '" + std::string(name) + "'"));
    }
    selected_ = std::string(name);
    return {};
}

const std::string& ProfileStore::selected_name() const noexcept {
    return selected_;
}

Profile& ProfileStore::selected() {
    if (auto* profile = find(selected_)) {
        return *profile;
    }
    // Selection can only dangle after a bad load; fall back like remove() does
    selected_ = entries_.front().name;
    return entries_.front().profile;
}

const Profile& ProfileStore::selected() const {
    if (const auto* profile = find(selected_)) {
        return *profile;
    }
    return entries_.front().profile;
}

Profile* ProfileStore::find(std::string_view name) {
    for (auto& entry : entries_) {
        if (entry.name == name) {
            return &entry.profile;
        }
    }
    return nullptr;
}

const Profile* ProfileStore::find(std::string_view name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return &entry.profile;
        }
    }
    return nullptr;
}

bool ProfileStore::contains(std::string_view name) const {
    return find(name) != nullptr;
}

std::vector<std::string> ProfileStore::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.name);
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Profile File
// ═══════════════════════════════════════════════════════════════════════════

std::filesystem::path default_profile_path() {
    const char* home = std::getenv("HOME");
    const bool has_home = (home != nullptr) && (home[0] != '\0');
    if (has_home == false) {
        return std::filesystem::path(".wscls.json");
    }
    return std::filesystem::path(home) / ".wscls.json";
}

Result<void> workspace_from_json(const Json& j, Workspace& workspace) {
    if (j.is_object() == false) {
        return tl::unexpected(Error::config_error("Profile file must contain a JSON object"));
    }

    // Parse everything first so a bad file leaves the workspace untouched
    ProfileStore profiles;
    if (j.contains("configurations")) {
        const auto& configurations = j.at("configurations");
        if (configurations.is_object() == false) {
            return tl::unexpected(Error::config_error("'configurations' must be an object"));
        }

        bool replaced_default = false;
        for (const auto& [name, node] : configurations.items()) {
            auto profile = Profile::from_json(node);
            if (profile.has_value() == false) {
                return tl::unexpected(Error::config_error(
                    "Profile '" + name + "': " + profile.error().message));
            }
            auto added = profiles.add(name, std::move(*profile));
            if (added.has_value() == false) {
                return tl::unexpected(Error::config_error(added.error().message));
            }
            replaced_default = replaced_default || (name == ProfileStore::kDefaultName);
        }

        // The built-in default only exists to keep the store non-empty
        const bool drop_builtin_default = (replaced_default == false) && (profiles.size() > 1);
        if (drop_builtin_default) {
            profiles.remove(ProfileStore::kDefaultName);
        }
    }

    auto selected = read_string(j, "selected_configuration");
    if (selected.has_value() == false) {
        return tl::unexpected(selected.error());
    }
    auto selection = profiles.select(*selected);
    if (selection.has_value() == false) {
        const std::string fallback = profiles.names().front();
        if (selected->empty() == false) {
            get_logger().warn_fmt("Selected profile '{}' not found, using '{}'", *selected, fallback);
        }
        selection = profiles.select(fallback);
    }

    VariableMap globals;
    ContextMap contexts;
    if (j.contains("variables")) {
        const auto& variables = j.at("variables");
        if (variables.is_object() == false) {
            return tl::unexpected(Error::config_error("'variables' must be an object"));
        }
        if (variables.contains("global")) {
            auto parsed = read_variable_map(variables.at("global"), "variables.global");
            if (parsed.has_value() == false) {
                return tl::unexpected(parsed.error());
            }
            globals = std::move(*parsed);
        }
        if (variables.contains("contexts")) {
            const auto& node = variables.at("contexts");
            if (node.is_object() == false) {
                return tl::unexpected(Error::config_error("variables.contexts must be an object"));
            }
            for (const auto& [context, mapping] : node.items()) {
                if (context.empty()) {
                    return tl::unexpected(Error::config_error("variables.contexts has a context with an empty name"));
                }
                auto parsed = read_variable_map(mapping, "variables.contexts." + context);
                if (parsed.has_value() == false) {
                    return tl::unexpected(parsed.error());
                }
                contexts.emplace(context, std::move(*parsed));
            }
        }
    }

    std::optional<std::string> active_context;
    if (j.contains("active_context") && (j.at("active_context").is_null() == false)) {
        auto context = read_string(j, "active_context");
        if (context.has_value() == false) {
            return tl::unexpected(context.error());
        }
        if (context->empty() == false) {
            active_context = std::move(*context);
        }
    }

    // Commit; replace_all is the only step that can fail and it changes
    // nothing when it does
    auto replaced = workspace.variables->replace_all(std::move(globals), std::move(contexts));
    if (replaced.has_value() == false) {
        return tl::unexpected(Error::config_error(replaced.error().message));
    }
    workspace.profiles = std::move(profiles);
    workspace.active_context = std::move(active_context);
    return {};
}

Json workspace_to_json(const Workspace& workspace) {
    Json configurations = Json::object();
    for (const auto& name : workspace.profiles.names()) {
        configurations[name] = workspace.profiles.find(name)->to_json();
    }

    Json contexts = Json::object();
    for (const auto& context : workspace.variables->context_names()) {
        contexts[context] = variable_map_to_json(workspace.variables->context(context).value_or(VariableMap{}));
    }

    Json j{
        {"configurations", std::move(configurations)},
        {"selected_configuration", workspace.profiles.selected_name()},
        {"variables", Json{
            {"global", variable_map_to_json(workspace.variables->globals())},
            {"contexts", std::move(contexts)}
        }}
    };

    if (workspace.active_context.has_value()) {
        j["active_context"] = *workspace.active_context;
    } else {
        j["active_context"] = nullptr;
    }
    return j;
}

Result<bool> load_workspace(const std::filesystem::path& path, Workspace& workspace) {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (exists == false) {
        get_logger().debug_fmt("No profile file at {}", path.string());
        return false;
    }

    std::ifstream in(path);
    if (in.is_open() == false) {
        return tl::unexpected(Error::config_error("Cannot open " + path.string()));
    }

    Json j = Json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return tl::unexpected(Error::config_error(path.string() + " is not valid JSON"));
    }

    auto loaded = workspace_from_json(j, workspace);
    if (loaded.has_value() == false) {
        return tl::unexpected(Error::config_error(path.string() + ": " + loaded.error().message));
    }

    get_logger().info_fmt("Loaded {} profile(s) from {}", workspace.profiles.size(), path.string());
    return true;
}

Result<void> save_workspace(const std::filesystem::path& path, const Workspace& workspace) {
    const Json j = workspace_to_json(workspace);

    std::ofstream out(path, std::ios::trunc);
    if (out.is_open() == false) {
        return tl::unexpected(Error::config_error("Cannot write " + path.string()));
    }

    out << j.dump(2) << '\n';
    if (out.good() == false) {
        return tl::unexpected(Error::config_error("Failed while writing " + path.string()));
    }

    get_logger().debug_fmt("Saved workspace to {}", path.string());
    return {};
}

}  // namespace wscls
