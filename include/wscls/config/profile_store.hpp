#pragma once

#include "wscls/connection/connection_config.hpp"
#include "wscls/error.hpp"
#include "wscls/variables/variable_store.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wscls {

// Ordered so profiles keep their file order across load/save
using Json = nlohmann::ordered_json;

// ─────────────────────────────────────────────────────────────────────────────
// Profile
// ─────────────────────────────────────────────────────────────────────────────
// A saved connection: what to connect to and the message being drafted.

struct Profile {
    ConnectionConfig connection;
    std::string draft_text;

    [[nodiscard]] Json to_json() const;

    /// Missing keys take their defaults; wrong types are a ConfigError.
    static Result<Profile> from_json(const Json& j);
};

// ─────────────────────────────────────────────────────────────────────────────
// ProfileStore
// ─────────────────────────────────────────────────────────────────────────────
// Named profiles in insertion order, one of them selected. The store is
// never empty: removing the last profile recreates "default".
//
// Not thread-safe; owned by the front end.

class ProfileStore {
public:
    static constexpr std::string_view kDefaultName{"default"};

    ProfileStore();

    /// Insert or replace a profile. Names must be non-empty.
    [[nodiscard]] Result<void> add(std::string name, Profile profile = {});

    /// Returns false if no such profile. Selection moves to the first
    /// remaining profile when the selected one is removed.
    bool remove(std::string_view name);

    [[nodiscard]] Result<void> select(std::string_view name);

    [[nodiscard]] const std::string& selected_name() const noexcept;
    [[nodiscard]] Profile& selected();
    [[nodiscard]] const Profile& selected() const;

    [[nodiscard]] Profile* find(std::string_view name);
    [[nodiscard]] const Profile* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        Profile profile;
    };

    std::vector<Entry> entries_;
    std::string selected_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Profile File
// ═══════════════════════════════════════════════════════════════════════════
// On-disk layout:
//
//   {
//     "configurations": {
//       "default": {
//         "url": "wss://$host/feed",
//         "headers": [["Authorization", "Bearer $token"]],
//         "autoping": false, "auto_reconnect": true, "ssl_check": true,
//         "text": "", "use_template_for_url": true, "use_template_for_data": false
//       }
//     },
//     "selected_configuration": "default",
//     "variables": { "global": {"host": "..."}, "contexts": {"prod": {...}} },
//     "active_context": "prod"
//   }

struct Workspace {
    ProfileStore profiles;
    std::shared_ptr<VariableStore> variables{std::make_shared<VariableStore>()};
    std::optional<std::string> active_context;
};

/// ~/.wscls.json, or ./.wscls.json when HOME is unset
[[nodiscard]] std::filesystem::path default_profile_path();

/// Load into `workspace`. A missing file leaves it untouched and returns
/// false; unreadable or malformed content is a ConfigError.
[[nodiscard]] Result<bool> load_workspace(const std::filesystem::path& path, Workspace& workspace);

[[nodiscard]] Result<void> save_workspace(const std::filesystem::path& path, const Workspace& workspace);

/// Parse/serialize without touching the filesystem
[[nodiscard]] Result<void> workspace_from_json(const Json& j, Workspace& workspace);
[[nodiscard]] Json workspace_to_json(const Workspace& workspace);

}  // namespace wscls
