#include <catch2/catch_test_macros.hpp>

#include "wscls/config/profile_store.hpp"
#include "mocks/test_logger.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace wscls;
using wscls::testing::ScopedTestLogger;

namespace {

std::filesystem::path temp_profile_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / name;
}

void write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// ProfileStore
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ProfileStore starts with the default profile selected", "[profile]") {
    ProfileStore store;

    REQUIRE(store.size() == 1);
    REQUIRE(store.selected_name() == "default");
    REQUIRE(store.contains("default"));
    REQUIRE(store.selected().connection.endpoint.empty());
}

TEST_CASE("ProfileStore adds, replaces and lists profiles in insertion order", "[profile]") {
    ProfileStore store;

    Profile prod;
    prod.connection.with_endpoint("wss://api.example.com/feed");
    REQUIRE(store.add("prod", prod).has_value());
    REQUIRE(store.add("staging").has_value());

    const std::vector<std::string> expected{"default", "prod", "staging"};
    REQUIRE(store.names() == expected);

    Profile replacement;
    replacement.connection.with_endpoint("wss://api2.example.com/feed");
    REQUIRE(store.add("prod", replacement).has_value());

    REQUIRE(store.size() == 3);
    REQUIRE(store.find("prod")->connection.endpoint == "wss://api2.example.com/feed");
}

TEST_CASE("ProfileStore rejects empty names and unknown selections", "[profile][error]") {
    ProfileStore store;

    auto added = store.add("");
    REQUIRE_FALSE(added.has_value());
    REQUIRE(added.error().code == ErrorCode::InvalidArgument);

    auto selected = store.select("missing");
    REQUIRE_FALSE(selected.has_value());
    REQUIRE(selected.error().code == ErrorCode::InvalidArgument);
    REQUIRE(store.selected_name() == "default");
}

TEST_CASE("ProfileStore removal keeps a valid selection", "[profile]") {
    ProfileStore store;
    REQUIRE(store.add("prod").has_value());
    REQUIRE(store.add("staging").has_value());
    REQUIRE(store.select("staging").has_value());

    SECTION("removing the selected profile selects the first remaining") {
        REQUIRE(store.remove("staging"));
        REQUIRE(store.selected_name() == "default");
    }

    SECTION("removing another profile keeps the selection") {
        REQUIRE(store.remove("prod"));
        REQUIRE(store.selected_name() == "staging");
    }

    SECTION("removing an unknown profile does nothing") {
        REQUIRE(store.remove("missing") == false);
        REQUIRE(store.size() == 3);
    }
}

TEST_CASE("ProfileStore recreates default when the last profile is removed", "[profile]") {
    ProfileStore store;
    REQUIRE(store.add("only").has_value());
    REQUIRE(store.remove("default"));
    REQUIRE(store.selected_name() == "only");

    REQUIRE(store.remove("only"));

    REQUIRE(store.size() == 1);
    REQUIRE(store.selected_name() == "default");
}

// ═══════════════════════════════════════════════════════════════════════════
// Profile JSON
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Profile serializes every field", "[profile][json]") {
    Profile profile;
    profile.connection
        .with_endpoint("wss://$host/feed")
        .with_header("Authorization", "Bearer $token")
        .with_auto_ping(true)
        .with_auto_reconnect(false)
        .with_ssl_verify(false)
        .with_url_templating(true);
    profile.draft_text = "{\"op\":\"subscribe\"}";

    const Json j = profile.to_json();

    REQUIRE(j["url"] == "wss://$host/feed");
    REQUIRE(j["headers"] == Json::array({Json::array({"Authorization", "Bearer $token"})}));
    REQUIRE(j["autoping"] == true);
    REQUIRE(j["auto_reconnect"] == false);
    REQUIRE(j["ssl_check"] == false);
    REQUIRE(j["text"] == "{\"op\":\"subscribe\"}");
    REQUIRE(j["use_template_for_url"] == true);
    REQUIRE(j["use_template_for_data"] == false);

    auto parsed = Profile::from_json(j);
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->connection.endpoint == "wss://$host/feed");
    REQUIRE(parsed->connection.headers == profile.connection.headers);
    REQUIRE(parsed->connection.auto_ping);
    REQUIRE(parsed->connection.auto_reconnect == false);
    REQUIRE(parsed->draft_text == profile.draft_text);
}

TEST_CASE("Profile from_json fills defaults for missing keys", "[profile][json]") {
    auto parsed = Profile::from_json(Json{{"url", "ws://localhost:9000"}});

    REQUIRE(parsed.has_value());
    REQUIRE(parsed->connection.endpoint == "ws://localhost:9000");
    REQUIRE(parsed->connection.headers.empty());
    REQUIRE(parsed->connection.ssl_verify);
    REQUIRE(parsed->connection.auto_reconnect);
    REQUIRE(parsed->connection.auto_ping == false);
    REQUIRE(parsed->draft_text.empty());
}

TEST_CASE("Profile from_json accepts headers as an object", "[profile][json]") {
    auto parsed = Profile::from_json(Json::parse(R"({"headers": {"X-Api-Key": "abc"}})"));

    REQUIRE(parsed.has_value());
    REQUIRE(parsed->connection.headers.size() == 1);
    REQUIRE(parsed->connection.headers[0] == Header{"X-Api-Key", "abc"});
}

TEST_CASE("Profile from_json rejects wrong types", "[profile][json][error]") {
    SECTION("non-object profile") {
        auto parsed = Profile::from_json(Json::array());
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::ConfigError);
    }

    SECTION("boolean given as string") {
        auto parsed = Profile::from_json(Json{{"autoping", "yes"}});
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().message.find("autoping") != std::string::npos);
    }

    SECTION("malformed header pair") {
        auto parsed = Profile::from_json(Json::parse(R"({"headers": [["only-name"]]})"));
        REQUIRE_FALSE(parsed.has_value());
        REQUIRE(parsed.error().code == ErrorCode::ConfigError);
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Workspace JSON
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Workspace loads profiles, variables and the active context", "[profile][workspace]") {
    const Json j = Json::parse(R"({
        "configurations": {
            "prod": {"url": "wss://$host/feed", "use_template_for_url": true},
            "local": {"url": "ws://localhost:9000"}
        },
        "selected_configuration": "local",
        "variables": {
            "global": {"host": "localhost"},
            "contexts": {"prod": {"host": "api.example.com"}}
        },
        "active_context": "prod"
    })");

    Workspace workspace;
    REQUIRE(workspace_from_json(j, workspace).has_value());

    const std::vector<std::string> expected{"prod", "local"};
    REQUIRE(workspace.profiles.names() == expected);
    REQUIRE(workspace.profiles.selected_name() == "local");
    REQUIRE(workspace.variables->resolve(std::nullopt, "host") == "localhost");
    REQUIRE(workspace.variables->resolve("prod", "host") == "api.example.com");
    REQUIRE(workspace.active_context == "prod");
}

TEST_CASE("Workspace falls back when the selection is unknown", "[profile][workspace]") {
    ScopedTestLogger logger;
    const Json j = Json::parse(R"({
        "configurations": {"a": {}, "b": {}},
        "selected_configuration": "zzz"
    })");

    Workspace workspace;
    REQUIRE(workspace_from_json(j, workspace).has_value());

    REQUIRE(workspace.profiles.selected_name() == "a");
    REQUIRE(logger->contains(LogLevel::Warn, "zzz"));
}

TEST_CASE("Workspace treats null or missing active context as global", "[profile][workspace]") {
    Workspace workspace;
    workspace.active_context = "stale";

    REQUIRE(workspace_from_json(Json::parse(R"({"active_context": null})"), workspace).has_value());

    REQUIRE(workspace.active_context.has_value() == false);
    REQUIRE(workspace.profiles.selected_name() == "default");
}

TEST_CASE("Workspace leaves state untouched on a bad document", "[profile][workspace][error]") {
    Workspace workspace;
    REQUIRE(workspace.variables->set_global("keep", "me").has_value());

    const Json j = Json::parse(R"({
        "configurations": {"a": {"url": "ws://a"}},
        "variables": {"global": {"n": 5}}
    })");

    auto loaded = workspace_from_json(j, workspace);

    REQUIRE_FALSE(loaded.has_value());
    REQUIRE(loaded.error().code == ErrorCode::ConfigError);
    REQUIRE(workspace.variables->resolve(std::nullopt, "keep") == "me");
    REQUIRE(workspace.profiles.contains("a") == false);
}

TEST_CASE("Workspace rejects empty variable names without losing variables", "[profile][workspace][error]") {
    Workspace workspace;
    REQUIRE(workspace.variables->set_global("host", "keep.example").has_value());
    REQUIRE(workspace.variables->set_context("prod", "host", "prod.example").has_value());
    workspace.active_context = "prod";

    Json j;
    SECTION("empty global name") {
        j = Json::parse(R"({"variables": {"global": {"ok": "1", "": "bad"}}})");
    }
    SECTION("empty context name") {
        j = Json::parse(R"({"variables": {"contexts": {"": {"a": "b"}}}})");
    }
    SECTION("empty name inside a context") {
        j = Json::parse(R"({"variables": {"contexts": {"qa": {"": "x"}}}})");
    }

    auto loaded = workspace_from_json(j, workspace);

    REQUIRE_FALSE(loaded.has_value());
    REQUIRE(loaded.error().code == ErrorCode::ConfigError);
    REQUIRE(loaded.error().message.find("empty name") != std::string::npos);
    REQUIRE(workspace.variables->resolve(std::nullopt, "host") == "keep.example");
    REQUIRE(workspace.variables->resolve("prod", "host") == "prod.example");
    REQUIRE(workspace.variables->resolve(std::nullopt, "ok").has_value() == false);
    REQUIRE(workspace.active_context == "prod");
}

TEST_CASE("Workspace serializes to the profile file layout", "[profile][workspace]") {
    Workspace workspace;
    Profile prod;
    prod.connection.with_endpoint("wss://api.example.com");
    REQUIRE(workspace.profiles.add("prod", prod).has_value());
    REQUIRE(workspace.profiles.select("prod").has_value());
    REQUIRE(workspace.variables->set_global("host", "localhost").has_value());
    REQUIRE(workspace.variables->set_context("prod", "host", "api.example.com").has_value());

    const Json j = workspace_to_json(workspace);

    REQUIRE(j["selected_configuration"] == "prod");
    REQUIRE(j["configurations"].size() == 2);
    REQUIRE(j["configurations"]["prod"]["url"] == "wss://api.example.com");
    REQUIRE(j["variables"]["global"]["host"] == "localhost");
    REQUIRE(j["variables"]["contexts"]["prod"]["host"] == "api.example.com");
    REQUIRE(j["active_context"].is_null());
}

// ═══════════════════════════════════════════════════════════════════════════
// Profile file
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("load_workspace reports a missing file without failing", "[profile][file]") {
    const auto path = temp_profile_path("wscls_missing_profile.json");
    std::filesystem::remove(path);

    Workspace workspace;
    auto loaded = load_workspace(path, workspace);

    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == false);
    REQUIRE(workspace.profiles.size() == 1);
}

TEST_CASE("load_workspace rejects invalid JSON", "[profile][file][error]") {
    const auto path = temp_profile_path("wscls_invalid_profile.json");
    write_file(path, "{ not json");

    Workspace workspace;
    auto loaded = load_workspace(path, workspace);

    REQUIRE_FALSE(loaded.has_value());
    REQUIRE(loaded.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(path);
}

TEST_CASE("save_workspace and load_workspace preserve the workspace", "[profile][file]") {
    const auto path = temp_profile_path("wscls_saved_profile.json");
    std::filesystem::remove(path);

    Workspace original;
    Profile feed;
    feed.connection
        .with_endpoint("wss://$host/feed")
        .with_header("Authorization", "Bearer $token")
        .with_url_templating(true);
    feed.draft_text = "ping";
    REQUIRE(original.profiles.add("feed", feed).has_value());
    REQUIRE(original.profiles.select("feed").has_value());
    REQUIRE(original.variables->set_global("host", "localhost").has_value());
    REQUIRE(original.variables->set_context("prod", "token", "abc").has_value());
    original.active_context = "prod";

    REQUIRE(save_workspace(path, original).has_value());

    Workspace restored;
    auto loaded = load_workspace(path, restored);
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded);

    REQUIRE(restored.profiles.names() == original.profiles.names());
    REQUIRE(restored.profiles.selected_name() == "feed");
    REQUIRE(restored.profiles.selected().connection.headers == feed.connection.headers);
    REQUIRE(restored.profiles.selected().draft_text == "ping");
    REQUIRE(restored.variables->resolve("prod", "token") == "abc");
    REQUIRE(restored.active_context == "prod");

    std::filesystem::remove(path);
}
