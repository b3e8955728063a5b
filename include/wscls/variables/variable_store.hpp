#pragma once

#include "wscls/error.hpp"

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace wscls {

/// Ordered name → value mapping (ordered so listings and saved files are stable)
using VariableMap = std::map<std::string, std::string, std::less<>>;

/// Context name → that context's variables
using ContextMap = std::map<std::string, VariableMap, std::less<>>;

// ─────────────────────────────────────────────────────────────────────────────
// IVariableSource
// ─────────────────────────────────────────────────────────────────────────────
// Read side used by TemplateResolver.

class IVariableSource {
public:
    virtual ~IVariableSource() = default;

    /// Look up `name`, preferring the mapping of `context` when one is given.
    /// Returns nullopt when neither the context nor the global scope has it.
    [[nodiscard]] virtual std::optional<std::string> resolve(
        const std::optional<std::string>& context,
        std::string_view name
    ) const = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// VariableStore
// ─────────────────────────────────────────────────────────────────────────────
// Global variables plus named contexts layered over them. A context may omit a
// global name (inherits it) or override it (context wins).
//
// Thread-safe: lookups take a shared lock, mutations an exclusive one, so a
// reader never sees a half-written entry.

class VariableStore final : public IVariableSource {
public:
    VariableStore() = default;

    VariableStore(const VariableStore&) = delete;
    VariableStore& operator=(const VariableStore&) = delete;

    [[nodiscard]] std::optional<std::string> resolve(
        const std::optional<std::string>& context,
        std::string_view name
    ) const override;

    // ─────────────────────────────────────────────────────────────────────────
    // Mutation
    // ─────────────────────────────────────────────────────────────────────────

    /// Set a global variable. Fails with InvalidArgument on an empty name.
    [[nodiscard]] Result<void> set_global(std::string name, std::string value);

    /// Set a variable inside `context`, creating the context if needed.
    /// Fails with InvalidArgument on an empty context or variable name.
    [[nodiscard]] Result<void> set_context(std::string context, std::string name, std::string value);

    /// Remove a context and its mapping. Returns false if it did not exist.
    bool delete_context(std::string_view context);

    bool remove_global(std::string_view name);
    bool remove_context_variable(std::string_view context, std::string_view name);

    void clear();

    /// Swap in a complete set of variables. All names are checked first; on
    /// InvalidArgument the store is left as it was.
    [[nodiscard]] Result<void> replace_all(VariableMap globals, ContextMap contexts);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries (snapshots)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] bool has_context(std::string_view context) const;
    [[nodiscard]] std::vector<std::string> context_names() const;
    [[nodiscard]] VariableMap globals() const;
    [[nodiscard]] std::optional<VariableMap> context(std::string_view context) const;

private:
    mutable std::shared_mutex mutex_;
    VariableMap global_;
    ContextMap contexts_;
};

}  // namespace wscls
