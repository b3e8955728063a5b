#include "wscls/variables/variable_store.hpp"

#include <mutex>

namespace wscls {

// ─────────────────────────────────────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::string> VariableStore::resolve(
    const std::optional<std::string>& context,
    std::string_view name
) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    const bool has_context_name = context.has_value();
    if (has_context_name) {
        const auto ctx = contexts_.find(*context);
        if (ctx != contexts_.end()) {
            const auto value = ctx->second.find(name);
            if (value != ctx->second.end()) {
                return value->second;
            }
        }
    }

    const auto value = global_.find(name);
    if (value != global_.end()) {
        return value->second;
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// Mutation
// ─────────────────────────────────────────────────────────────────────────────

Result<void> VariableStore::set_global(std::string name, std::string value) {
    if (name.empty()) {
        return tl::unexpected(Error::invalid_argument("Variable name must not be empty"));
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    global_.insert_or_assign(std::move(name), std::move(value));
    return {};
}

Result<void> VariableStore::set_context(std::string context, std::string name, std::string value) {
    if (context.empty()) {
        return tl::unexpected(Error::invalid_argument("Context name must not be empty"));
    }
    if (name.empty()) {
        return tl::unexpected(Error::invalid_argument("Variable name must not be empty"));
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    contexts_[std::move(context)].insert_or_assign(std::move(name), std::move(value));
    return {};
}

bool VariableStore::delete_context(std::string_view context) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = contexts_.find(context);
    if (it == contexts_.end()) {
        return false;
    }
    contexts_.erase(it);
    return true;
}

bool VariableStore::remove_global(std::string_view name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto it = global_.find(name);
    if (it == global_.end()) {
        return false;
    }
    global_.erase(it);
    return true;
}

bool VariableStore::remove_context_variable(std::string_view context, std::string_view name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const auto ctx = contexts_.find(context);
    if (ctx == contexts_.end()) {
        return false;
    }
    const auto it = ctx->second.find(name);
    if (it == ctx->second.end()) {
        return false;
    }
    ctx->second.erase(it);
    return true;
}

void VariableStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    global_.clear();
    contexts_.clear();
}

Result<void> VariableStore::replace_all(VariableMap globals, ContextMap contexts) {
    if (globals.contains("")) {
        return tl::unexpected(Error::invalid_argument("Variable name must not be empty"));
    }
    for (const auto& [context, mapping] : contexts) {
        if (context.empty()) {
            return tl::unexpected(Error::invalid_argument("Context name must not be empty"));
        }
        if (mapping.contains("")) {
            return tl::unexpected(Error::invalid_argument(
                "Variable name must not be empty (context '" + context + "')"));
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    global_ = std::move(globals);
    contexts_ = std::move(contexts);
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

bool VariableStore::has_context(std::string_view context) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return contexts_.find(context) != contexts_.end();
}

std::vector<std::string> VariableStore::context_names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(contexts_.size());
    for (const auto& [name, _] : contexts_) {
        names.push_back(name);
    }
    return names;
}

VariableMap VariableStore::globals() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return global_;
}

std::optional<VariableMap> VariableStore::context(std::string_view context) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto it = contexts_.find(context);
    if (it == contexts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

}  // namespace wscls
