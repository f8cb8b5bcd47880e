#pragma once

#include <string>
#include <unordered_set>
#include <vector>

#include "kiln/di/exceptions.hpp"

namespace kiln::di {

/**
 * @brief Entries currently being resolved, for circular dependency detection
 */
class ResolutionContext {
public:
    void push_resolution(const std::string& id) {
        if (resolution_stack_.count(id)) {
            throw DependencyError(
                "Circular dependency detected while trying to resolve entry '" +
                id + "' (" + render_chain(id) + ")");
        }
        resolution_stack_.insert(id);
        resolution_order_.push_back(id);
    }

    void pop_resolution(const std::string& id) {
        resolution_stack_.erase(id);
        if (!resolution_order_.empty() && resolution_order_.back() == id) {
            resolution_order_.pop_back();
        }
    }

private:
    std::string render_chain(const std::string& id) const {
        std::string chain;
        for (const auto& entry : resolution_order_) {
            chain += entry + " -> ";
        }
        return chain + id;
    }

    std::unordered_set<std::string> resolution_stack_;
    std::vector<std::string> resolution_order_;
};

/**
 * @brief RAII guard for dependency resolution tracking
 */
class ResolutionGuard {
public:
    ResolutionGuard(ResolutionContext& ctx, std::string id)
        : context_(ctx), id_(std::move(id)) {
        context_.push_resolution(id_);
    }

    ~ResolutionGuard() { context_.pop_resolution(id_); }

    ResolutionGuard(const ResolutionGuard&) = delete;
    ResolutionGuard& operator=(const ResolutionGuard&) = delete;

private:
    ResolutionContext& context_;
    std::string id_;
};

}  // namespace kiln::di
