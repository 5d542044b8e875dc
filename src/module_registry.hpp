/*
 * module_registry.hpp - Registered analysis modules
 *
 * The set of available modules is fixed at startup from builtin_modules();
 * there is no directory scanning or plugin loading. Registration order is
 * also execution order.
 */

#pragma once

#include "analysis_module.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

class ModuleRegistry {
public:
    ModuleRegistry() = default;

    // Non-copyable
    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    // Returns false (and drops the module) if the name is already taken
    bool register_module(std::unique_ptr<AnalysisModule> module);

    AnalysisModule* find(const std::string& name) const;
    std::vector<std::string> available_names() const;
    size_t size() const { return modules_.size(); }

    // Modules to run, in registration order. No list means every module;
    // unknown names in the list are ignored.
    std::vector<AnalysisModule*> enabled(
        const std::optional<std::vector<std::string>>& names) const;

private:
    std::vector<std::unique_ptr<AnalysisModule>> modules_;
};

// Every module compiled into the binary
std::vector<std::unique_ptr<AnalysisModule>> builtin_modules();

// Registry populated with builtin_modules()
std::unique_ptr<ModuleRegistry> create_builtin_registry();
