/*
 * module_registry.cpp - Static module registration
 */

#include "module_registry.hpp"
#include "logger.hpp"
#include "protocol_stats_module.hpp"
#include <algorithm>

bool ModuleRegistry::register_module(std::unique_ptr<AnalysisModule> module) {
    if (!module) {
        return false;
    }
    if (find(module->name())) {
        logger::warn("module " + module->name() + " already registered");
        return false;
    }
    logger::debug("registered module " + module->name() + " " + module->version());
    modules_.push_back(std::move(module));
    return true;
}

AnalysisModule* ModuleRegistry::find(const std::string& name) const {
    for (const auto& module : modules_) {
        if (module->name() == name) {
            return module.get();
        }
    }
    return nullptr;
}

std::vector<std::string> ModuleRegistry::available_names() const {
    std::vector<std::string> names;
    for (const auto& module : modules_) {
        names.push_back(module->name());
    }
    return names;
}

std::vector<AnalysisModule*> ModuleRegistry::enabled(
        const std::optional<std::vector<std::string>>& names) const {
    std::vector<AnalysisModule*> result;
    for (const auto& module : modules_) {
        if (!names || std::find(names->begin(), names->end(), module->name()) != names->end()) {
            result.push_back(module.get());
        }
    }
    return result;
}

std::vector<std::unique_ptr<AnalysisModule>> builtin_modules() {
    std::vector<std::unique_ptr<AnalysisModule>> modules;
    modules.push_back(std::make_unique<ProtocolStatsModule>());
    return modules;
}

std::unique_ptr<ModuleRegistry> create_builtin_registry() {
    auto registry = std::make_unique<ModuleRegistry>();
    for (auto& module : builtin_modules()) {
        registry->register_module(std::move(module));
    }
    return registry;
}
