#include "registry.hpp"

#include "localization.hpp"
#include "managers/factory.hpp"

#include <algorithm>

void ManagerRegistry::add(ManagerPtr manager, bool enabled) {
    if (!manager) {
        throw SysupException(get_string("error.null_manager"));
    }
    if (contains(manager->id())) {
        throw SysupException(string_format("error.duplicate_manager", manager->id()));
    }
    entries_.push_back({std::move(manager), enabled});
}

const ManagerRegistry::Entry* ManagerRegistry::find(const std::string& id) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const Entry& e) { return e.manager->id() == id; });
    return it == entries_.end() ? nullptr : &*it;
}

bool ManagerRegistry::contains(const std::string& id) const {
    return find(id) != nullptr;
}

Manager& ManagerRegistry::get(const std::string& id) const {
    const Entry* entry = find(id);
    if (!entry) {
        throw NotFoundError(string_format("error.unknown_manager", id));
    }
    return *entry->manager;
}

bool ManagerRegistry::is_enabled(const std::string& id) const {
    const Entry* entry = find(id);
    return entry && entry->enabled;
}

std::vector<Manager*> ManagerRegistry::all() const {
    std::vector<Manager*> managers;
    for (const auto& entry : entries_) managers.push_back(entry.manager.get());
    return managers;
}

std::vector<Manager*> ManagerRegistry::enabled_managers() const {
    std::vector<Manager*> managers;
    for (const auto& entry : entries_) {
        if (entry.enabled) managers.push_back(entry.manager.get());
    }
    return managers;
}

std::vector<Manager*> ManagerRegistry::select(const std::vector<std::string>& ids) const {
    for (const auto& id : ids) {
        if (!contains(id)) {
            throw NotFoundError(string_format("error.unknown_manager", id));
        }
    }
    std::vector<Manager*> managers;
    for (const auto& entry : entries_) {
        if (std::find(ids.begin(), ids.end(), entry.manager->id()) != ids.end()) {
            managers.push_back(entry.manager.get());
        }
    }
    return managers;
}

ManagerRegistry build_registry(const Config& config, Executor& executor, Logger& logger, bool interactive) {
    ManagerRegistry registry;
    auto context_for = [&](const std::string& id) {
        ManagerConfig mc = config.manager(id);
        mc.id = id;
        return ManagerContext{executor, logger, std::move(mc), interactive};
    };

    for (const auto& id : config.managers) {
        registry.add(create_manager(id, context_for(id)), config.is_enabled(id));
    }
    for (const auto& id : known_manager_ids()) {
        if (!registry.contains(id)) {
            registry.add(create_manager(id, context_for(id)), false);
        }
    }
    return registry;
}
