#pragma once

#include "config.hpp"
#include "manager.hpp"

#include <string>
#include <vector>

struct ManagerListing {
    std::string id;
    std::string display_name;
    bool available = false;
    bool enabled = false;
};

// Managers keyed by id, kept in registration order. That order is the
// execution order of a run.
class ManagerRegistry {
public:
    // Registering the same id twice throws.
    void add(ManagerPtr manager, bool enabled = true);

    bool contains(const std::string& id) const;
    // Throws NotFoundError for an unknown id.
    Manager& get(const std::string& id) const;
    bool is_enabled(const std::string& id) const;

    std::vector<Manager*> all() const;
    std::vector<Manager*> enabled_managers() const;
    // The named managers, in registry order. Any unknown id is a
    // NotFoundError before anything runs.
    std::vector<Manager*> select(const std::vector<std::string>& ids) const;

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        ManagerPtr manager;
        bool enabled = true;
    };

    const Entry* find(const std::string& id) const;

    std::vector<Entry> entries_;
};

// Registers the configured managers in configured order, followed by the
// remaining known managers as disabled.
ManagerRegistry build_registry(const Config& config, Executor& executor, Logger& logger, bool interactive);
