#pragma once

#include "manager.hpp"

#include <string>
#include <vector>

// Every manager id sysup knows about, in the default execution order.
const std::vector<std::string>& known_manager_ids();

// Throws NotFoundError for an unknown id.
ManagerPtr create_manager(const std::string& id, ManagerContext ctx);
