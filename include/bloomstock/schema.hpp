#pragma once

#include "bloomstock/database.hpp"

namespace bloomstock {

/**
 * Create every table and index the engine reads or writes.
 * Safe to run against an existing database.
 */
void apply_schema(Database& db);

}  // namespace bloomstock
