#pragma once

// Umbrella header for the storage core

#include "strata/types.hpp"
#include "strata/errors.hpp"
#include "strata/log.hpp"
#include "strata/db.hpp"
#include "strata/sqlite_connection.hpp"
#include "strata/encryption.hpp"
#include "strata/inventory.hpp"
#include "strata/layout_strategy.hpp"
#include "strata/shared_table_strategy.hpp"
#include "strata/table_per_collection_strategy.hpp"
#include "strata/connection_pool.hpp"
#include "strata/storage.hpp"
