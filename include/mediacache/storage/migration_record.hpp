/**
 * @file migration_record.hpp
 * @brief Migration record structure for schema version tracking
 */

#pragma once

#include <string>

namespace mediacache::storage {

/**
 * @brief Represents a record of an applied cache schema migration
 */
struct migration_record {
    int version;              ///< Schema version number
    std::string description;  ///< Description of the migration
    std::string applied_at;   ///< Timestamp when migration was applied
};

}  // namespace mediacache::storage
