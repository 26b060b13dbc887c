/**
 * @file RecordSerializer.hpp
 * @brief JSON mapping of the published structured record schema.
 */

#pragma once

#include <nlohmann/json.hpp>
#include "domain/StructuredRecord.hpp"

namespace adaharvest::infrastructure {

class RecordSerializer {
public:
    /**
     * @brief Published JSON form. Unknown scalars are null, unknown arrays are empty,
     *        and "fieldStatus" says which is which.
     */
    static nlohmann::json ToJson(const domain::StructuredRecord& record);

    /** @brief Inverse of ToJson. Throws nlohmann::json::exception or std::invalid_argument on a foreign shape. */
    static domain::StructuredRecord FromJson(const nlohmann::json& j);
};

} // namespace adaharvest::infrastructure
