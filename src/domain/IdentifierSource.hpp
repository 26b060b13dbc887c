/**
 * @file IdentifierSource.hpp
 * @brief Lazy, restartable enumeration of decision identifiers.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/DecisionIdentifier.hpp"

namespace adaharvest::domain {

/**
 * @class IdentifierSource
 * @brief Produces identifiers in a stable order and exposes an opaque resume cursor.
 *
 * cursor() names the position right after the last identifier returned by next(),
 * so a source rebuilt with resumeFrom(cursor()) continues with the following one.
 */
class IdentifierSource {
public:
    virtual ~IdentifierSource() = default;

    /** @brief Next identifier, or std::nullopt at end of sequence. */
    virtual std::optional<DecisionIdentifier> next() = 0;

    virtual std::string cursor() const = 0;

    /** @brief Repositions the source. Throws std::invalid_argument on a foreign cursor. */
    virtual void resumeFrom(const std::string& cursor) = 0;

    /** @brief Stable description of what is being enumerated, used to match checkpoints. */
    virtual std::string describe() const = 0;
};

} // namespace adaharvest::domain
