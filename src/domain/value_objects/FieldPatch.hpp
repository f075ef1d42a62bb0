/**
 * @file FieldPatch.hpp
 * @brief Helpers for typed partial updates.
 */

#pragma once

#include <optional>

namespace staffledger::domain {

/**
 * @brief Patch slot for a field that may itself be empty.
 *
 * Disengaged: leave the stored value alone.
 * Engaged with std::nullopt: clear the stored value.
 * Engaged with a value: overwrite.
 */
template <typename T>
using NullablePatch = std::optional<std::optional<T>>;

/**
 * @brief Overwrites target when the patch is engaged. Works for both plain
 * and nullable slots (T deduced as std::optional<U> for the latter).
 */
template <typename T>
inline void ApplyPatch(T& target, const std::optional<T>& patch) {
    if (patch) target = *patch;
}

} // namespace staffledger::domain
