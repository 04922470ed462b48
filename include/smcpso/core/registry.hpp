/**
 * @file registry.hpp
 * @brief Static metadata for every controller variant
 */

#pragma once

#include "smcpso/core/types.hpp"

#include <string>
#include <vector>

namespace smcpso::core {

/**
 * @brief Immutable description of one controller variant
 */
struct VariantSpec {
    ControllerVariant variant;
    const char* name;                       // Canonical short name
    const char* description;
    std::vector<const char*> gainNames;     // Ordered gain names
    std::vector<const char*> gainRoles;     // Role of each gain, used in messages
    std::vector<GainBounds> bounds;         // Default search bounds
    GainVector defaultGains;

    size_t gainCount() const { return gainNames.size(); }
};

/**
 * @brief Look up a variant
 * @return Spec, or nullptr for a value outside the closed set
 */
const VariantSpec* findVariantSpec(ControllerVariant variant);

/**
 * @brief All registered variants in declaration order
 */
const std::vector<ControllerVariant>& allVariants();

/**
 * @brief Canonical name ("classical", "sta", "adaptive", "hybrid")
 */
const char* variantName(ControllerVariant variant);

/**
 * @brief Parse a variant name or one of its aliases
 * @param name e.g. "classical_smc", "super_twisting", "hybrid_adaptive_sta_smc"
 * @param variant Receives the parsed value
 * @return false if the name is unknown
 */
bool parseVariant(const std::string& name, ControllerVariant& variant);

}  // namespace smcpso::core
