/**
 * @file registry.cpp
 * @brief Controller variant table
 */

#include "smcpso/core/registry.hpp"

#include <algorithm>
#include <cctype>

namespace smcpso::core {

namespace {

const std::vector<VariantSpec>& variantTable() {
    static const std::vector<VariantSpec> table = {
        {
            ControllerVariant::Classical,
            "classical",
            "Classical SMC with boundary layer and model-based equivalent control",
            {"k1", "k2", "lambda1", "lambda2", "K", "kd"},
            {"theta1 rate weight", "theta2 rate weight",
             "theta1 surface slope", "theta2 surface slope",
             "switching gain", "derivative damping gain"},
            {{1.0, 20.0}, {2.0, 60.0}, {1.0, 100.0}, {10.0, 600.0}, {5.0, 50.0}, {0.1, 10.0}},
            {4.0, 25.0, 4.0, 400.0, 15.0, 1.0},
        },
        {
            ControllerVariant::SuperTwisting,
            "sta",
            "Second-order super-twisting SMC",
            {"K1", "K2", "k1", "k2", "lambda1", "lambda2"},
            {"proportional twisting gain", "integral twisting gain",
             "theta1 surface weight", "theta2 surface weight",
             "theta1 surface slope", "theta2 surface slope"},
            {{3.0, 50.0}, {2.0, 30.0}, {0.5, 30.0}, {2.0, 60.0}, {0.5, 20.0}, {0.5, 30.0}},
            {8.0, 3.0, 1.5, 15.0, 3.5, 15.0},
        },
        {
            ControllerVariant::Adaptive,
            "adaptive",
            "SMC with online switching-gain adaptation",
            {"k1", "k2", "lambda1", "lambda2", "gamma"},
            {"theta1 surface weight", "theta2 surface weight",
             "theta1 surface slope", "theta2 surface slope",
             "adaptation rate"},
            {{0.5, 40.0}, {2.0, 60.0}, {0.5, 25.0}, {1.0, 30.0}, {0.5, 10.0}},
            {2.0, 15.0, 4.0, 20.0, 3.0},
        },
        {
            ControllerVariant::HybridAdaptiveSuperTwisting,
            "hybrid",
            "Mode-switching combination of adaptive and super-twisting SMC",
            {"k1", "k2", "lambda1", "lambda2"},
            {"theta1 surface weight", "theta2 surface weight",
             "theta1 surface slope", "theta2 surface slope"},
            {{0.5, 30.0}, {2.0, 60.0}, {0.5, 20.0}, {1.0, 30.0}},
            {2.5, 17.5, 4.0, 22.0},
        },
    };
    return table;
}

struct Alias {
    const char* name;
    ControllerVariant variant;
};

constexpr Alias kAliases[] = {
    {"classical", ControllerVariant::Classical},
    {"classical_smc", ControllerVariant::Classical},
    {"sta", ControllerVariant::SuperTwisting},
    {"sta_smc", ControllerVariant::SuperTwisting},
    {"super_twisting", ControllerVariant::SuperTwisting},
    {"adaptive", ControllerVariant::Adaptive},
    {"adaptive_smc", ControllerVariant::Adaptive},
    {"hybrid", ControllerVariant::HybridAdaptiveSuperTwisting},
    {"hybrid_adaptive_sta_smc", ControllerVariant::HybridAdaptiveSuperTwisting},
};

}  // namespace

const VariantSpec* findVariantSpec(ControllerVariant variant) {
    for (const auto& spec : variantTable()) {
        if (spec.variant == variant) return &spec;
    }
    return nullptr;
}

const std::vector<ControllerVariant>& allVariants() {
    static const std::vector<ControllerVariant> variants = [] {
        std::vector<ControllerVariant> out;
        for (const auto& spec : variantTable()) out.push_back(spec.variant);
        return out;
    }();
    return variants;
}

const char* variantName(ControllerVariant variant) {
    const VariantSpec* spec = findVariantSpec(variant);
    return spec ? spec->name : "unknown";
}

bool parseVariant(const std::string& name, ControllerVariant& variant) {
    std::string key(name);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& alias : kAliases) {
        if (key == alias.name) {
            variant = alias.variant;
            return true;
        }
    }
    return false;
}

}  // namespace smcpso::core
