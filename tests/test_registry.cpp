/**
 * @file test_registry.cpp
 * @brief Unit tests for the controller variant registry
 */

#include <gtest/gtest.h>
#include <smcpso/core/registry.hpp>
#include <smcpso/core/gain_validator.hpp>

using namespace smcpso::core;

TEST(RegistryTest, EveryVariantHasConsistentMetadata) {
    ASSERT_EQ(allVariants().size(), 4u);

    for (ControllerVariant variant : allVariants()) {
        const VariantSpec* spec = findVariantSpec(variant);
        ASSERT_NE(spec, nullptr);
        EXPECT_EQ(spec->variant, variant);
        EXPECT_EQ(spec->gainRoles.size(), spec->gainCount());
        EXPECT_EQ(spec->bounds.size(), spec->gainCount());
        EXPECT_EQ(spec->defaultGains.size(), spec->gainCount());

        for (const auto& b : spec->bounds) {
            EXPECT_LT(b.lower, b.upper);
        }
    }
}

TEST(RegistryTest, GainCounts) {
    EXPECT_EQ(findVariantSpec(ControllerVariant::Classical)->gainCount(), 6u);
    EXPECT_EQ(findVariantSpec(ControllerVariant::SuperTwisting)->gainCount(), 6u);
    EXPECT_EQ(findVariantSpec(ControllerVariant::Adaptive)->gainCount(), 5u);
    EXPECT_EQ(findVariantSpec(ControllerVariant::HybridAdaptiveSuperTwisting)->gainCount(), 4u);
}

TEST(RegistryTest, DefaultGainsLieInsideBounds) {
    for (ControllerVariant variant : allVariants()) {
        const VariantSpec* spec = findVariantSpec(variant);
        for (size_t i = 0; i < spec->gainCount(); ++i) {
            EXPECT_TRUE(spec->bounds[i].contains(spec->defaultGains[i]))
                << spec->name << " gain " << spec->gainNames[i];
        }
    }
}

TEST(RegistryTest, DefaultGainsAreAccepted) {
    for (ControllerVariant variant : allVariants()) {
        const GainCheck check = validateGains(variant, findVariantSpec(variant)->defaultGains);
        EXPECT_TRUE(check.valid()) << variantName(variant) << ": " << check.summary();
    }
}

TEST(RegistryTest, UnknownVariantNotFound) {
    EXPECT_EQ(findVariantSpec(static_cast<ControllerVariant>(42)), nullptr);
    EXPECT_STREQ(variantName(static_cast<ControllerVariant>(42)), "unknown");
}

TEST(RegistryTest, ParseNamesAndAliases) {
    ControllerVariant variant = ControllerVariant::Classical;

    EXPECT_TRUE(parseVariant("sta_smc", variant));
    EXPECT_EQ(variant, ControllerVariant::SuperTwisting);

    EXPECT_TRUE(parseVariant("Adaptive", variant));
    EXPECT_EQ(variant, ControllerVariant::Adaptive);

    EXPECT_TRUE(parseVariant("hybrid_adaptive_sta_smc", variant));
    EXPECT_EQ(variant, ControllerVariant::HybridAdaptiveSuperTwisting);

    EXPECT_TRUE(parseVariant("classical_smc", variant));
    EXPECT_EQ(variant, ControllerVariant::Classical);

    EXPECT_FALSE(parseVariant("mpc", variant));
    EXPECT_EQ(variant, ControllerVariant::Classical);
}

TEST(RegistryTest, CanonicalNamesRoundTrip) {
    for (ControllerVariant variant : allVariants()) {
        ControllerVariant parsed;
        ASSERT_TRUE(parseVariant(variantName(variant), parsed));
        EXPECT_EQ(parsed, variant);
    }
}
