#include <gtest/gtest.h>
#include <core/capability.hpp>

static CapabilityMap gpu(double vram, double cores) {
    return {
        {"vram_gb", CapabilityValue::of_number(vram)},
        {"cuda_cores", CapabilityValue::of_number(cores)},
    };
}

TEST(Capability, NumberAtLeast) {
    EXPECT_TRUE(satisfies(CapabilityValue::of_number(80), CapabilityValue::of_number(40)));
    EXPECT_TRUE(satisfies(CapabilityValue::of_number(40), CapabilityValue::of_number(40)));
    EXPECT_FALSE(satisfies(CapabilityValue::of_number(24), CapabilityValue::of_number(40)));
}

TEST(Capability, StringIgnoresCase) {
    EXPECT_TRUE(satisfies(CapabilityValue::of_string("NVLink"), CapabilityValue::of_string("nvlink")));
    EXPECT_FALSE(satisfies(CapabilityValue::of_string("pcie"), CapabilityValue::of_string("nvlink")));
}

TEST(Capability, ListContainsWanted) {
    auto have = CapabilityValue::of_list({"fp16", "FP8", "tf32"});
    EXPECT_TRUE(satisfies(have, CapabilityValue::of_string("fp8")));
    EXPECT_TRUE(satisfies(have, CapabilityValue::of_list({"fp16", "tf32"})));
    EXPECT_FALSE(satisfies(have, CapabilityValue::of_list({"fp16", "int4"})));
}

TEST(Capability, MismatchedKindsNeverSatisfy) {
    EXPECT_FALSE(satisfies(CapabilityValue::of_string("80"), CapabilityValue::of_number(40)));
    EXPECT_FALSE(satisfies(CapabilityValue::of_number(80), CapabilityValue::of_string("80")));
}

TEST(Capability, SpecMatchFraction) {
    CapabilityMap want = {
        {"vram_gb", CapabilityValue::of_number(40)},
        {"cuda_cores", CapabilityValue::of_number(10000)},
        {"interconnect", CapabilityValue::of_string("nvlink")},
    };
    // vram ok, cores short, interconnect missing
    EXPECT_DOUBLE_EQ(spec_match(gpu(80, 6912), want), 1.0 / 3.0);
    EXPECT_FALSE(meets_spec(gpu(80, 6912), want));
}

TEST(Capability, EmptyWantIsFullMatch) {
    EXPECT_DOUBLE_EQ(spec_match(gpu(16, 100), {}), 1.0);
    EXPECT_TRUE(meets_spec({}, {}));
}

TEST(Capability, DominatesNeedsStrictGain) {
    EXPECT_TRUE(dominates(gpu(80, 6912), gpu(40, 6912)));
    EXPECT_FALSE(dominates(gpu(40, 6912), gpu(40, 6912)));
    EXPECT_FALSE(dominates(gpu(80, 5000), gpu(40, 6912)));
}

TEST(Capability, DominatesNeedsSharedNumericField) {
    CapabilityMap a = {{"model", CapabilityValue::of_string("a100")}};
    CapabilityMap b = {{"model", CapabilityValue::of_string("h100")}};
    EXPECT_FALSE(dominates(b, a));
    EXPECT_FALSE(dominates(gpu(80, 1), {}));
}

TEST(Capability, ParseArg) {
    std::string key;
    CapabilityValue v;

    ASSERT_TRUE(parse_capability_arg("vram_gb=40", key, v));
    EXPECT_EQ(key, "vram_gb");
    EXPECT_TRUE(v.is_number());
    EXPECT_DOUBLE_EQ(v.number, 40.0);

    ASSERT_TRUE(parse_capability_arg("precision=fp16,fp8", key, v));
    ASSERT_TRUE(v.is_list());
    EXPECT_EQ(v.items.size(), 2u);

    ASSERT_TRUE(parse_capability_arg("model=a100", key, v));
    EXPECT_TRUE(v.is_string());

    EXPECT_FALSE(parse_capability_arg("noequals", key, v));
    EXPECT_FALSE(parse_capability_arg("=5", key, v));
}

TEST(Capability, ScalarTextNumbersOnlyWhenWholeTokenParses) {
    EXPECT_TRUE(capability_from_scalar("2.5").is_number());
    EXPECT_TRUE(capability_from_scalar("24GB").is_string());
    EXPECT_TRUE(capability_from_scalar("").is_string());
}

TEST(Capability, ScalarTextAcceptsOnlyDecimalNumbers) {
    EXPECT_DOUBLE_EQ(capability_from_scalar("-3").number, -3.0);
    EXPECT_DOUBLE_EQ(capability_from_scalar(".5").number, 0.5);
    EXPECT_DOUBLE_EQ(capability_from_scalar("1e3").number, 1000.0);
    EXPECT_TRUE(capability_from_scalar("40.").is_number());

    EXPECT_TRUE(capability_from_scalar("nan").is_string());
    EXPECT_TRUE(capability_from_scalar("inf").is_string());
    EXPECT_TRUE(capability_from_scalar("-Infinity").is_string());
    EXPECT_TRUE(capability_from_scalar("0x1F").is_string());
    EXPECT_TRUE(capability_from_scalar(" 5").is_string());
    EXPECT_TRUE(capability_from_scalar("1e").is_string());
    EXPECT_TRUE(capability_from_scalar(".").is_string());

    std::string key;
    CapabilityValue v;
    ASSERT_TRUE(parse_capability_arg("vram_gb=nan", key, v));
    EXPECT_TRUE(v.is_string());
}
