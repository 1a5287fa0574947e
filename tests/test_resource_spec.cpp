#include <gtest/gtest.h>
#include <core/resource_spec.hpp>
#include <climits>

// ── validate_resources ──────────────────────────────────────

TEST(ResourceSpec, ValidateAcceptsPositive) {
    EXPECT_TRUE(validate_resources(4, 2, 20).is_ok());
    EXPECT_TRUE(validate_resources(1, 1, 1).is_ok());
}

TEST(ResourceSpec, ValidateRejectsZeroOrNegative) {
    EXPECT_EQ(validate_resources(0, 2, 20).kind, ErrorKind::Validation);
    EXPECT_EQ(validate_resources(4, -1, 20).kind, ErrorKind::Validation);
    EXPECT_EQ(validate_resources(4, 2, 0).kind, ErrorKind::Validation);
}

TEST(ResourceSpec, ValidateCapsRamAtIntMegabytes) {
    EXPECT_TRUE(validate_resources(2097151, 2, 20).is_ok());
    EXPECT_EQ(validate_resources(2097152, 2, 20).kind, ErrorKind::Validation);
    EXPECT_EQ(validate_resources(3000000, 2, 20).kind, ErrorKind::Validation);
}

// ── formatting ──────────────────────────────────────────────

TEST(ResourceSpec, ConfigString) {
    EXPECT_EQ(format_config_string({4, 2, 20}), "4GB RAM / 2 CPU / 20GB Disk");
}

TEST(ResourceSpec, MemoryLimitInMegabytes) {
    EXPECT_EQ(memory_limit_arg(4), "4096MB");
    EXPECT_EQ(memory_limit_arg(1), "1024MB");
    EXPECT_EQ(memory_limit_arg(3000000), "3072000000MB");
}

// ── parse_gb ────────────────────────────────────────────────

TEST(ResourceSpec, ParseGbSuffixes) {
    EXPECT_EQ(parse_gb("4GB"), 4);
    EXPECT_EQ(parse_gb("4G"), 4);
    EXPECT_EQ(parse_gb("16gb"), 16);
    EXPECT_EQ(parse_gb("20"), 20);
}

TEST(ResourceSpec, ParseGbRejectsGarbage) {
    EXPECT_EQ(parse_gb(""), 0);
    EXPECT_EQ(parse_gb("GB"), 0);
    EXPECT_EQ(parse_gb("4TB"), 0);
    EXPECT_EQ(parse_gb("99999999999GB"), 0);
}

// ── resolve_resize ──────────────────────────────────────────

TEST(ResourceSpec, ResizeAbsoluteKeepsUnsetFields) {
    ResizeRequest req;
    req.ram_gb = 8;
    auto r = resolve_resize({4, 2, 20}, req);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (ResourceSpec{8, 2, 20}));
}

TEST(ResourceSpec, ResizeAddIsRelative) {
    ResizeRequest req;
    req.mode = ResizeRequest::Mode::Add;
    req.cpu = 2;
    req.disk_gb = 10;
    auto r = resolve_resize({4, 2, 20}, req);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value, (ResourceSpec{4, 4, 30}));
}

TEST(ResourceSpec, ResizeRejectsEmptyAndNonPositive) {
    EXPECT_EQ(resolve_resize({4, 2, 20}, ResizeRequest{}).kind, ErrorKind::Validation);

    ResizeRequest req;
    req.disk_gb = 0;
    EXPECT_EQ(resolve_resize({4, 2, 20}, req).kind, ErrorKind::Validation);

    ResizeRequest add;
    add.mode = ResizeRequest::Mode::Add;
    add.ram_gb = -2;
    EXPECT_EQ(resolve_resize({4, 2, 20}, add).kind, ErrorKind::Validation);
}

TEST(ResourceSpec, ResizeAddPastIntLimitIsRejected) {
    ResizeRequest ram;
    ram.mode = ResizeRequest::Mode::Add;
    ram.ram_gb = INT_MAX;
    EXPECT_EQ(resolve_resize({4, 2, 20}, ram).kind, ErrorKind::Validation);

    ResizeRequest cpu;
    cpu.mode = ResizeRequest::Mode::Add;
    cpu.cpu = INT_MAX;
    EXPECT_EQ(resolve_resize({4, 2, 20}, cpu).kind, ErrorKind::Validation);
}

TEST(ResourceSpec, ResizeAbsoluteRamAboveCapIsRejected) {
    ResizeRequest req;
    req.ram_gb = 3000000;
    EXPECT_EQ(resolve_resize({4, 2, 20}, req).kind, ErrorKind::Validation);
}
