#include <gtest/gtest.h>
#include <managers/usage_probe.hpp>

// ── top ─────────────────────────────────────────────────────

TEST(UsageParsing, TopProcpsNg) {
    const char* out =
        "top - 14:02:11 up 12 days,  3:41,  1 user,  load average: 0.08, 0.03, 0.01\n"
        "Tasks:  31 total,   1 running,  30 sleeping,   0 stopped,   0 zombie\n"
        "%Cpu(s):  6.2 us,  1.6 sy,  0.0 ni, 91.8 id,  0.0 wa,  0.0 hi,  0.4 si,  0.0 st\n"
        "MiB Mem :   2048.0 total,   1536.2 free,    301.4 used,    210.4 buff/cache\n";
    auto cpu = parse_top_cpu(out);
    ASSERT_TRUE(cpu.has_value());
    EXPECT_NEAR(*cpu, 8.2, 1e-9);
}

TEST(UsageParsing, TopOlderProcps) {
    const char* out =
        "Cpu(s):  2.0%us,  1.0%sy,  0.0%ni, 97.0%id,  0.0%wa,  0.0%hi,  0.0%si,  0.0%st\n";
    auto cpu = parse_top_cpu(out);
    ASSERT_TRUE(cpu.has_value());
    EXPECT_NEAR(*cpu, 3.0, 1e-9);
}

TEST(UsageParsing, TopFullyIdle) {
    // No space between "ni," and the idle figure once it reaches 100.0
    auto cpu = parse_top_cpu("%Cpu(s):  0.0 us,  0.0 sy,  0.0 ni,100.0 id,  0.0 wa\n");
    ASSERT_TRUE(cpu.has_value());
    EXPECT_NEAR(*cpu, 0.0, 1e-9);
}

TEST(UsageParsing, TopFullyBusy) {
    auto cpu = parse_top_cpu("%Cpu(s): 99.0 us,  1.0 sy,  0.0 ni,  0.0 id,  0.0 wa\n");
    ASSERT_TRUE(cpu.has_value());
    EXPECT_NEAR(*cpu, 100.0, 1e-9);
}

TEST(UsageParsing, TopWithoutCpuLine) {
    EXPECT_FALSE(parse_top_cpu("").has_value());
    EXPECT_FALSE(parse_top_cpu("Tasks: 1 total\n").has_value());
}

// ── free ────────────────────────────────────────────────────

TEST(UsageParsing, FreeMemory) {
    const char* out =
        "               total        used        free      shared  buff/cache   available\n"
        "Mem:            2048         512        1024           8         512        1400\n"
        "Swap:              0           0           0\n";
    auto mem = parse_free_memory(out);
    ASSERT_TRUE(mem.has_value());
    EXPECT_EQ(mem->total_mb, 2048);
    EXPECT_EQ(mem->used_mb, 512);
    EXPECT_DOUBLE_EQ(mem->percent(), 25.0);
}

TEST(UsageParsing, FreeWithoutMemRow) {
    EXPECT_FALSE(parse_free_memory("Swap: 0 0 0\n").has_value());
    EXPECT_DOUBLE_EQ(MemoryUsage{}.percent(), 0.0);
}

// ── df ──────────────────────────────────────────────────────

TEST(UsageParsing, DfRoot) {
    const char* out =
        "Filesystem                          Size  Used Avail Use% Mounted on\n"
        "default/containers/vm-vps-alice-1    20G  3.1G   17G  16% /\n";
    auto disk = parse_df_root(out);
    ASSERT_TRUE(disk.has_value());
    EXPECT_EQ(disk->size, "20G");
    EXPECT_EQ(disk->used, "3.1G");
    EXPECT_EQ(disk->percent, "16%");
}

TEST(UsageParsing, DfWithoutRoot) {
    EXPECT_FALSE(parse_df_root("Filesystem Size Used Avail Use% Mounted on\n"
                               "tmpfs 1G 0 1G 0% /tmp\n").has_value());
}

// ── info ────────────────────────────────────────────────────

TEST(UsageParsing, InfoStatus) {
    const char* out =
        "Name: vm-vps-alice-1\n"
        "Status: RUNNING\n"
        "Type: container\n";
    EXPECT_EQ(parse_info_status(out).value_or(""), "RUNNING");
    EXPECT_FALSE(parse_info_status("Name: x\n").has_value());
}
