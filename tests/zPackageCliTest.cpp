#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "zPackageCli.h"
#include "zPackageRun.h"
#include "zPackageTypes.h"

namespace {

using namespace rbl;

// 把字符串列表转换为可传给 parseCommandLine 的 argv。
class ArgvBuilder {
public:
    explicit ArgvBuilder(std::vector<std::string> args) : storage_(std::move(args)) {
        storage_.insert(storage_.begin(), "rblpack");
        for (std::string& arg : storage_) {
            pointers_.push_back(&arg[0]);
        }
        pointers_.push_back(nullptr);
    }

    int argc() const { return static_cast<int>(storage_.size()); }
    char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

bool parse(std::vector<std::string> args, CliOverrides* cli, std::string* error) {
    ArgvBuilder builder(std::move(args));
    return parseCommandLine(builder.argc(), builder.argv(), *cli, *error);
}

TEST(PackageCliTest, AcceptsTwoOrThreePositionals) {
    CliOverrides two;
    std::string error;
    ASSERT_TRUE(parse({"patch.bin", "new.bin"}, &two, &error)) << error;
    EXPECT_EQ(two.positionals, (std::vector<std::string>{"patch.bin", "new.bin"}));

    CliOverrides three;
    ASSERT_TRUE(parse({"patch.bin", "new.bin", "out.rbl"}, &three, &error)) << error;
    EXPECT_EQ(three.positionals.size(), 3u);
}

TEST(PackageCliTest, RejectsWrongPositionalCount) {
    std::string error;
    CliOverrides none;
    EXPECT_FALSE(parse({}, &none, &error));
    EXPECT_EQ(error, "expected 2 or 3 positional arguments, got 0");

    CliOverrides one;
    EXPECT_FALSE(parse({"patch.bin"}, &one, &error));

    CliOverrides four;
    EXPECT_FALSE(parse({"a", "b", "c", "d"}, &four, &error));
    EXPECT_EQ(error, "expected 2 or 3 positional arguments, got 4");
}

TEST(PackageCliTest, HelpShortCircuits) {
    CliOverrides cli;
    std::string error;
    ASSERT_TRUE(parse({"--help"}, &cli, &error)) << error;
    EXPECT_TRUE(cli.showHelp);
}

TEST(PackageCliTest, ParsesMetadataOptions) {
    CliOverrides cli;
    std::string error;
    ASSERT_TRUE(parse({"--part-name", "download", "p.bin", "--fw-version", "v2.3.4", "n.bin",
                       "--product-code", "ABC", "--algo", "0x0100", "--algo2", "1",
                       "--timestamp", "1700000000"},
                      &cli, &error))
        << error;
    EXPECT_TRUE(cli.partNameSet);
    EXPECT_EQ(cli.partName, "download");
    EXPECT_EQ(cli.fwVersion, "v2.3.4");
    EXPECT_EQ(cli.productCode, "ABC");
    EXPECT_TRUE(cli.algoSet);
    EXPECT_EQ(cli.algo, 0x0100);
    EXPECT_EQ(cli.algo2, 1);
    EXPECT_TRUE(cli.timestampSet);
    EXPECT_EQ(cli.timestamp, 1700000000u);
    EXPECT_EQ(cli.positionals, (std::vector<std::string>{"p.bin", "n.bin"}));
}

TEST(PackageCliTest, RejectsBadOptionValues) {
    std::string error;
    CliOverrides tooWide;
    EXPECT_FALSE(parse({"p", "n", "--algo", "65536"}, &tooWide, &error));
    EXPECT_EQ(error, "invalid --algo value: 65536 (expected 0..65535)");

    CliOverrides negative;
    EXPECT_FALSE(parse({"p", "n", "--algo2", "-1"}, &negative, &error));

    CliOverrides missing;
    EXPECT_FALSE(parse({"p", "n", "--part-name"}, &missing, &error));
    EXPECT_EQ(error, "missing value for --part-name");

    CliOverrides unknown;
    EXPECT_FALSE(parse({"p", "n", "--verbose"}, &unknown, &error));
    EXPECT_EQ(error, "unknown option: --verbose");
}

TEST(PackageCliTest, ParseUnsignedValue) {
    uint64_t value = 0;
    EXPECT_TRUE(parseUnsignedValue("1024", 0xFFFF, &value));
    EXPECT_EQ(value, 1024u);
    EXPECT_TRUE(parseUnsignedValue("0x400", 0xFFFF, &value));
    EXPECT_EQ(value, 1024u);
    EXPECT_TRUE(parseUnsignedValue("010", 0xFFFF, &value));
    EXPECT_EQ(value, 10u);
    EXPECT_FALSE(parseUnsignedValue("", 0xFFFF, &value));
    EXPECT_FALSE(parseUnsignedValue("12abc", 0xFFFF, &value));
    EXPECT_FALSE(parseUnsignedValue(" 1", 0xFFFF, &value));
    EXPECT_FALSE(parseUnsignedValue("0x", 0xFFFF, &value));
    EXPECT_FALSE(parseUnsignedValue("99999999999999999999999", UINT64_MAX, &value));
}

TEST(PackageCliTest, DefaultOutputPathReplacesExtension) {
    EXPECT_EQ(defaultOutputPath("light_patch.bin"), "light_patch.rbl");
    EXPECT_EQ(defaultOutputPath("out/dir.v2/light_patch.diff"), "out/dir.v2/light_patch.rbl");
    EXPECT_EQ(defaultOutputPath("light_patch"), "light_patch.rbl");
    EXPECT_EQ(defaultOutputPath("a.b.bin"), "a.b.rbl");
}

TEST(PackageCliTest, OverridesMergeIntoDefaults) {
    RblPackConfig defaults;
    CliOverrides none;
    none.positionals = {"fw/light_patch.bin", "fw/new.bin"};
    applyCliOverrides(none, defaults);
    EXPECT_EQ(defaults.patchFile, "fw/light_patch.bin");
    EXPECT_EQ(defaults.newFile, "fw/new.bin");
    EXPECT_EQ(defaults.outputFile, "fw/light_patch.rbl");
    EXPECT_EQ(defaults.partName, "app");
    EXPECT_EQ(defaults.fwVersion, "v1.00");
    EXPECT_EQ(defaults.productCode, "00010203040506070809");
    EXPECT_EQ(defaults.algo, 0x0400);
    EXPECT_EQ(defaults.algo2, 0);
    EXPECT_FALSE(defaults.timestampSet);

    RblPackConfig config;
    CliOverrides cli;
    cli.positionals = {"p.bin", "n.bin", "custom.pkg"};
    cli.partNameSet = true;
    cli.partName = "";
    cli.algoSet = true;
    cli.algo = 7;
    cli.timestampSet = true;
    cli.timestamp = 0x100000005ull;
    applyCliOverrides(cli, config);
    EXPECT_EQ(config.outputFile, "custom.pkg");
    EXPECT_EQ(config.partName, "");
    EXPECT_EQ(config.algo, 7);
    EXPECT_TRUE(config.timestampSet);
    // 超过 32 位的时间戳被截断。
    EXPECT_EQ(config.timestamp, 5u);
}

}  // namespace
