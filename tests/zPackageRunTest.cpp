#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "zChecksum.h"
#include "zFile.h"
#include "zPackageRun.h"
#include "zPackageTypes.h"
#include "zRblPackage.h"

namespace fs = std::filesystem;

namespace {

using namespace rbl;

std::vector<uint8_t> toBytes(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

// 每个用例独享一个临时目录，结束时清理。
class PackageRunTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        dir_ = fs::temp_directory_path() /
               ("rblpack_" + std::string(info->name()) + "_" + std::to_string(stamp));
        fs::create_directories(dir_);
        patchPath_ = (dir_ / "light_patch.bin").string();
        newPath_ = (dir_ / "new_fw.bin").string();
        ASSERT_TRUE(base::file::writeFileBytes(patchPath_, toBytes("PATCHDATA")));
        ASSERT_TRUE(base::file::writeFileBytes(newPath_, toBytes("FIRMWAREDATA")));
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    RblPackConfig makeConfig() const {
        RblPackConfig config;
        CliOverrides cli;
        cli.positionals = {patchPath_, newPath_};
        applyCliOverrides(cli, config);
        return config;
    }

    fs::path dir_;
    std::string patchPath_;
    std::string newPath_;
};

TEST_F(PackageRunTest, WritesPackageNextToPatch) {
    RblPackConfig config = makeConfig();
    config.timestampSet = true;
    config.timestamp = 1700000000u;
    ASSERT_TRUE(validateConfig(config));
    ASSERT_EQ(runPackageFlow(config), kExitOk);

    const std::string expectedOutput = (dir_ / "light_patch.rbl").string();
    EXPECT_EQ(config.outputFile, expectedOutput);

    std::vector<uint8_t> written;
    ASSERT_TRUE(base::file::readFileBytes(expectedOutput, &written));
    ASSERT_EQ(written.size(), package::kRblHeaderSize + 9);

    package::RblHeaderInfo info;
    std::string error;
    ASSERT_TRUE(package::checkRblPackage(written, &info, &error)) << error;
    EXPECT_EQ(info.rawSize, 12u);
    EXPECT_EQ(info.packageSize, 9u);
    EXPECT_EQ(info.rawCrc, base::checksum::crc32Ieee(toBytes("FIRMWAREDATA")));
    EXPECT_EQ(info.packageCrc, base::checksum::crc32Ieee(toBytes("PATCHDATA")));
    EXPECT_EQ(info.timestamp, 1700000000u);
    EXPECT_EQ(info.algo, 0x0400);
    EXPECT_EQ(info.partName, "app");
    EXPECT_EQ(info.headerCrc, 0xB939CE96u);
}

TEST_F(PackageRunTest, TimestampDefaultsToPatchMtime) {
    int64_t mtime = 0;
    ASSERT_TRUE(base::file::fileModifiedTime(patchPath_, &mtime));

    RblPackConfig config = makeConfig();
    config.outputFile = (dir_ / "out" / "pkg.rbl").string();
    ASSERT_EQ(runPackageFlow(config), kExitOk);

    std::vector<uint8_t> written;
    ASSERT_TRUE(base::file::readFileBytes(config.outputFile, &written));
    package::RblHeaderInfo info;
    std::string error;
    ASSERT_TRUE(package::checkRblPackage(written, &info, &error)) << error;
    EXPECT_EQ(info.timestamp, static_cast<uint32_t>(mtime));
}

TEST_F(PackageRunTest, MissingInputFailsValidation) {
    RblPackConfig config = makeConfig();
    config.newFile = (dir_ / "missing.bin").string();
    EXPECT_FALSE(validateConfig(config));

    RblPackConfig noPatch = makeConfig();
    noPatch.patchFile = (dir_ / "missing_patch.bin").string();
    EXPECT_FALSE(validateConfig(noPatch));
}

TEST_F(PackageRunTest, OutputMayNotOverwriteInput) {
    RblPackConfig config = makeConfig();
    config.outputFile = newPath_;
    EXPECT_FALSE(validateConfig(config));
}

TEST_F(PackageRunTest, EncodingErrorWritesNothing) {
    RblPackConfig config = makeConfig();
    config.fwVersion = "v1.\xFF";
    EXPECT_EQ(runPackageFlow(config), kExitFailure);
    EXPECT_FALSE(fs::exists(config.outputFile));
}

TEST_F(PackageRunTest, EmptyInputsProduceHeaderOnlyPackage) {
    ASSERT_TRUE(base::file::writeFileBytes(patchPath_, {}));
    ASSERT_TRUE(base::file::writeFileBytes(newPath_, {}));

    RblPackConfig config = makeConfig();
    ASSERT_EQ(runPackageFlow(config), kExitOk);

    std::vector<uint8_t> written;
    ASSERT_TRUE(base::file::readFileBytes(config.outputFile, &written));
    package::RblHeaderInfo info;
    std::string error;
    ASSERT_TRUE(package::checkRblPackage(written, &info, &error)) << error;
    EXPECT_EQ(written.size(), package::kRblHeaderSize);
    EXPECT_EQ(info.rawSize, 0u);
    EXPECT_EQ(info.packageCrc, 0u);
    EXPECT_EQ(info.rawCrc, 0u);
}

TEST_F(PackageRunTest, HeaderMetaCarriesConfiguredMetadata) {
    RblPackConfig config = makeConfig();
    config.partName = "download";
    config.fwVersion = "v2.0.1";
    config.productCode = "PC-42";
    config.algo = 0x0101;
    config.algo2 = 1;
    const package::RblHeaderMeta meta = buildHeaderMeta(config, 99u);
    EXPECT_EQ(meta.partName, "download");
    EXPECT_EQ(meta.fwVersion, "v2.0.1");
    EXPECT_EQ(meta.productCode, "PC-42");
    EXPECT_EQ(meta.algo, 0x0101);
    EXPECT_EQ(meta.algo2, 1);
    EXPECT_EQ(meta.timestamp, 99u);
}

}  // namespace
