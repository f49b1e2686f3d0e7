#include <gtest/gtest.h>
#include "core/errors.hpp"
#include "core/fingerprint.hpp"

#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class FingerprintTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string manifest;
    std::string record;

    void SetUp() override {
        test_dir = (fs::temp_directory_path() /
                    ("botctl-test-fingerprint-" + std::to_string(getpid()))).string();
        fs::create_directories(test_dir);
        manifest = test_dir + "/requirements.txt";
        record = test_dir + "/venv/.requirements_hash";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_manifest(const std::string& content) {
        std::ofstream out(manifest, std::ios::binary | std::ios::trunc);
        out << content;
    }
};

TEST_F(FingerprintTest, KnownSha256) {
    write_manifest("abc");
    EXPECT_EQ(Fingerprint::compute(manifest),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(FingerprintTest, DeterministicAndHex) {
    write_manifest("aiogram==3.4.1\npython-dotenv==1.0.0\n");
    std::string a = Fingerprint::compute(manifest);
    std::string b = Fingerprint::compute(manifest);
    EXPECT_EQ(a, b);
    EXPECT_EQ(a.size(), 64u);
    EXPECT_EQ(a.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(FingerprintTest, MissingManifestThrowsManifestNotFound) {
    try {
        Fingerprint::compute(test_dir + "/nope.txt");
        FAIL() << "expected SupervisorException";
    } catch (const SupervisorException& e) {
        EXPECT_EQ(e.error(), SupervisorError::ManifestNotFound);
    }
}

TEST_F(FingerprintTest, RequireManifestRejectsDirectory) {
    fs::create_directories(test_dir + "/requirements.d");
    try {
        Fingerprint::require_manifest(test_dir + "/requirements.d");
        FAIL() << "expected SupervisorException";
    } catch (const SupervisorException& e) {
        EXPECT_EQ(e.error(), SupervisorError::ManifestNotFound);
    }

    write_manifest("aiogram\n");
    EXPECT_NO_THROW(Fingerprint::require_manifest(manifest));
}

TEST_F(FingerprintTest, NotUpToDateWithoutRecord) {
    write_manifest("aiogram\n");
    EXPECT_FALSE(Fingerprint::is_up_to_date(record, manifest));
}

TEST_F(FingerprintTest, CommitCreatesRecordDirectory) {
    write_manifest("aiogram\n");
    Fingerprint::commit(record, manifest);
    EXPECT_TRUE(fs::exists(record));
    EXPECT_EQ(Fingerprint::read_record(record), Fingerprint::compute(manifest));
    EXPECT_TRUE(Fingerprint::is_up_to_date(record, manifest));
}

TEST_F(FingerprintTest, OneByteChangeInvalidatesRecord) {
    write_manifest("aiogram==3.4.1\n");
    Fingerprint::commit(record, manifest);

    write_manifest("aiogram==3.4.2\n");
    EXPECT_FALSE(Fingerprint::is_up_to_date(record, manifest));
}

TEST_F(FingerprintTest, RecordWhitespaceIgnored) {
    write_manifest("aiogram\n");
    fs::create_directories(fs::path(record).parent_path());
    std::ofstream(record) << "  " << Fingerprint::compute(manifest) << "\n\n";
    EXPECT_TRUE(Fingerprint::is_up_to_date(record, manifest));
}

TEST_F(FingerprintTest, NotUpToDateWhenManifestRemoved) {
    write_manifest("aiogram\n");
    Fingerprint::commit(record, manifest);
    fs::remove(manifest);
    EXPECT_FALSE(Fingerprint::is_up_to_date(record, manifest));
}

TEST_F(FingerprintTest, CommitWithoutManifestLeavesRecordAlone) {
    write_manifest("aiogram\n");
    Fingerprint::commit(record, manifest);
    std::string before = Fingerprint::read_record(record);

    fs::remove(manifest);
    EXPECT_THROW(Fingerprint::commit(record, manifest), SupervisorException);
    EXPECT_EQ(Fingerprint::read_record(record), before);
}
