/**
 * binary_installer_test.cpp - LocalBinaryInstaller checks
 */

#include "client/binary_installer.hpp"

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace wordserve;
using namespace wordserve::client;

class BinaryInstallerTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / ("wordserve_installer_test_" + std::to_string(::getpid()));
        fs::create_directories(temp_dir_);
    }

    void TearDown() override { fs::remove_all(temp_dir_); }

    fs::path write_file(const std::string &name, bool executable) {
        fs::path path = temp_dir_ / name;
        std::ofstream out(path.string());
        out << "#!/bin/sh\nexit 0\n";
        out.close();
        if (executable) {
            fs::permissions(path, fs::perms::owner_exec, fs::perm_options::add);
        }
        return path;
    }

    logging::LoggerPtr logger_ = std::make_shared<logging::Logger>(logging::Level::LVL_NONE);
    fs::path temp_dir_;
};

TEST_F(BinaryInstallerTest, ExecutableFileIsAccepted) {
    LocalBinaryInstaller installer(write_file("engine", true).string(), logger_);
    auto result = installer.ensure_binary();
    EXPECT_TRUE(result.success) << result.error;
    EXPECT_TRUE(result.error.empty());
}

TEST_F(BinaryInstallerTest, MissingFileIsRejected) {
    LocalBinaryInstaller installer((temp_dir_ / "missing").string(), logger_);
    auto result = installer.ensure_binary();
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST_F(BinaryInstallerTest, DirectoryIsRejected) {
    LocalBinaryInstaller installer(temp_dir_.string(), logger_);
    auto result = installer.ensure_binary();
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("regular file"), std::string::npos);
}

TEST_F(BinaryInstallerTest, NonExecutableIsRejected) {
    LocalBinaryInstaller installer(write_file("engine", false).string(), logger_);
    auto result = installer.ensure_binary();
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("not executable"), std::string::npos);
}

TEST_F(BinaryInstallerTest, EmptyPathIsRejected) {
    LocalBinaryInstaller installer("", logger_);
    EXPECT_FALSE(installer.ensure_binary().success);
}
