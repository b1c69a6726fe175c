#pragma once
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include "utils/FileIO.h"

namespace fs = std::filesystem;

/**
 * 每个用例独立的临时仓库目录，析构时删除。
 * 目录名带上测试套件与用例名，避免并行运行时互相覆盖。
 */
class TestRepo {
public:
    TestRepo() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "codemap_";
        if (info) {
            name += std::string(info->test_suite_name()) + "_" + info->name();
        }
        dir = fs::temp_directory_path() / name;
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    ~TestRepo() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    TestRepo(const TestRepo&) = delete;
    TestRepo& operator=(const TestRepo&) = delete;

    void write(const std::string& relPath, const std::string& content) const {
        fs::path p = dir / relPath;
        fs::create_directories(p.parent_path());
        std::ofstream out(p, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read(const std::string& relPath) const {
        return FileIO::readFile(dir / relPath).value_or("");
    }

    std::string root() const { return dir.u8string(); }
    const fs::path& path() const { return dir; }

private:
    fs::path dir;
};
