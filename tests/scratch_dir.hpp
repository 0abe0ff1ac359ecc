#pragma once

#include <gtest/gtest.h>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

// Fixture base: a fresh scratch tree per test, removed afterwards.
class ScratchDirTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        log_set_quiet(true);
        log_init("", false);
        platform::set_interrupted(false);

        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   (std::string("forager_") + info->test_suite_name() + "_" + info->name() +
                    "_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        platform::set_interrupted(false);
        std::error_code ec;
        fs::permissions(test_dir, fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(test_dir, ec);
    }

    // Create a file of the given size; mtime is set when mtime > 0.
    fs::path write_file(const std::string& rel_path, size_t size = 4, double mtime = 0.0) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        {
            std::ofstream out(full, std::ios::binary | std::ios::trunc);
            out << std::string(size, 'x');
        }
        if (mtime > 0) set_mtime(full, mtime);
        return full;
    }

    static void set_mtime(const fs::path& p, double mtime) {
        struct timespec ts[2];
        ts[0].tv_sec = static_cast<time_t>(mtime);
        ts[0].tv_nsec = 0;
        ts[1] = ts[0];
        ASSERT_EQ(utimensat(AT_FDCWD, p.c_str(), ts, 0), 0) << p;
    }

    static std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static size_t count_lines(const fs::path& p) {
        std::string content = read_file(p);
        size_t n = 0;
        for (char c : content) {
            if (c == '\n') n++;
        }
        return n;
    }
};
