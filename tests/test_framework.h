#pragma once

#include <gtest/gtest.h>

#include "../src/common/status.h"
#include "../src/common/utils.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#include <ftw.h>
#include <unistd.h>

namespace ua {
namespace test {

#define ASSERT_UA_OK(expr)                                          \
    do {                                                            \
        const ::ua::Status _ua_status = (expr);                     \
        ASSERT_TRUE(_ua_status.ok()) << _ua_status.toString();      \
    } while (0)

#define EXPECT_UA_CODE(expr, expected_code)                         \
    do {                                                            \
        const ::ua::Status _ua_status = (expr);                     \
        EXPECT_EQ(_ua_status.code(), (expected_code))               \
            << _ua_status.toString();                               \
    } while (0)

// Base fixture: a private scratch directory per test plus data helpers
class UATestBase : public ::testing::Test {
protected:
    void SetUp() override {
        char pattern[] = "/tmp/ua_test_XXXXXX";
        char* dir = mkdtemp(pattern);
        ASSERT_NE(dir, nullptr);
        test_dir_ = dir;
        Config::getInstance().reset();
        Utils::setVerbose(false);
    }

    void TearDown() override {
        if (!test_dir_.empty()) {
            nftw(test_dir_.c_str(), removeEntry, 16, FTW_DEPTH | FTW_PHYS);
        }
        Config::getInstance().reset();
    }

    // Writes content to a new file in the scratch directory
    std::string createTempFile(const std::string& content, const std::string& name = "") {
        std::string path = test_dir_ + "/" + (name.empty() ? "file_" + std::to_string(file_counter_++) : name);
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        return path;
    }

    std::string createTempFile(const std::vector<uint8_t>& content, const std::string& name = "") {
        return createTempFile(std::string(content.begin(), content.end()), name);
    }

    std::vector<uint8_t> generateRandomBytes(size_t size, uint32_t seed = 42) {
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> dist(0, 255);
        std::vector<uint8_t> data(size);
        for (auto& byte : data) {
            byte = static_cast<uint8_t>(dist(rng));
        }
        return data;
    }

    std::string generateRandomData(size_t size, uint32_t seed = 42) {
        auto bytes = generateRandomBytes(size, seed);
        return std::string(bytes.begin(), bytes.end());
    }

    // Highly compressible text
    std::string generateTextData(size_t size) {
        static const std::string line = "ACGTACGTTTGACCA\tread_0001\t+\tIIIIIIIIIIIIIII\n";
        std::string data;
        data.reserve(size);
        while (data.size() < size) {
            data += line;
        }
        data.resize(size);
        return data;
    }

    std::string test_dir_;

private:
    static int removeEntry(const char* path, const struct stat*, int, struct FTW*) {
        return ::remove(path);
    }

    int file_counter_ = 0;
};

class PerformanceTimer {
public:
    void start() { start_ = std::chrono::steady_clock::now(); }
    void stop() { end_ = std::chrono::steady_clock::now(); }
    int64_t getElapsedMilliseconds() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end_ - start_).count();
    }

private:
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point end_;
};

} // namespace test
} // namespace ua
