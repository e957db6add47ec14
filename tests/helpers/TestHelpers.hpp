#pragma once

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Normalize path separators to forward slashes for cross-platform testing.
 *
 * @param[in] paths Vector of path strings to normalize
 * @return Vector of normalized path strings
 */
inline std::vector<std::string> NormalizePaths(const std::vector<std::string>& paths)
{
    std::vector<std::string> normalizedPaths;
    for (const auto& path : paths)
    {
        std::string normalizedPath = path;
        std::replace(normalizedPath.begin(), normalizedPath.end(), '\\', '/');
        normalizedPaths.push_back(normalizedPath);
    }
    return normalizedPaths;
}

/**
 * @brief List every entry under a directory, relative to it, sorted.
 *
 * @param[in] directoryPath Path to the directory to traverse
 * @return Sorted vector of normalized relative paths
 */
inline std::vector<std::string> GetDirectoryTree(const fs::path& directoryPath)
{
    std::vector<std::string> contents;
    if ((fs::exists(directoryPath)) && (fs::is_directory(directoryPath)))
    {
        for (const auto& entry : fs::recursive_directory_iterator(directoryPath))
        {
            contents.push_back(fs::relative(entry.path(), directoryPath).string());
        }
    }
    std::sort(contents.begin(), contents.end());
    return NormalizePaths(contents);
}

/**
 * @brief Write a file, creating parent directories as needed.
 */
inline void CreateTestFile(const fs::path& path, const std::string& content = "data")
{
    fs::create_directories(path.parent_path());
    std::ofstream outputStream(path, std::ios::binary);
    ASSERT_TRUE(outputStream.good()) << "Failed to create file: " << path;
    outputStream << content;
}

inline std::string ReadTestFile(const fs::path& path)
{
    std::ifstream inputStream(path, std::ios::binary);
    EXPECT_TRUE(inputStream.good()) << "Failed to open file: " << path;
    std::stringstream buffer;
    buffer << inputStream.rdbuf();
    return buffer.str();
}

/**
 * @brief Fixture providing an empty scratch directory named after the running test.
 */
class TemporaryDirectoryTest : public ::testing::Test
{
  protected:
    fs::path rootDir;

    void SetUp() override
    {
        const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string testName = std::string(testInfo->test_suite_name()) + "_" + testInfo->name();

        rootDir = fs::temp_directory_path() / ("file_name_tools_" + testName);
        fs::remove_all(rootDir);
        fs::create_directories(rootDir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(rootDir, ec);
    }
};
