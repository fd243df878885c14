/**
 * @file test_chunk_source.cpp
 * @brief Unit tests for file and memory chunk sources
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/client/chunk_source.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload::test {

class ChunkSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("chunked_upload_test_source_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(i % 251);
            file.write(&byte, 1);
        }
        return path;
    }

    std::filesystem::path test_dir_;
};

TEST_F(ChunkSourceTest, FileSourceReportsSize) {
    auto path = create_test_file("sized.bin", 12345);
    auto source = file_chunk_source::open(path);
    ASSERT_TRUE(source.has_value());
    EXPECT_EQ(source.value()->size(), 12345u);
    EXPECT_EQ(source.value()->path(), path);
}

TEST_F(ChunkSourceTest, FileSourceMissingFile) {
    auto source = file_chunk_source::open(test_dir_ / "missing.bin");
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_not_found);
}

TEST_F(ChunkSourceTest, FileSourceDirectoryIsNotAFile) {
    auto source = file_chunk_source::open(test_dir_);
    ASSERT_FALSE(source.has_value());
    EXPECT_EQ(source.error().code, error_code::file_not_found);
}

TEST_F(ChunkSourceTest, FileSourceReadsRange) {
    auto source = file_chunk_source::open(create_test_file("range.bin", 1000)).value();

    auto data = source->read(500, 10);
    ASSERT_TRUE(data.has_value());
    ASSERT_EQ(data.value().size(), 10u);
    for (std::size_t i = 0; i < 10; ++i) {
        EXPECT_EQ(data.value()[i], static_cast<std::byte>((500 + i) % 251));
    }
}

TEST_F(ChunkSourceTest, FileSourceReadsTail) {
    auto source = file_chunk_source::open(create_test_file("tail.bin", 1000)).value();
    auto data = source->read(990, 10);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data.value().size(), 10u);
}

TEST_F(ChunkSourceTest, FileSourceRejectsRangePastEnd) {
    auto source = file_chunk_source::open(create_test_file("short.bin", 100)).value();

    EXPECT_EQ(source->read(95, 10).error().code, error_code::invalid_argument);
    EXPECT_EQ(source->read(101, 0).error().code, error_code::invalid_argument);
}

TEST_F(ChunkSourceTest, FileSourceConcurrentReads) {
    const std::size_t size = 64 * 1024;
    auto source = file_chunk_source::open(create_test_file("concurrent.bin", size)).value();

    std::vector<std::thread> readers;
    std::atomic<int> mismatches{0};
    for (int t = 0; t < 4; ++t) {
        readers.emplace_back([&, t] {
            for (std::size_t offset = t * 1024; offset + 1024 <= size; offset += 4096) {
                auto data = source->read(offset, 1024);
                if (!data || data.value()[0] != static_cast<std::byte>(offset % 251)) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& reader : readers) {
        reader.join();
    }
    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(ChunkSourceTest, MemorySourceReads) {
    byte_buffer buffer(100);
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        buffer[i] = static_cast<std::byte>(i);
    }
    memory_chunk_source source(buffer);

    EXPECT_EQ(source.size(), 100u);
    auto data = source.read(40, 20);
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(data.value(), byte_buffer(buffer.begin() + 40, buffer.begin() + 60));
    EXPECT_FALSE(source.read(90, 11).has_value());
}

TEST_F(ChunkSourceTest, EmptyMemorySource) {
    memory_chunk_source source(byte_buffer{});
    EXPECT_EQ(source.size(), 0u);
    EXPECT_TRUE(source.read(0, 0).has_value());
}

}  // namespace kcenon::chunked_upload::test
