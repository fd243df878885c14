/**
 * @file test_upload_server.cpp
 * @brief Unit tests for the upload server facade
 */

#include <gtest/gtest.h>

#include <kcenon/chunked_upload/core/checksum.h>
#include <kcenon/chunked_upload/core/logging.h>
#include <kcenon/chunked_upload/server/upload_server.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace kcenon::chunked_upload::test {

class UploadServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        saved_level_ = get_logger().get_level();
        get_logger().set_level(log_level::error);

        test_dir_ = std::filesystem::temp_directory_path() /
                    ("chunked_upload_test_server_" +
                     std::to_string(std::chrono::steady_clock::now()
                                        .time_since_epoch()
                                        .count()));
        upload_dir_ = test_dir_ / "uploads";
        temp_dir_ = test_dir_ / "parts";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        get_logger().set_level(saved_level_);
    }

    auto make_server(uint32_t recommended = 2048, uint64_t max_size = 0) -> upload_server {
        auto server = upload_server::builder()
            .with_upload_directory(upload_dir_)
            .with_temp_directory(temp_dir_)
            .with_recommended_chunk_size(recommended)
            .with_max_object_size(max_size)
            .build();
        EXPECT_TRUE(server.has_value());
        return std::move(server.value());
    }

    static auto payload(std::size_t size, uint8_t seed) -> byte_buffer {
        byte_buffer data(size);
        for (std::size_t i = 0; i < size; ++i) {
            data[i] = static_cast<std::byte>((i * 7 + seed) % 256);
        }
        return data;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path upload_dir_;
    std::filesystem::path temp_dir_;
    log_level saved_level_{log_level::info};
};

// =============================================================================
// Builder
// =============================================================================

TEST_F(UploadServerTest, BuildRequiresUploadDirectory) {
    auto server = upload_server::builder().build();

    ASSERT_FALSE(server.has_value());
    EXPECT_EQ(server.error().code, error_code::invalid_argument);
}

TEST_F(UploadServerTest, BuildRejectsSharedTempDirectory) {
    auto server = upload_server::builder()
        .with_upload_directory(upload_dir_)
        .with_temp_directory(upload_dir_)
        .build();

    ASSERT_FALSE(server.has_value());
    EXPECT_EQ(server.error().code, error_code::invalid_argument);
}

TEST_F(UploadServerTest, BuildCreatesDirectories) {
    auto server = make_server();

    EXPECT_TRUE(std::filesystem::is_directory(upload_dir_));
    EXPECT_TRUE(std::filesystem::is_directory(temp_dir_));
    EXPECT_EQ(server.config().upload_directory, upload_dir_);
    EXPECT_EQ(server.config().recommended_chunk_size, 2048u);
}

TEST_F(UploadServerTest, DefaultTempDirectoryIsSibling) {
    auto server = upload_server::builder().with_upload_directory(upload_dir_).build();

    ASSERT_TRUE(server.has_value());
    EXPECT_EQ(server.value().config().resolved_temp_directory(), test_dir_ / "tmp_uploads");
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "tmp_uploads"));
    EXPECT_EQ(server.value().config().recommended_chunk_size, 10 * MiB);
}

TEST_F(UploadServerTest, TrailingSeparatorKeepsTempDirectoryOutside) {
    auto server = upload_server::builder().with_upload_directory(upload_dir_ / "").build();

    ASSERT_TRUE(server.has_value()) << server.error().message;
    EXPECT_EQ(server.value().config().resolved_temp_directory(), test_dir_ / "tmp_uploads");
    EXPECT_TRUE(std::filesystem::is_directory(test_dir_ / "tmp_uploads"));
    EXPECT_FALSE(std::filesystem::exists(upload_dir_ / "tmp_uploads"));
}

TEST_F(UploadServerTest, BuildRejectsTempDirectoryInsideUploadDirectory) {
    auto nested = upload_server::builder()
        .with_upload_directory(upload_dir_)
        .with_temp_directory(upload_dir_ / "parts")
        .build();
    ASSERT_FALSE(nested.has_value());
    EXPECT_EQ(nested.error().code, error_code::invalid_argument);

    auto same_with_separator = upload_server::builder()
        .with_upload_directory(upload_dir_ / "")
        .with_temp_directory(upload_dir_)
        .build();
    ASSERT_FALSE(same_with_separator.has_value());
    EXPECT_EQ(same_with_separator.error().code, error_code::invalid_argument);

    // A sibling whose name starts with the upload directory's name is fine.
    auto sibling = upload_server::builder()
        .with_upload_directory(upload_dir_)
        .with_temp_directory(test_dir_ / "uploads_parts")
        .build();
    EXPECT_TRUE(sibling.has_value());
}

// =============================================================================
// Sessions
// =============================================================================

TEST_F(UploadServerTest, InitReturnsRecommendedChunkSize) {
    auto server = make_server(4096);
    auto session = server.init_session({"a.bin", 10000, "application/octet-stream"});

    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session.value().session_id.size(), 32u);
    EXPECT_EQ(session.value().recommended_chunk_size, 4096u);
    EXPECT_TRUE(session.value().already_received_indices.empty());
    EXPECT_TRUE(std::filesystem::is_directory(temp_dir_ / session.value().session_id));
}

TEST_F(UploadServerTest, ZeroRecommendationLeavesChoiceToClient) {
    auto server = make_server(0);
    auto session = server.init_session({"a.bin", 10000, ""});

    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session.value().recommended_chunk_size, 0u);
}

TEST_F(UploadServerTest, InitRejectsInvalidRequests) {
    auto server = make_server(2048, 5000);

    EXPECT_EQ(server.init_session({"", 100, ""}).error().code, error_code::invalid_argument);
    EXPECT_EQ(server.init_session({"a.bin", 0, ""}).error().code, error_code::invalid_argument);
    EXPECT_EQ(server.init_session({"a.bin", 5001, ""}).error().code,
              error_code::object_too_large);
    EXPECT_TRUE(server.init_session({"a.bin", 5000, ""}).has_value());

    EXPECT_EQ(server.get_statistics().sessions_created, 1u);
}

TEST_F(UploadServerTest, ResumeListsStoredChunksSorted) {
    auto server = make_server();
    auto id = server.init_session({"r.bin", 5000, ""}).value().session_id;

    for (uint32_t index : {4u, 0u, 2u}) {
        ASSERT_TRUE(server.put_chunk(id, index, payload(1000, 1)).has_value());
    }
    // Files that are not chunk records are ignored.
    std::ofstream(temp_dir_ / id / "notes.txt") << "x";

    auto resumed = server.resume_session(id);
    ASSERT_TRUE(resumed.has_value());
    EXPECT_EQ(resumed.value().session_id, id);
    EXPECT_EQ(resumed.value().recommended_chunk_size, 2048u);
    EXPECT_EQ(resumed.value().already_received_indices, (std::vector<uint32_t>{0, 2, 4}));
}

TEST_F(UploadServerTest, ResumeUnknownSession) {
    auto server = make_server();

    auto resumed = server.resume_session("0123456789abcdef0123456789abcdef");
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, error_code::session_not_found);
    EXPECT_EQ(server.resume_session("../../etc").error().code, error_code::session_not_found);
}

// =============================================================================
// Chunks and assembly
// =============================================================================

TEST_F(UploadServerTest, PutAndFinalizeProduceObject) {
    auto server = make_server();
    auto first = payload(1000, 1);
    auto second = payload(500, 2);
    auto id = server.init_session({"obj.bin", 1500, ""}).value().session_id;

    ASSERT_TRUE(server.put_chunk(id, 1, second, checksum::crc32(second)).has_value());
    ASSERT_TRUE(server.put_chunk(id, 0, first, checksum::crc32(first)).has_value());

    auto done = server.finalize(id, 2, "obj.bin");
    ASSERT_TRUE(done.has_value()) << done.error().message;
    EXPECT_TRUE(done.value().ok);
    EXPECT_EQ(done.value().final_path, upload_dir_ / "obj.bin");
    EXPECT_EQ(done.value().size, 1500u);

    byte_buffer whole = first;
    whole.insert(whole.end(), second.begin(), second.end());
    EXPECT_EQ(done.value().sha256, checksum::sha256(whole).value());
    EXPECT_FALSE(std::filesystem::exists(temp_dir_ / id));
}

TEST_F(UploadServerTest, StatisticsCountOnlySuccesses) {
    auto server = make_server();
    auto id = server.init_session({"s.bin", 300, ""}).value().session_id;
    auto data = payload(100, 3);

    ASSERT_TRUE(server.put_chunk(id, 0, data).has_value());
    ASSERT_TRUE(server.put_chunk(id, 1, data).has_value());
    EXPECT_FALSE(server.put_chunk(id, 2, data, checksum::crc32(data) ^ 1u).has_value());
    EXPECT_FALSE(server.finalize(id, 3, "s.bin").has_value());

    auto stats = server.get_statistics();
    EXPECT_EQ(stats.sessions_created, 1u);
    EXPECT_EQ(stats.chunks_received, 2u);
    EXPECT_EQ(stats.bytes_received, 200u);
    EXPECT_EQ(stats.objects_assembled, 0u);
    EXPECT_EQ(stats.active_sessions, 1u);

    ASSERT_TRUE(server.put_chunk(id, 2, data).has_value());
    ASSERT_TRUE(server.finalize(id, 3, "s.bin").has_value());

    stats = server.get_statistics();
    EXPECT_EQ(stats.chunks_received, 3u);
    EXPECT_EQ(stats.objects_assembled, 1u);
    EXPECT_EQ(stats.active_sessions, 0u);
}

TEST_F(UploadServerTest, PurgeCountsExpiredSessions) {
    auto server = make_server();
    ASSERT_TRUE(server.init_session({"a.bin", 10, ""}).has_value());
    ASSERT_TRUE(server.init_session({"b.bin", 10, ""}).has_value());

    EXPECT_EQ(server.purge_expired(std::chrono::hours{1}), 0u);
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    EXPECT_EQ(server.purge_expired(std::chrono::seconds{0}), 2u);

    auto stats = server.get_statistics();
    EXPECT_EQ(stats.sessions_expired, 2u);
    EXPECT_EQ(stats.active_sessions, 0u);
}

TEST_F(UploadServerTest, MovedServerKeepsSessions) {
    auto server = make_server();
    auto id = server.init_session({"m.bin", 100, ""}).value().session_id;

    upload_server moved = std::move(server);
    ASSERT_TRUE(moved.put_chunk(id, 0, payload(100, 4)).has_value());
    EXPECT_TRUE(moved.finalize(id, 1, "m.bin").has_value());
    EXPECT_TRUE(std::filesystem::exists(upload_dir_ / "m.bin"));
}

}  // namespace kcenon::chunked_upload::test
