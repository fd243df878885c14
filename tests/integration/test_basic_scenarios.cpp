/**
 * @file test_basic_scenarios.cpp
 * @brief End-to-end upload scenarios through client, scheduler and server
 *
 * This file contains tests for:
 * - Large object round trip with the planner's chunking
 * - Single chunk and file uploads
 * - Server chunk size recommendation
 * - Hostile object names
 * - Resuming a cancelled upload
 */

#include "test_fixtures.h"

#include <algorithm>
#include <memory>

namespace kcenon::chunked_upload::test {

class BasicScenarioTest : public UploadFixture {};

// =============================================================================
// Round trips
// =============================================================================

TEST_F(BasicScenarioTest, LargeObjectRoundTrip) {
    auto object = make_object(test_data::large_object_size);

    auto plan = plan_transfer(object.size());
    EXPECT_EQ(plan.chunk_size, 10 * MiB);
    EXPECT_EQ(plan.concurrency, 4);
    EXPECT_EQ(plan.max_retries, 3);
    ASSERT_EQ(plan.chunk_count(), 12u);

    auto client = make_client();
    auto result = client.upload(std::make_shared<memory_chunk_source>(object), "movie.mp4");

    ASSERT_TRUE(result.has_value()) << result.error().message;
    const auto& outcome = result.value();
    EXPECT_EQ(outcome.progress.total_chunks, 12u);
    EXPECT_EQ(outcome.progress.acknowledged_chunks, 12u);
    EXPECT_EQ(outcome.progress.percent, 100u);
    EXPECT_EQ(outcome.progress.sent_bytes, object.size());
    EXPECT_EQ(outcome.response.size, object.size());
    EXPECT_EQ(outcome.response.sha256, checksum::sha256(object).value());
    EXPECT_EQ(read_file(upload_dir_ / "movie.mp4"), object);

    EXPECT_LE(transport_->max_in_flight(), 4);
    EXPECT_EQ(transport_->finalize_calls(), 1);

    auto stats = server_->get_statistics();
    EXPECT_EQ(stats.sessions_created, 1u);
    EXPECT_EQ(stats.chunks_received, 12u);
    EXPECT_EQ(stats.bytes_received, object.size());
    EXPECT_EQ(stats.objects_assembled, 1u);
    EXPECT_EQ(stats.active_sessions, 0u);
    EXPECT_EQ(temp_area_count(), 0u);
}

TEST_F(BasicScenarioTest, SmallObjectIsOneChunk) {
    auto object = make_object(test_data::small_object_size);
    auto client = make_client();

    auto result = client.upload(std::make_shared<memory_chunk_source>(object), "small.bin");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().progress.total_chunks, 1u);
    EXPECT_EQ(read_file(upload_dir_ / "small.bin"), object);
}

TEST_F(BasicScenarioTest, FileUploadWithChunkOverride) {
    auto object = make_object(test_data::medium_object_size, 7);
    auto path = write_file("local.dat", object);

    auto client = make_client(512 * 1024);
    auto result = client.upload_file(path, "remote.dat");

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result.value().progress.total_chunks, 6u);
    EXPECT_EQ(server_->get_statistics().chunks_received, 6u);
    EXPECT_EQ(read_file(upload_dir_ / "remote.dat"), object);
}

TEST_F(BasicScenarioTest, ServerRecommendedChunkSizeApplies) {
    build_server(1024 * 1024);
    auto object = make_object(test_data::medium_object_size, 9);
    auto client = make_client();

    auto started = client.start_upload(std::make_shared<memory_chunk_source>(object), "rec.bin");
    ASSERT_TRUE(started.has_value());
    auto scheduler = started.value();
    EXPECT_EQ(scheduler->effective_plan().chunk_size, 1024u * 1024u);
    // The server does not change how many chunks fly at once.
    EXPECT_EQ(scheduler->effective_plan().concurrency, plan_transfer(object.size()).concurrency);

    auto final_state = scheduler->wait();
    EXPECT_EQ(final_state.status, transfer_status::done);
    EXPECT_EQ(final_state.total_chunks, 3u);
    EXPECT_EQ(read_file(upload_dir_ / "rec.bin"), object);
}

TEST_F(BasicScenarioTest, UnevenLastChunk) {
    auto object = make_object(10 * 1000 + 1, 3);
    auto client = make_client(1000);

    auto result = client.upload(std::make_shared<memory_chunk_source>(object), "uneven.bin");

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value().progress.total_chunks, 11u);
    EXPECT_EQ(read_file(upload_dir_ / "uneven.bin"), object);
}

// =============================================================================
// Naming
// =============================================================================

TEST_F(BasicScenarioTest, HostileNamesStayInUploadDirectory) {
    auto client = make_client();
    struct named {
        const char* requested;
        const char* stored;
    };

    for (auto [requested, stored] : {named{"../etc/passwd", "__etc_passwd"},
                                     named{"a/b\\c.txt", "a_b_c.txt"},
                                     named{"what?.txt", "what_.txt"}}) {
        auto object = make_object(1000, static_cast<uint32_t>(std::string(requested).size()));
        auto result = client.upload(std::make_shared<memory_chunk_source>(object), requested);

        ASSERT_TRUE(result.has_value()) << requested;
        EXPECT_EQ(result.value().response.original_name, requested);
        EXPECT_EQ(result.value().response.sanitized_name, stored);
        EXPECT_EQ(result.value().response.final_path, upload_dir_ / stored);
        EXPECT_EQ(read_file(upload_dir_ / stored), object);
    }

    EXPECT_FALSE(std::filesystem::exists(test_dir_ / "etc"));
    EXPECT_FALSE(std::filesystem::exists(upload_dir_ / "a"));
}

TEST_F(BasicScenarioTest, SameNameTwiceKeepsLatest) {
    auto client = make_client();
    auto first = make_object(2000, 1);
    auto second = make_object(3000, 2);

    ASSERT_TRUE(client.upload(std::make_shared<memory_chunk_source>(first), "same.bin").has_value());
    ASSERT_TRUE(client.upload(std::make_shared<memory_chunk_source>(second), "same.bin").has_value());

    EXPECT_EQ(read_file(upload_dir_ / "same.bin"), second);
    EXPECT_EQ(server_->get_statistics().objects_assembled, 2u);
}

// =============================================================================
// Resume
// =============================================================================

TEST_F(BasicScenarioTest, ResumeSendsOnlyMissingChunks) {
    constexpr uint32_t chunk = 64 * 1024;
    constexpr uint32_t chunks = 10;
    auto object = make_object(static_cast<std::size_t>(chunk) * chunks, 11);
    auto source = std::make_shared<memory_chunk_source>(object);
    auto client = make_client(chunk);

    transport_->set_delay(std::chrono::milliseconds{20});
    std::string session_id;
    {
        auto started = client.start_upload(source, "resumable.bin");
        ASSERT_TRUE(started.has_value());
        auto scheduler = started.value();
        session_id = scheduler->session_id();

        ASSERT_TRUE(eventually([&] { return scheduler->progress().acknowledged_chunks >= 3; }));
        scheduler->cancel();
        EXPECT_EQ(scheduler->progress().status, transfer_status::pending);
        EXPECT_EQ(scheduler->progress().sent_bytes, 0u);
    }
    transport_->set_delay(std::chrono::milliseconds{0});

    auto received = server_->resume_session(session_id);
    ASSERT_TRUE(received.has_value());
    auto already = received.value().already_received_indices.size();
    ASSERT_GE(already, 3u);
    ASSERT_TRUE(std::is_sorted(received.value().already_received_indices.begin(),
                               received.value().already_received_indices.end()));
    auto attempts_before = transport_->total_attempts();

    auto resumed = client.resume_upload(session_id, source, "resumable.bin");
    ASSERT_TRUE(resumed.has_value());
    auto final_state = resumed.value()->wait();

    EXPECT_EQ(final_state.status, transfer_status::done);
    EXPECT_EQ(final_state.acknowledged_chunks, chunks);
    EXPECT_EQ(transport_->total_attempts() - attempts_before,
              static_cast<int>(chunks - already));
    EXPECT_EQ(read_file(upload_dir_ / "resumable.bin"), object);
    EXPECT_EQ(temp_area_count(), 0u);
}

TEST_F(BasicScenarioTest, ResumeOfCompletedSessionFails) {
    auto client = make_client();
    auto source = std::make_shared<memory_chunk_source>(make_object(5000));

    auto started = client.start_upload(source, "done.bin");
    ASSERT_TRUE(started.has_value());
    auto id = started.value()->session_id();
    ASSERT_EQ(started.value()->wait().status, transfer_status::done);

    auto resumed = client.resume_upload(id, source, "done.bin");
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, error_code::session_not_found);
}

}  // namespace kcenon::chunked_upload::test
