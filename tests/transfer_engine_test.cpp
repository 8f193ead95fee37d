#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <optional>
#include "core/transfer_engine/transfer_engine.hpp"
#include "core/transfer_engine/upload_flavor.hpp"
#include "core/transfer_engine/download_flavor.hpp"
#include "support/fake_object_store.hpp"
#include "support/temp_dir.hpp"

using namespace persevere;
using core::DownloadFlavor;
using core::TransferEngine;
using core::TransferRequest;
using core::UploadFlavor;
using infra::ErrorCode;
using test_support::FakeObjectStore;
using test_support::MockObjectStore;
using test_support::TempDir;

namespace {

// Byte-sized parts keep the fixtures small.
constexpr core::ServiceLimits kTinyLimits{
    .min_part_size = 1,
    .max_part_size = core::GiB,
    .max_part_count = 10'000,
    .min_object_size = 1,
    .max_object_size = core::TiB,
};

auto load(const std::filesystem::path& path) -> extensions::TransferState {
    auto state = extensions::load_state(path);
    EXPECT_TRUE(state.has_value()) << state.error().message;
    return state.value_or(extensions::TransferState{});
}

auto calls_since(const FakeObjectStore& store, std::size_t from) -> std::vector<std::string> {
    return {store.calls.begin() + static_cast<std::ptrdiff_t>(from), store.calls.end()};
}

} // namespace

class UploadEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_support::write_file(source, data);
    }

    auto request(std::optional<std::uint64_t> part_size = 5) const -> TransferRequest {
        return TransferRequest{
            .store = "fake",
            .bucket = "bucket",
            .key = "backups/data.bin",
            .local_path = source,
            .part_size = part_size,
        };
    }

    auto start(FakeObjectStore& target) -> infra::Result<core::TransferReport> {
        UploadFlavor flavor(target, kTinyLimits);
        TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
        return engine.start(request(), state_file);
    }

    auto resume(FakeObjectStore& target) -> infra::Result<core::TransferReport> {
        UploadFlavor flavor(target, kTinyLimits);
        TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
        return engine.resume(state_file);
    }

    TempDir dir;
    std::filesystem::path source = dir / "source.bin";
    std::filesystem::path state_file = dir / "state.json";
    std::string data = test_support::pattern_bytes(12);
    FakeObjectStore store;
    infra::ProgressMonitor monitor{false};
};

TEST_F(UploadEngineTest, UploadsAllPartsInOrderAndRemovesState)
{
    auto report = start(store);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    EXPECT_EQ(store.calls, (std::vector<std::string>{
        "create", "upload_part 1", "upload_part 2", "upload_part 3", "complete"}));
    EXPECT_EQ(store.object_data({"bucket", "backups/data.bin"}), data);
    EXPECT_EQ(report->parts_total, 3u);
    EXPECT_EQ(report->parts_transferred, 3u);
    EXPECT_EQ(report->bytes_transferred, 12u);
    EXPECT_EQ(report->e_tag, "final-3");
    EXPECT_FALSE(std::filesystem::exists(state_file));
    EXPECT_EQ(monitor.get_stats().processed_parts, 3u);
}

TEST_F(UploadEngineTest, ServiceLimitsGiveFiveMebibyteParts)
{
    data = test_support::pattern_bytes(12 * core::MiB);
    test_support::write_file(source, data);

    UploadFlavor flavor(store);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    auto report = engine.start(request(5 * core::MiB), state_file);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    const auto& upload = store.uploads.begin()->second;
    ASSERT_TRUE(upload.completed);
    EXPECT_EQ(store.completed_with.size(), 3u);
    EXPECT_EQ(store.object_data({"bucket", "backups/data.bin"}), data);
}

TEST_F(UploadEngineTest, RefusesToStartOverAnExistingStateFile)
{
    test_support::write_file(state_file, "{}");

    auto report = start(store);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::AlreadyExists);
    EXPECT_TRUE(store.calls.empty());
    EXPECT_EQ(test_support::read_file(state_file), "{}");
}

TEST_F(UploadEngineTest, NonUtf8NameIsRejectedBeforeCreating)
{
    auto req = request();
    req.key = "backups/\xff\xfe.bin";

    UploadFlavor flavor(store, kTinyLimits);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    auto result = engine.start(req, state_file);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(store.calls.empty());
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

TEST_F(UploadEngineTest, FailedCreationLeavesNoState)
{
    store.fail_next("create");

    auto report = start(store);
    ASSERT_FALSE(report.has_value());
    EXPECT_TRUE(report.error().is_unrecoverable());
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

TEST_F(UploadEngineTest, SourceTooSmallForServiceIsRejectedBeforeCreating)
{
    UploadFlavor flavor(store);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    auto report = engine.start(request(std::nullopt), state_file);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(store.calls.empty());
}

TEST_F(UploadEngineTest, ExhaustedRetriesKeepProgressForResume)
{
    store.fail_next("upload_part 2", 3);

    auto report = start(store);
    ASSERT_FALSE(report.has_value());
    EXPECT_TRUE(report.error().is_retryable());
    EXPECT_EQ(report.error().to_exit_code(), infra::kExitResumable);
    EXPECT_EQ(store.count_calls("upload_part 2"), 3u);
    EXPECT_EQ(store.count_calls("upload_part 3"), 0u);
    EXPECT_EQ(store.count_calls("abort"), 0u);

    const auto state = load(state_file);
    EXPECT_EQ(state.last_completed_part, 1u);
    ASSERT_EQ(state.completed_parts.size(), 1u);
    EXPECT_EQ(state.completed_parts[0].part_number, 1u);
    EXPECT_FALSE(state.failure.has_value());

    const auto before = store.calls.size();
    auto resumed = resume(store);
    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(calls_since(store, before), (std::vector<std::string>{
        "upload_part 2", "upload_part 3", "complete"}));
    EXPECT_EQ(resumed->parts_transferred, 2u);
    EXPECT_EQ(store.object_data({"bucket", "backups/data.bin"}), data);
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

TEST_F(UploadEngineTest, TransientFailureWithinAttemptsIsInvisible)
{
    store.fail_next("upload_part 1", 2);

    auto report = start(store);
    ASSERT_TRUE(report.has_value()) << report.error().message;
    EXPECT_EQ(store.count_calls("upload_part 1"), 3u);
}

TEST_F(UploadEngineTest, NetworkTimeoutsAreRetriedAndKeepTheirCode)
{
    store.fail_next("upload_part 2", 3, ErrorCode::NetworkTimeout);

    auto first = start(store);
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::NetworkTimeout);
    EXPECT_TRUE(first.error().is_retryable());
    EXPECT_EQ(first.error().to_exit_code(), infra::kExitResumable);
    EXPECT_EQ(store.count_calls("upload_part 2"), 3u);

    auto resumed = resume(store);
    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(resumed->parts_transferred, 2u);
}

TEST_F(UploadEngineTest, UnrecoverableFailureAbortsRemoteUploadAndKeepsState)
{
    // The source shrinks underneath the upload of part 2.
    store.before_upload_part = [this](std::uint64_t part_number) {
        if (part_number == 2) {
            std::filesystem::resize_file(source, 5);
        }
    };

    auto report = start(store);
    ASSERT_FALSE(report.has_value());
    EXPECT_TRUE(report.error().is_unrecoverable());
    EXPECT_EQ(report.error().code, ErrorCode::SizeMismatch);

    EXPECT_EQ(store.count_calls("upload_part 2"), 1u);
    EXPECT_EQ(store.count_calls("upload_part 3"), 0u);
    EXPECT_EQ(store.count_calls("abort"), 1u);
    EXPECT_EQ(store.count_calls("complete"), 0u);
    EXPECT_TRUE(store.uploads.begin()->second.aborted);

    ASSERT_TRUE(std::filesystem::exists(state_file));
    const auto state = load(state_file);
    EXPECT_EQ(state.last_completed_part, 1u);
    ASSERT_TRUE(state.failure.has_value());
    EXPECT_TRUE(state.remote_aborted);

    const auto before = store.calls.size();
    auto resumed = resume(store);
    ASSERT_FALSE(resumed.has_value());
    EXPECT_TRUE(resumed.error().is_unrecoverable());
    EXPECT_EQ(store.calls.size(), before);
}

TEST_F(UploadEngineTest, FailedCancellationIsRecordedInState)
{
    store.before_upload_part = [this](std::uint64_t part_number) {
        if (part_number == 2) {
            std::filesystem::resize_file(source, 5);
        }
    };
    store.fail_next("abort");

    auto report = start(store);
    ASSERT_FALSE(report.has_value());
    const auto state = load(state_file);
    EXPECT_TRUE(state.failure.has_value());
    EXPECT_FALSE(state.remote_aborted);

    // An explicit abort gets another go at it.
    UploadFlavor flavor(store, kTinyLimits);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    ASSERT_TRUE(engine.abort(state_file).has_value());
    EXPECT_EQ(store.count_calls("abort"), 2u);
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

TEST_F(UploadEngineTest, ResumeAfterCrashMatchesUninterruptedRun)
{
    FakeObjectStore uninterrupted;
    ASSERT_TRUE(start(uninterrupted).has_value());

    // Snapshot the store and the state file as a crash before part 3 would leave them.
    std::optional<FakeObjectStore> crashed;
    const auto crashed_state = dir / "crashed.json";
    store.before_upload_part = [&](std::uint64_t part_number) {
        if (part_number == 3 && !crashed) {
            crashed.emplace(store);
            crashed->before_upload_part = nullptr;
            std::filesystem::copy_file(state_file, crashed_state);
        }
    };
    ASSERT_TRUE(start(store).has_value());
    ASSERT_TRUE(crashed.has_value());

    EXPECT_EQ(load(crashed_state).last_completed_part, 2u);
    std::filesystem::rename(crashed_state, state_file);

    const auto before = crashed->calls.size();
    auto resumed = resume(*crashed);
    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(calls_since(*crashed, before), (std::vector<std::string>{"upload_part 3", "complete"}));
    EXPECT_EQ(crashed->completed_with, uninterrupted.completed_with);
    EXPECT_EQ(crashed->object_data({"bucket", "backups/data.bin"}),
              uninterrupted.object_data({"bucket", "backups/data.bin"}));
}

TEST_F(UploadEngineTest, FailedCompletionIsRetriedOnResume)
{
    store.fail_next("complete");

    auto report = start(store);
    ASSERT_FALSE(report.has_value());
    EXPECT_TRUE(report.error().is_retryable());
    EXPECT_EQ(load(state_file).last_completed_part, 3u);

    const auto before = store.calls.size();
    auto resumed = resume(store);
    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(calls_since(store, before), (std::vector<std::string>{"complete"}));
    EXPECT_EQ(resumed->parts_transferred, 0u);
}

TEST_F(UploadEngineTest, ResumeRefusesChangedSource)
{
    store.fail_next("upload_part 2", 3);
    ASSERT_FALSE(start(store).has_value());

    test_support::write_file(source, data + "more");
    const auto before = store.calls.size();
    auto resumed = resume(store);
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, ErrorCode::SizeMismatch);
    EXPECT_EQ(store.calls.size(), before);
    EXPECT_TRUE(std::filesystem::exists(state_file));
}

TEST_F(UploadEngineTest, AbortWithoutCompletedPartsCancelsAndDeletesState)
{
    store.fail_next("upload_part 1", 3);
    ASSERT_FALSE(start(store).has_value());
    EXPECT_EQ(load(state_file).last_completed_part, 0u);

    UploadFlavor flavor(store, kTinyLimits);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    ASSERT_TRUE(engine.abort(state_file).has_value());

    EXPECT_EQ(store.calls.back(), "abort");
    EXPECT_TRUE(store.uploads.begin()->second.aborted);
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

TEST_F(UploadEngineTest, FailedAbortKeepsStateFile)
{
    store.fail_next("upload_part 1", 3);
    ASSERT_FALSE(start(store).has_value());
    store.fail_next("abort");

    UploadFlavor flavor(store, kTinyLimits);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    auto aborted = engine.abort(state_file);
    ASSERT_FALSE(aborted.has_value());
    EXPECT_TRUE(aborted.error().is_retryable());
    EXPECT_TRUE(std::filesystem::exists(state_file));
}

TEST_F(UploadEngineTest, DownloadCommandsRefuseUploadState)
{
    store.fail_next("upload_part 1", 3);
    ASSERT_FALSE(start(store).has_value());

    DownloadFlavor flavor(store, kTinyLimits);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    auto resumed = engine.resume(state_file);
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(engine.abort(state_file).has_value());
    EXPECT_TRUE(std::filesystem::exists(state_file));
}

TEST(UploadAbortTest, AbortCallsStoreWithRecordedUploadId)
{
    using ::testing::_;
    using ::testing::Eq;
    using ::testing::Return;

    TempDir dir;
    const auto state_file = dir / "state.json";
    extensions::TransferState state;
    state.direction = core::Direction::Upload;
    state.store = "mock";
    state.bucket = "bucket";
    state.key = "key";
    state.local_path = dir / "source.bin";
    state.object_size = 12;
    state.part_size = 5;
    state.part_count = 3;
    state.upload_id = "u-1";
    ASSERT_TRUE(extensions::StateHandle::create(state_file, state).has_value());

    MockObjectStore store;
    EXPECT_CALL(store, abort_multipart_upload(_, Eq(std::string_view("u-1"))))
        .WillOnce(Return(infra::VoidResult{}));
    EXPECT_CALL(store, upload_part(_, _, _, _, _)).Times(0);
    EXPECT_CALL(store, complete_multipart_upload(_, _, _)).Times(0);

    infra::ProgressMonitor monitor{false};
    UploadFlavor flavor(store);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    ASSERT_TRUE(engine.abort(state_file).has_value());
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

class DownloadEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        store.put_object({"bucket", "media/clip.bin"}, data);
    }

    auto request(std::uint64_t part_size = 3) const -> TransferRequest {
        return TransferRequest{
            .store = "fake",
            .bucket = "bucket",
            .key = "media/clip.bin",
            .local_path = output,
            .part_size = part_size,
        };
    }

    auto engine_start() -> infra::Result<core::TransferReport> {
        DownloadFlavor flavor(store);
        TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
        return engine.start(request(), state_file);
    }

    auto engine_resume() -> infra::Result<core::TransferReport> {
        DownloadFlavor flavor(store);
        TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
        return engine.resume(state_file);
    }

    TempDir dir;
    std::filesystem::path output = dir / "clip.bin";
    std::filesystem::path state_file = dir / "state.json";
    std::string data = test_support::pattern_bytes(10);
    FakeObjectStore store;
    infra::ProgressMonitor monitor{false};
};

TEST_F(DownloadEngineTest, DownloadsRangesIntoPreallocatedFile)
{
    auto report = engine_start();
    ASSERT_TRUE(report.has_value()) << report.error().message;

    EXPECT_EQ(store.calls, (std::vector<std::string>{
        "head", "get 0-2", "get 3-5", "get 6-8", "get 9-9"}));
    EXPECT_EQ(test_support::read_file(output), data);
    EXPECT_EQ(report->parts_transferred, 4u);
    EXPECT_TRUE(report->e_tag.empty());
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

TEST_F(DownloadEngineTest, ExhaustedRetriesResumeFromFailedPart)
{
    store.fail_next("get 3-5", 3);

    auto report = engine_start();
    ASSERT_FALSE(report.has_value());
    EXPECT_TRUE(report.error().is_retryable());
    EXPECT_EQ(load(state_file).last_completed_part, 1u);
    EXPECT_EQ(std::filesystem::file_size(output), data.size());

    const auto before = store.calls.size();
    auto resumed = engine_resume();
    ASSERT_TRUE(resumed.has_value()) << resumed.error().message;
    EXPECT_EQ(calls_since(store, before), (std::vector<std::string>{
        "head", "get 3-5", "get 6-8", "get 9-9"}));
    EXPECT_EQ(test_support::read_file(output), data);
}

TEST_F(DownloadEngineTest, RefusesExistingOutput)
{
    test_support::write_file(output, "keep me");

    auto report = engine_start();
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, ErrorCode::AlreadyExists);
    EXPECT_EQ(test_support::read_file(output), "keep me");
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

TEST_F(DownloadEngineTest, MissingObjectIsUnrecoverable)
{
    store.objects.clear();

    auto report = engine_start();
    ASSERT_FALSE(report.has_value());
    EXPECT_TRUE(report.error().is_unrecoverable());
    EXPECT_FALSE(std::filesystem::exists(state_file));
}

TEST_F(DownloadEngineTest, ResumeRefusesChangedObject)
{
    store.fail_next("get 3-5", 3);
    ASSERT_FALSE(engine_start().has_value());

    store.put_object({"bucket", "media/clip.bin"}, data + "x");
    auto resumed = engine_resume();
    ASSERT_FALSE(resumed.has_value());
    EXPECT_EQ(resumed.error().code, ErrorCode::SizeMismatch);
    EXPECT_TRUE(std::filesystem::exists(state_file));
}

TEST_F(DownloadEngineTest, AbortDeletesStateAndLeavesPartialOutput)
{
    store.fail_next("get 3-5", 3);
    ASSERT_FALSE(engine_start().has_value());

    DownloadFlavor flavor(store);
    TransferEngine engine(flavor, infra::RetryPolicy{}, monitor);
    ASSERT_TRUE(engine.abort(state_file).has_value());
    EXPECT_FALSE(std::filesystem::exists(state_file));
    EXPECT_TRUE(std::filesystem::exists(output));
}

TEST_F(DownloadEngineTest, DeletedOutputIsUnrecoverableOnResume)
{
    store.fail_next("get 3-5", 3);
    ASSERT_FALSE(engine_start().has_value());
    std::filesystem::remove(output);

    auto resumed = engine_resume();
    ASSERT_FALSE(resumed.has_value());
    EXPECT_TRUE(resumed.error().is_unrecoverable());
}
