#include "scratch_dir.hpp"
#include <managers/forager_service.hpp>
#include <core/constants.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <set>

namespace {

class FakeUploader : public Uploader {
public:
    std::vector<std::string> uploaded;     // upload names, in call order
    std::set<std::string> fail_names;
    std::function<void()> on_upload;

    Result<void> upload(const UploadRequest& request) override {
        if (fail_names.count(request.upload_name)) {
            return Result<void>::Err("connection reset");
        }
        uploaded.push_back(request.upload_name);
        if (on_upload) on_upload();
        return Result<void>::Ok();
    }

    std::string describe() const override { return "fake://"; }
};

} // namespace

class ForagerServiceTest : public ScratchDirTest {
protected:
    RunConfig config;
    Metadata metadata = {
        {"upload_name", "survey"}, {"site", "north"}, {"sensor", "cam01"},
        {"project", "forage"}, {"creator", "ops"}, {"device_name", "pi-7"},
    };
    std::shared_ptr<FakeUploader> uploader = std::make_shared<FakeUploader>();
    std::vector<std::pair<std::string, std::string>> published;

    static constexpr double T = 1700000000;

    void SetUp() override {
        ScratchDirTest::SetUp();
        config.source = test_dir.string();
        config.state_dir = (test_dir / STATE_DIR_NAME).string();
        config.sleep_secs = 0;
        config.skip_last_n = 1;
        config.num_files = 10;
        config.sort_key = SortKey::MTIME;
    }

    // A fresh service per call, as a new process would see it
    RunStats run_once() {
        published.clear();
        ForagerService service(config, metadata, uploader,
                               [this](const std::string& topic, const std::string& msg) {
                                   published.emplace_back(topic, msg);
                               });
        auto result = service.run();
        EXPECT_TRUE(result.is_ok()) << result.error;
        return result.value;
    }

    size_t uploaded_rows() {
        return count_lines(test_dir / STATE_DIR_NAME / UPLOADED_CSV) - 1;
    }

    nlohmann::json stats_message() {
        for (const auto& [topic, msg] : published) {
            if (topic == TOPIC_STATS) return nlohmann::json::parse(msg);
        }
        ADD_FAILURE() << "no upload.stats message";
        return nlohmann::json::object();
    }
};

TEST_F(ForagerServiceTest, NewestFileHeldBackUntilSomethingNewer) {
    write_file("a.txt", 4, T);
    write_file("b.txt", 4, T + 10);
    write_file("c.txt", 4, T + 20);

    auto first = run_once();
    EXPECT_EQ(uploader->uploaded, (std::vector<std::string>{"a.txt", "b.txt"}));
    EXPECT_EQ(first.files_uploaded, 2);
    EXPECT_EQ(uploaded_rows(), 2u);

    auto second = run_once();
    EXPECT_EQ(second.files_uploaded, 0);
    EXPECT_EQ(uploader->uploaded.size(), 2u);

    write_file("d.txt", 4, T + 30);
    auto third = run_once();
    EXPECT_EQ(third.files_uploaded, 1);
    EXPECT_EQ(uploader->uploaded.back(), "c.txt");
}

TEST_F(ForagerServiceTest, NoPathUploadedTwiceAcrossRuns) {
    config.skip_last_n = 0;
    config.num_files = 2;
    for (int i = 0; i < 5; ++i) {
        write_file("f" + std::to_string(i) + ".dat", 4, T + i);
    }

    for (int run = 0; run < 4; ++run) run_once();

    std::set<std::string> unique(uploader->uploaded.begin(), uploader->uploaded.end());
    EXPECT_EQ(uploader->uploaded.size(), 5u);
    EXPECT_EQ(unique.size(), 5u);
    EXPECT_EQ(uploaded_rows(), 5u);
}

TEST_F(ForagerServiceTest, OversizedFileRecordedAndNeverRetried) {
    config.skip_last_n = 0;
    config.max_file_size = 10;
    write_file("small.bin", 10, T);
    write_file("big.bin", 11, T + 1);

    auto first = run_once();
    EXPECT_EQ(uploader->uploaded, (std::vector<std::string>{"small.bin"}));
    EXPECT_EQ(first.skipped[STAT_OVERSIZED], 1);

    bool reported = false;
    for (const auto& [topic, msg] : published) {
        if (topic == TOPIC_ERROR && msg.find("big.bin") != std::string::npos) reported = true;
    }
    EXPECT_TRUE(reported);

    config.max_file_size = 0;
    auto second = run_once();
    EXPECT_EQ(second.files_uploaded, 0);
    EXPECT_EQ(second.skipped[STAT_ALREADY_PROCESSED], 2);
}

TEST_F(ForagerServiceTest, DryRunLeavesLedgerUntouched) {
    config.skip_last_n = 0;
    config.dry_run = true;
    write_file("a.txt", 4, T);
    write_file("b.txt", 4, T + 1);

    auto dry = run_once();
    EXPECT_EQ(dry.dry_run_files, 2);
    EXPECT_TRUE(uploader->uploaded.empty());
    EXPECT_EQ(uploaded_rows(), 0u);

    config.dry_run = false;
    auto real = run_once();
    EXPECT_EQ(real.files_uploaded, 2);
}

TEST_F(ForagerServiceTest, FailedUploadRetriedNextRun) {
    config.skip_last_n = 0;
    write_file("a.txt", 4, T);
    write_file("b.txt", 4, T + 1);
    uploader->fail_names = {"a.txt"};

    auto first = run_once();
    EXPECT_EQ(first.errors, 1);
    EXPECT_EQ(first.files_uploaded, 1);
    EXPECT_TRUE(fs::exists(test_dir / STATE_DIR_NAME / PROCESSING_LOG));

    uploader->fail_names.clear();
    auto second = run_once();
    EXPECT_EQ(second.files_uploaded, 1);
    EXPECT_EQ(uploader->uploaded.back(), "a.txt");
}

TEST_F(ForagerServiceTest, StateDirectoryIsNeverScanned) {
    config.skip_last_n = 0;
    config.recursive = true;
    write_file("data/a.txt", 4, T);

    run_once();
    auto second = run_once();

    EXPECT_EQ(uploader->uploaded, (std::vector<std::string>{"a.txt"}));
    EXPECT_EQ(second.files_scanned, 1);
}

TEST_F(ForagerServiceTest, PublishesStatsWithDeviceName) {
    config.skip_last_n = 0;
    write_file("a.txt", 4, T);

    run_once();
    auto stats = stats_message();
    EXPECT_EQ(stats["device_name"], "pi-7");
    EXPECT_EQ(stats["files_scanned"], 1);
    EXPECT_EQ(stats["files_uploaded"], 1);
    EXPECT_EQ(stats["bytes_uploaded"], 4);
    EXPECT_EQ(stats["errors"], 0);

    bool started = false;
    for (const auto& [topic, msg] : published) {
        if (topic != TOPIC_STATUS) continue;
        auto body = nlohmann::json::parse(msg);
        EXPECT_EQ(body["device_name"], "pi-7");
        if (body["message"] == "Batch started") started = true;
    }
    EXPECT_TRUE(started);
}

TEST_F(ForagerServiceTest, UnknownDeviceName) {
    metadata.erase("device_name");
    ForagerService service(config, metadata, uploader);
    EXPECT_EQ(service.device_name(), "unknown");
}

TEST_F(ForagerServiceTest, MissingSourceIsAnError) {
    config.source = (test_dir / "absent").string();
    ForagerService service(config, metadata, uploader);
    auto result = service.run();
    EXPECT_TRUE(result.is_err());
}

TEST_F(ForagerServiceTest, LedgerWriteFailureAbortsRun) {
    config.skip_last_n = 0;
    write_file("a.txt", 4, T);
    write_file("b.txt", 4, T + 1);

    // Swap the uploaded log for a directory mid-run so the append fails
    fs::path csv = test_dir / STATE_DIR_NAME / UPLOADED_CSV;
    uploader->on_upload = [csv]() {
        fs::remove(csv);
        fs::create_directories(csv);
    };

    ForagerService service(config, metadata, uploader);
    EXPECT_THROW(service.run(), LedgerWriteError);
    // Stopped after the first upload could not be recorded
    EXPECT_EQ(uploader->uploaded.size(), 1u);
}

TEST(ForagerServiceStats, JsonShape) {
    RunStats stats;
    stats.files_scanned = 7;
    stats.skipped["deferred"] = 1;
    stats.skipped["already_processed"] = 3;
    stats.files_uploaded = 3;
    stats.bytes_uploaded = 300;

    auto body = nlohmann::json::parse(ForagerService::stats_json(stats, "pi-7"));
    EXPECT_EQ(body["files_skipped"], 4);
    EXPECT_EQ(body["skipped"]["deferred"], 1);
    EXPECT_EQ(body["device_name"], "pi-7");
    EXPECT_EQ(body["interrupted"], false);
}

TEST_F(ForagerServiceTest, LedgerPathNotAFileFailsAtStartup) {
    write_file("a.txt", 4, T);
    fs::create_directories(test_dir / STATE_DIR_NAME / UPLOADED_CSV);

    ForagerService service(config, metadata, uploader);
    EXPECT_THROW(service.run(), LedgerWriteError);
    EXPECT_TRUE(uploader->uploaded.empty());
}
