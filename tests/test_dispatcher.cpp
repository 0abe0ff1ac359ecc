#include "scratch_dir.hpp"
#include <managers/dispatcher.hpp>
#include <core/constants.hpp>
#include <set>

namespace {

// Records every request; fails the names listed in fail_names.
class FakeUploader : public Uploader {
public:
    std::vector<UploadRequest> requests;
    std::set<std::string> fail_names;

    Result<void> upload(const UploadRequest& request) override {
        requests.push_back(request);
        if (fail_names.count(request.upload_name)) {
            return Result<void>::Err("remote refused " + request.upload_name);
        }
        return Result<void>::Ok();
    }

    std::string describe() const override { return "fake://"; }
};

} // namespace

class DispatcherTest : public ScratchDirTest {
protected:
    RunConfig config;
    Metadata metadata = {{"site", "north"}, {"upload_name", "batch"}};
    FakeUploader uploader;
    std::vector<std::pair<std::string, std::string>> published;

    void SetUp() override {
        ScratchDirTest::SetUp();
        config.source = test_dir.string();
        config.state_dir = (test_dir / ".forager").string();
        config.sleep_secs = 0;
    }

    PublishCallback recorder() {
        return [this](const std::string& topic, const std::string& msg) {
            published.emplace_back(topic, msg);
        };
    }

    FileRecord make(const std::string& name, double mtime = 1700000000) {
        auto path = write_file(name, 16, mtime);
        FileRecord r;
        r.path = path.string();
        r.name = name;
        r.size_bytes = 16;
        r.mtime = mtime;
        return r;
    }

    size_t count_topic(const std::string& topic) {
        size_t n = 0;
        for (const auto& [t, m] : published) {
            if (t == topic) n++;
        }
        return n;
    }
};

TEST_F(DispatcherTest, UploadsInOrderAndRecords) {
    Ledger ledger(config.state_dir);
    ledger.load();
    auto a = make("a.txt");
    auto b = make("b.txt");

    RunStats stats;
    Dispatcher dispatcher(config, ledger, &uploader, metadata, recorder());
    dispatcher.dispatch({a, b}, stats);

    ASSERT_EQ(uploader.requests.size(), 2u);
    EXPECT_EQ(uploader.requests[0].upload_name, "a.txt");
    EXPECT_EQ(uploader.requests[1].upload_name, "b.txt");
    EXPECT_EQ(stats.files_uploaded, 2);
    EXPECT_EQ(stats.bytes_uploaded, 32);
    EXPECT_EQ(stats.errors, 0);
    EXPECT_TRUE(ledger.contains(a.path));
    EXPECT_TRUE(ledger.contains(b.path));
    EXPECT_EQ(count_topic(TOPIC_STATUS), 4u);
}

TEST_F(DispatcherTest, MetadataCarriesPathAndStaticFields) {
    Ledger ledger(config.state_dir);
    ledger.load();
    config.prefix = "dev1_";
    auto a = make("a.txt", 1700000000);

    RunStats stats;
    Dispatcher(config, ledger, &uploader, metadata).dispatch({a}, stats);

    ASSERT_EQ(uploader.requests.size(), 1u);
    const auto& req = uploader.requests[0];
    EXPECT_EQ(req.upload_name, "dev1_a.txt");
    EXPECT_EQ(req.local_path, fs::path(a.path));
    EXPECT_EQ(req.timestamp_ns, 1700000000000000000LL);
    EXPECT_EQ(req.metadata.at("site"), "north");
    EXPECT_EQ(req.metadata.at("original_path"), a.path);
    EXPECT_EQ(req.metadata.at("filename"), "dev1_a.txt");
    EXPECT_EQ(req.metadata.at("size_bytes"), "16");
    EXPECT_EQ(req.metadata.at("last_modified_timestamp_source"), "2023-11-14T22:13:20+00:00");

    EXPECT_EQ(ledger.find(a.path)->filename_at_upload, "dev1_a.txt");
}

TEST_F(DispatcherTest, FailureIsCountedAndBatchContinues) {
    Ledger ledger(config.state_dir);
    ledger.load();
    auto a = make("a.txt");
    auto b = make("b.txt");
    uploader.fail_names = {"a.txt"};

    RunStats stats;
    Dispatcher dispatcher(config, ledger, &uploader, metadata, recorder());
    dispatcher.set_error_log(fs::path(config.state_dir) / PROCESSING_LOG);
    dispatcher.dispatch({a, b}, stats);

    EXPECT_EQ(uploader.requests.size(), 2u);
    EXPECT_EQ(stats.errors, 1);
    EXPECT_EQ(stats.files_uploaded, 1);
    EXPECT_FALSE(ledger.contains(a.path));
    EXPECT_TRUE(ledger.contains(b.path));
    EXPECT_EQ(count_topic(TOPIC_ERROR), 1u);

    std::string log = read_file(fs::path(config.state_dir) / PROCESSING_LOG);
    EXPECT_NE(log.find("remote refused a.txt"), std::string::npos);
}

TEST_F(DispatcherTest, DryRunNeverUploadsOrRecords) {
    Ledger ledger(config.state_dir);
    ledger.load();
    config.dry_run = true;
    auto a = make("a.txt");

    RunStats stats;
    Dispatcher(config, ledger, nullptr, metadata).dispatch({a}, stats);

    EXPECT_EQ(stats.dry_run_files, 1);
    EXPECT_EQ(stats.files_uploaded, 0);
    EXPECT_EQ(ledger.size(), 0u);
    EXPECT_EQ(count_lines(ledger.uploaded_path()), 1u);
}

TEST_F(DispatcherTest, DeleteAfterRecordedUpload) {
    Ledger ledger(config.state_dir);
    ledger.load();
    config.delete_files = true;
    auto a = make("a.txt");
    auto b = make("b.txt");
    uploader.fail_names = {"b.txt"};

    RunStats stats;
    Dispatcher(config, ledger, &uploader, metadata).dispatch({a, b}, stats);

    EXPECT_FALSE(fs::exists(a.path));
    EXPECT_TRUE(ledger.contains(a.path));
    // A failed upload keeps its source
    EXPECT_TRUE(fs::exists(b.path));
}

TEST_F(DispatcherTest, InterruptStopsBeforeNextFile) {
    Ledger ledger(config.state_dir);
    ledger.load();
    auto a = make("a.txt");
    auto b = make("b.txt");

    platform::set_interrupted(true);
    RunStats stats;
    Dispatcher(config, ledger, &uploader, metadata).dispatch({a, b}, stats);

    EXPECT_TRUE(stats.interrupted);
    EXPECT_TRUE(uploader.requests.empty());
    EXPECT_EQ(ledger.size(), 0u);
}

TEST_F(DispatcherTest, MissingUploaderIsAnUploadError) {
    Ledger ledger(config.state_dir);
    ledger.load();
    auto a = make("a.txt");

    RunStats stats;
    Dispatcher(config, ledger, nullptr, metadata).dispatch({a}, stats);

    EXPECT_EQ(stats.errors, 1);
    EXPECT_FALSE(ledger.contains(a.path));
}
