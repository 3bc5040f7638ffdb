// ferry headers
#include "core/Errors.hpp"
#include "core/SnapshotStore.hpp"
#include "core/TransferEngine.hpp"
#include "model/Transfer.hpp"

// ferry fakes
#include "FakeEndpoint.hpp"
#include "FakeExtractor.hpp"
#include "FakeRepository.hpp"
#include "MockErrorMonitor.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

// STL headers
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace ferry::test {

  namespace fs = std::filesystem;
  using namespace ferry::core;
  using model::StatusCode;
  using ::testing::HasSubstr;
  using ::testing::NiceMock;

  model::DataResource file(const std::string& id, const std::string& endpoint,
                           std::uint64_t bytes = 1000, bool archive = false) {
    return { id,    id,   "dir/" + id + (archive ? ".tar.gz" : ".txt"), archive ? "tar" : "txt",
             "text/plain", bytes, "md5:0123456789abcdef", endpoint, archive };
  }

  std::string slurp(const fs::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  class TransferEngineTest : public ::testing::Test {
  protected:
    void SetUp() override {
      const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
      root = fs::temp_directory_path() / (std::string("ferry-engine-") + info->name());
      fs::remove_all(root);
      fs::create_directories(root / "data");
      fs::create_directories(root / "manifests");

      config.service.name = "test";
      config.service.dataDirectory = (root / "data").string();
      config.service.manifestDirectory = (root / "manifests").string();
      config.service.pollInterval = std::chrono::hours(1); // ticks are driven by pollNow()
      config.service.deleteAfter = std::chrono::hours(1);
      config.service.endpoint = "local";
      config.repositories["source"] = { "Source", "Lab", "source-ep", {} };
      config.repositories["destination"] = { "Destination", "Lab", "dest-ep", {} };

      source = std::make_shared<FakeRepository>(std::vector<model::DataResource>{
          file("f1", "source-ep"), file("f2", "source-ep"), file("f3", "source-ep") });
      destination = std::make_shared<FakeRepository>();
      sourceEp = std::make_shared<FakeEndpoint>("/srv/source");
      destEp = std::make_shared<FakeEndpoint>("/srv/dest");
      localEp = std::make_shared<FakeEndpoint>("/srv/local");
      extractor = std::make_shared<FakeExtractor>();

      repositories = std::make_shared<RepositoryRegistry>("repository");
      repositories->registerProvider("source", [this] { return source; });
      repositories->registerProvider("destination", [this] { return destination; });

      endpoints = std::make_shared<EndpointRegistry>("endpoint");
      endpoints->registerProvider("source-ep", [this] { return sourceEp; });
      endpoints->registerProvider("dest-ep", [this] { return destEp; });
      endpoints->registerProvider("local", [this] { return localEp; });

      errors = std::make_shared<NiceMock<MockErrorMonitor>>();
      logger = std::make_shared<Logger>();
    }

    void TearDown() override {
      engine.reset();
      fs::remove_all(root);
    }

    std::unique_ptr<TransferEngine> makeEngine() {
      return std::make_unique<TransferEngine>(config, repositories, endpoints, errors, logger,
                                              extractor);
    }

    void startEngine() {
      engine = makeEngine();
      engine->start();
    }

    model::Specification spec(std::vector<std::string> ids = { "f1", "f2", "f3" }) {
      model::Specification s;
      s.source = "source";
      s.destination = "destination";
      s.fileIds = std::move(ids);
      s.description = "test payload";
      s.user = { "Ada", "ada@example.org", "Lab", "0000-0001-2345-6789" };
      return s;
    }

    void tick(int times = 1) {
      for (int i = 0; i < times; ++i)
        engine->pollNow();
    }

    fs::path root;
    EngineConfig config;
    std::shared_ptr<FakeRepository> source, destination;
    std::shared_ptr<FakeEndpoint> sourceEp, destEp, localEp;
    std::shared_ptr<FakeExtractor> extractor;
    std::shared_ptr<RepositoryRegistry> repositories;
    std::shared_ptr<EndpointRegistry> endpoints;
    std::shared_ptr<NiceMock<MockErrorMonitor>> errors;
    std::shared_ptr<Logger> logger;
    std::unique_ptr<TransferEngine> engine;
  };

  //---lifecycle------------------------------------------------------------------
  TEST_F(TransferEngineTest, start_TwiceThrowsAlreadyRunning) {
    startEngine();
    EXPECT_TRUE(engine->running());
    EXPECT_THROW(engine->start(), AlreadyRunningError);
  }

  TEST_F(TransferEngineTest, stop_WhenNotRunningThrowsNotRunning) {
    engine = makeEngine();
    EXPECT_THROW(engine->stop(), NotRunningError);
  }

  TEST_F(TransferEngineTest, requests_WhenNotRunningThrowNotRunning) {
    engine = makeEngine();
    EXPECT_THROW(engine->create(spec()), NotRunningError);
    EXPECT_THROW(engine->pollNow(), NotRunningError);

    startEngine();
    engine->stop();
    EXPECT_FALSE(engine->running());
    EXPECT_THROW(engine->status(model::TransferId{}), NotRunningError);
  }

  TEST_F(TransferEngineTest, start_MissingDataDirectoryThrowsDirectoryError) {
    config.service.dataDirectory = (root / "missing").string();
    engine = makeEngine();
    EXPECT_THROW(engine->start(), DirectoryError);
    EXPECT_FALSE(engine->running());
  }

  TEST_F(TransferEngineTest, start_ManifestDirectoryIsAFileThrowsDirectoryError) {
    std::ofstream(root / "not-a-dir") << "x";
    config.service.manifestDirectory = (root / "not-a-dir").string();
    engine = makeEngine();
    EXPECT_THROW(engine->start(), DirectoryError);
  }

  TEST_F(TransferEngineTest, start_WriteTestFileIsScopedByServiceName) {
    // an unscoped instance's test file in the shared directory must not get in the way
    fs::create_directories(root / "data" / ".ferry-write-test");
    startEngine();
    EXPECT_TRUE(engine->running());
    EXPECT_FALSE(fs::exists(root / "data" / ".ferry-test-write-test"));
  }

  //---create / status / cancel---------------------------------------------------
  TEST_F(TransferEngineTest, create_NewTransferIsImmediatelyStaging) {
    startEngine();
    const auto id = engine->create(spec());
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Staging);
    EXPECT_EQ(st.numFiles, 3u);
    EXPECT_EQ(st.numFilesTransferred, 0u);
  }

  TEST_F(TransferEngineTest, create_EmptyFileListThrowsAndInsertsNothing) {
    startEngine();
    EXPECT_THROW(engine->create(spec({})), NoFilesRequestedError);
    engine->stop();

    SnapshotStore store(SnapshotStore::fileFor(config.service.dataDirectory, "test"));
    auto snap = store.load();
    ASSERT_TRUE(snap);
    EXPECT_TRUE(snap->transfers.empty());
  }

  TEST_F(TransferEngineTest, create_UnknownRepositoryThrowsNameResolution) {
    startEngine();
    auto s = spec();
    s.destination = "nowhere";
    try {
      engine->create(s);
      FAIL() << "expected NameResolutionError";
    } catch (const NameResolutionError& e) {
      EXPECT_EQ(e.name(), "nowhere");
    }
  }

  TEST_F(TransferEngineTest, create_MalformedInstructionsThrowInvalidInstructions) {
    startEngine();
    auto s = spec();
    s.instructions = { { "extract", 5 } };
    EXPECT_THROW(engine->create(s), InvalidInstructionsError);
  }

  TEST_F(TransferEngineTest, create_PayloadAboveLimitThrowsPayloadTooLarge) {
    config.service.maxPayloadSize = 1.0; // GB
    source->catalog.push_back(file("huge", "source-ep", 2'000'000'000ULL));
    startEngine();
    EXPECT_THROW(engine->create(spec({ "huge" })), PayloadTooLargeError);
  }

  TEST_F(TransferEngineTest, create_RepositoryErrorsReachTheCaller) {
    startEngine();
    EXPECT_THROW(engine->create(spec({ "f1", "nope" })), std::runtime_error);
  }

  TEST_F(TransferEngineTest, create_TextThatIsNotUtf8IsRejectedAndOthersSurviveRestart) {
    startEngine();
    const auto good = engine->create(spec());
    auto bad = spec({ "f1" });
    bad.description = "caf\xe9";
    EXPECT_THROW(engine->create(bad), InvalidTextError);
    EXPECT_NO_THROW(engine->stop());

    startEngine();
    EXPECT_EQ(engine->status(good).code, StatusCode::Staging);
  }

  TEST_F(TransferEngineTest, statusAndCancel_UnknownIdThrowNotFound) {
    startEngine();
    boost::uuids::random_generator gen;
    const auto id = gen();
    EXPECT_THROW(engine->status(id), NotFoundError);
    EXPECT_THROW(engine->cancel(id), NotFoundError);
  }

  //---pipeline scenarios---------------------------------------------------------
  TEST_F(TransferEngineTest, poll_StagesCopiesAndCompletesThreeFiles) {
    startEngine();
    const auto id = engine->create(spec());

    tick(); // staging requested
    EXPECT_EQ(engine->status(id).code, StatusCode::Staging);
    EXPECT_EQ(source->stageCalls, 1);

    tick(); // staging done, copy begun
    EXPECT_EQ(engine->status(id).code, StatusCode::Active);
    ASSERT_EQ(sourceEp->begun.size(), 1u);
    ASSERT_EQ(sourceEp->begun[0].size(), 3u);
    EXPECT_EQ(sourceEp->begun[0][0].sourcePath, "dir/f1.txt");
    EXPECT_EQ(sourceEp->begun[0][0].destinationPath,
              "localuser/ferry-" + model::toString(id) + "/dir/f1.txt");
    EXPECT_EQ(sourceEp->destinations[0], destEp.get());

    tick(); // copy done, manifest written
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Succeeded);
    EXPECT_EQ(st.numFilesTransferred, 3u);

    const auto manifest = root / "manifests" / ("manifest-" + model::toString(id) + ".json");
    ASSERT_TRUE(fs::exists(manifest));
    const auto doc = nlohmann::json::parse(slurp(manifest));
    EXPECT_EQ(doc.at("profile"), "data-package");
    EXPECT_EQ(doc.at("resources").size(), 3u);
    EXPECT_EQ(doc.at("resources")[0].at("hash_algorithm"), "md5");
    EXPECT_EQ(doc.at("contributors")[0].at("title"), "Ada");
  }

  TEST_F(TransferEngineTest, poll_AlreadyStagedFilesSkipStaging) {
    sourceEp->staged = true;
    startEngine();
    const auto id = engine->create(spec());

    tick();
    EXPECT_EQ(engine->status(id).code, StatusCode::Active);
    EXPECT_EQ(source->stageCalls, 0);
  }

  TEST_F(TransferEngineTest, poll_DoubleCheckStagingFailsWhenEndpointDisagrees) {
    config.service.doubleCheckStaging = true;
    startEngine();
    const auto id = engine->create(spec());

    tick(2);
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_THAT(st.message, HasSubstr("not staged"));
  }

  TEST_F(TransferEngineTest, poll_StagingFailureFailsTransfer) {
    source->stagingOutcome = model::StagingStatus::Failed;
    startEngine();
    const auto id = engine->create(spec());

    tick(2);
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_EQ(st.message, "staging failed");
  }

  TEST_F(TransferEngineTest, poll_EndpointFailureMessageReachesClient) {
    sourceEp->failTransfers = true;
    sourceEp->failureMessage = "permission denied on destination";
    startEngine();
    const auto id = engine->create(spec());

    tick(3);
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_EQ(st.message, "permission denied on destination");
  }

  TEST_F(TransferEngineTest, poll_HeldTransferStaysActiveUntilDone) {
    startEngine();
    const auto id = engine->create(spec());
    tick(2);

    sourceEp->hold = true;
    tick();
    EXPECT_EQ(engine->status(id).code, StatusCode::Active);
    sourceEp->hold = false;
    tick();
    EXPECT_EQ(engine->status(id).code, StatusCode::Succeeded);
  }

  TEST_F(TransferEngineTest, poll_InactiveTransferIsMirroredUntilResumed) {
    startEngine();
    const auto id = engine->create(spec());
    tick(); // staging requested
    sourceEp->hold = true;
    tick(); // copy begun
    tick();
    EXPECT_EQ(engine->status(id).code, StatusCode::Active);

    sourceEp->paused = true;
    tick();
    auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Inactive);
    EXPECT_EQ(st.numFilesTransferred, 0u);

    sourceEp->paused = false;
    tick();
    EXPECT_EQ(engine->status(id).code, StatusCode::Active);

    sourceEp->hold = false;
    tick();
    st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Succeeded);
    EXPECT_EQ(st.numFilesTransferred, 3u);
    EXPECT_EQ(sourceEp->begun.size(), 1u);
  }

  TEST_F(TransferEngineTest, poll_UnassignableEndpointFailsTaskInPrepare) {
    config.repositories["source"] = { "Source", "Lab", "", { { "disk", "a" }, { "tape", "b" } } };
    source->catalog = { file("f1", "") };
    startEngine();
    const auto id = engine->create(spec({ "f1" }));

    tick();
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_THAT(st.message, HasSubstr("can't determine endpoint"));
  }

  TEST_F(TransferEngineTest, poll_UnregisteredEndpointFailsTaskInPrepare) {
    config.repositories["source"] = { "Source", "Lab", "ghost-ep", {} };
    startEngine();
    const auto id = engine->create(spec());

    tick();
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_THAT(st.message, HasSubstr("invalid endpoint 'ghost-ep'"));
  }

  //---multi-endpoint transfers---------------------------------------------------
  class MultiEndpointTest : public TransferEngineTest {
  protected:
    void SetUp() override {
      TransferEngineTest::SetUp();
      config.repositories["source"] = {
        "Source", "Lab", "", { { "disk", "disk-ep" }, { "tape", "tape-ep" } }
      };
      source->catalog = { file("f1", "disk-ep"), file("f2", "tape-ep"), file("f3", "disk-ep") };
      diskEp = std::make_shared<FakeEndpoint>("/srv/disk");
      tapeEp = std::make_shared<FakeEndpoint>("/srv/tape");
      endpoints->registerProvider("disk-ep", [this] { return diskEp; });
      endpoints->registerProvider("tape-ep", [this] { return tapeEp; });
    }

    std::shared_ptr<FakeEndpoint> diskEp, tapeEp;
  };

  TEST_F(MultiEndpointTest, status_ReportsSlowestTask) {
    tapeEp->hold = true;
    startEngine();
    const auto id = engine->create(spec());

    tick(3); // disk task Finalizing, tape task still copying
    auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Active);
    EXPECT_EQ(st.numFiles, 3u);
    EXPECT_EQ(diskEp->begun.at(0).size(), 2u);
    EXPECT_EQ(tapeEp->begun.at(0).size(), 1u);

    tapeEp->hold = false;
    tick();
    st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Succeeded);
    EXPECT_EQ(st.numFilesTransferred, 3u);
  }

  TEST_F(MultiEndpointTest, poll_TaskFailureCancelsSiblings) {
    diskEp->hold = true;
    tapeEp->failTransfers = true;
    tapeEp->failureMessage = "tape robot jammed";
    startEngine();
    const auto id = engine->create(spec());

    tick(3);
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_EQ(st.message, "tape robot jammed");
    ASSERT_EQ(diskEp->canceled.size(), 1u);
    EXPECT_EQ(diskEp->canceled[0], "xfer-1");
  }

  //---cancellation---------------------------------------------------------------
  TEST_F(TransferEngineTest, cancel_NextTickFailsTransferAndCancelsEndpoint) {
    sourceEp->hold = true;
    startEngine();
    const auto id = engine->create(spec());
    tick(2);

    engine->cancel(id);
    EXPECT_EQ(engine->status(id).code, StatusCode::Active); // cooperative

    tick();
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_EQ(st.message, "canceled at user request");
    ASSERT_EQ(sourceEp->canceled.size(), 1u);
    EXPECT_EQ(sourceEp->canceled[0], "xfer-1");
  }

  TEST_F(TransferEngineTest, cancel_EndpointErrorIsEscalatedNotThrown) {
    sourceEp->hold = true;
    sourceEp->failCancel = true;
    EXPECT_CALL(*errors, notifyFailure(HasSubstr("cancelling transfer xfer-1"))).Times(1);
    startEngine();
    const auto id = engine->create(spec());
    tick(2);

    engine->cancel(id);
    EXPECT_NO_THROW(tick());
    EXPECT_EQ(engine->status(id).code, StatusCode::Failed);
  }

  TEST_F(TransferEngineTest, cancel_TerminalTransferIsUnchanged) {
    startEngine();
    const auto id = engine->create(spec());
    tick(3);

    engine->cancel(id);
    tick();
    EXPECT_EQ(engine->status(id).code, StatusCode::Succeeded);
  }

  //---manifest / extraction------------------------------------------------------
  TEST_F(TransferEngineTest, poll_TerminalTransfersWriteNoSecondManifest) {
    startEngine();
    const auto id = engine->create(spec());
    tick(3);
    const auto before = engine->status(id);

    const auto manifest = root / "manifests" / ("manifest-" + model::toString(id) + ".json");
    ASSERT_TRUE(fs::remove(manifest));
    tick(2);
    EXPECT_FALSE(fs::exists(manifest));
    EXPECT_EQ(engine->status(id), before);
  }

  TEST_F(TransferEngineTest, poll_DeliversManifestThroughLocalEndpoint) {
    startEngine();
    auto s = spec();
    s.instructions = { { "deliver_manifest", true } };
    const auto id = engine->create(s);

    tick(3);
    EXPECT_EQ(engine->status(id).code, StatusCode::Finalizing);
    ASSERT_EQ(localEp->begun.size(), 1u);
    EXPECT_EQ(localEp->destinations[0], destEp.get());
    EXPECT_EQ(localEp->begun[0][0].destinationPath,
              "localuser/ferry-" + model::toString(id) + "/manifest.json");

    tick();
    EXPECT_EQ(engine->status(id).code, StatusCode::Succeeded);
  }

  TEST_F(TransferEngineTest, poll_FailedManifestDeliveryFailsTransfer) {
    localEp->failTransfers = true;
    localEp->failureMessage = "quota exceeded";
    startEngine();
    auto s = spec();
    s.instructions = nlohmann::json::parse(R"({"deliver_manifest": {"filename": "MANIFEST.json"}})");
    const auto id = engine->create(s);

    tick(4);
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_THAT(st.message, HasSubstr("quota exceeded"));
  }

  TEST_F(TransferEngineTest, poll_ExtractsArchivesBeforeManifest) {
    source->catalog.push_back(file("bundle", "source-ep", 5000, true));
    startEngine();
    auto s = spec({ "f1", "bundle" });
    s.instructions = { { "extract", nlohmann::json::array({ "readme.txt" }) } };
    const auto id = engine->create(s);

    tick(3);
    EXPECT_EQ(engine->status(id).code, StatusCode::Succeeded);
    ASSERT_EQ(extractor->calls.size(), 1u);
    const auto folder = "/srv/dest/localuser/ferry-" + model::toString(id);
    EXPECT_EQ(extractor->calls[0].archive, folder + "/dir/bundle.tar.gz");
    EXPECT_EQ(extractor->calls[0].destination, folder + "/dir");
    EXPECT_EQ(extractor->calls[0].members, std::vector<std::string>{ "readme.txt" });

    const auto doc = nlohmann::json::parse(
        slurp(root / "manifests" / ("manifest-" + model::toString(id) + ".json")));
    ASSERT_TRUE(doc.contains("extracted"));
    EXPECT_EQ(doc.at("extracted")[0],
              "localuser/ferry-" + model::toString(id) + "/dir/readme.txt");
  }

  TEST_F(TransferEngineTest, poll_ArchiveWithoutExtractorFailsTask) {
    extractor.reset();
    source->catalog.push_back(file("bundle", "source-ep", 5000, true));
    startEngine();
    const auto id = engine->create(spec({ "bundle" }));

    tick(3);
    const auto st = engine->status(id);
    EXPECT_EQ(st.code, StatusCode::Failed);
    EXPECT_THAT(st.message, HasSubstr("no extractor"));
  }

  //---retention / persistence----------------------------------------------------
  TEST_F(TransferEngineTest, poll_PurgesTransfersPastRetention) {
    config.service.deleteAfter = std::chrono::seconds(0);
    startEngine();
    const auto id = engine->create(spec());
    tick(3);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    tick();
    EXPECT_THROW(engine->status(id), NotFoundError);
  }

  TEST_F(TransferEngineTest, start_RestoresTransfersSavedOnStop) {
    startEngine();
    const auto id = engine->create(spec());
    tick(); // staging handle issued
    engine->stop();

    startEngine();
    EXPECT_EQ(engine->status(id).code, StatusCode::Staging);
    EXPECT_EQ(source->loadStateCalls, 1);

    tick();
    EXPECT_EQ(engine->status(id).code, StatusCode::Active);
  }

  TEST_F(TransferEngineTest, start_CorruptSnapshotIsEscalatedAndQuarantined) {
    const auto snapshot = SnapshotStore::fileFor(config.service.dataDirectory, "test");
    std::ofstream(snapshot) << "{ this is not json";
    EXPECT_CALL(*errors, notifyFailure(HasSubstr("discarding snapshot"))).Times(1);

    startEngine();
    EXPECT_TRUE(fs::exists(snapshot + ".corrupt"));
    EXPECT_FALSE(fs::exists(snapshot));

    const auto id = engine->create(spec());
    EXPECT_EQ(engine->status(id).code, StatusCode::Staging);
  }

  TEST_F(TransferEngineTest, start_NonStringSchemaMarkerIsQuarantined) {
    const auto snapshot = SnapshotStore::fileFor(config.service.dataDirectory, "test");
    std::ofstream(snapshot) << R"({"schema": 1, "version": 1, "transfers": []})";
    EXPECT_CALL(*errors, notifyFailure(HasSubstr("discarding snapshot"))).Times(1);

    startEngine();
    EXPECT_TRUE(engine->running());
    EXPECT_TRUE(fs::exists(snapshot + ".corrupt"));
  }

  TEST_F(TransferEngineTest, stop_SnapshotSaveFailureIsEscalatedAndRethrown) {
    startEngine();
    engine->create(spec());
    fs::remove_all(root / "data");
    EXPECT_CALL(*errors, notifyFailure(HasSubstr("[SnapshotStore]"))).Times(1);

    EXPECT_THROW(engine->stop(), SnapshotError);
    EXPECT_FALSE(engine->running());
  }

  TEST_F(TransferEngineTest, stop_JournalRecordsTerminalTransfers) {
    startEngine();
    const auto done = engine->create(spec());
    tick(3);
    const auto canceled = engine->create(spec({ "f1" }));
    engine->cancel(canceled);
    tick();
    engine->stop();

    const auto journal = slurp(root / "data" / "journal-test.csv");
    EXPECT_THAT(journal, HasSubstr("id,source,destination"));
    EXPECT_THAT(journal, HasSubstr(model::toString(done)));
    EXPECT_THAT(journal, HasSubstr(",succeeded,"));
    EXPECT_THAT(journal, HasSubstr(model::toString(canceled)));
    EXPECT_THAT(journal, HasSubstr(",canceled,"));
  }

  TEST_F(TransferEngineTest, engines_WithDistinctServiceNamesRunSideBySide) {
    startEngine();
    auto otherConfig = config;
    otherConfig.service.name = "other";
    TransferEngine other(otherConfig, repositories, endpoints, errors, logger, extractor);
    other.start();

    const auto id = engine->create(spec());
    EXPECT_THROW(other.status(id), NotFoundError);
    other.stop();
  }

} // namespace ferry::test
