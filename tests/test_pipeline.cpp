#include <gtest/gtest.h>

#include "hashsweep/error.hpp"
#include "hashsweep/pipeline.hpp"
#include "mock_hasher.hpp"
#include "test_support.hpp"

#include <gmock/gmock.h>

#include <stdexcept>

#include <cctype>

using namespace hashsweep;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class PipelineTest : public HashsweepTest {
protected:
    PipelineConfig make_config(std::size_t workers, std::size_t chunk_size,
                               const std::string& target = SHA256_BOB) {
        PipelineConfig config;
        config.general.worker_count = workers;
        config.general.chunk_size = chunk_size;
        config.general.worker_timeout_ms = 200;
        config.hash.target_hash = target;
        config.input.csv_path = path("input.csv");
        config.output.results_path = path("results.json");
        config.output.log_path = path("test.log");
        config.output.verbose = false;
        return config;
    }
};

TEST_F(PipelineTest, FindsSingleMatch) {
    Pipeline pipeline(make_config(2, 2), logger_);

    PipelineOutcome outcome = pipeline.run({"alice", "bob", "carol"});

    EXPECT_TRUE(outcome.processing_ok);
    EXPECT_TRUE(outcome.persisted);
    ASSERT_EQ(outcome.report.total_matches, 1u);
    EXPECT_EQ(outcome.report.matches[0].original, "bob");
    EXPECT_EQ(outcome.report.matches[0].hash, SHA256_BOB);
    EXPECT_EQ(outcome.report.matches[0].algorithm, "SHA256");
    EXPECT_EQ(outcome.items_processed, 3u);
    EXPECT_EQ(outcome.worker_stats.size(), 2u);
    EXPECT_EQ(outcome.channel_stats.tasks_added, 2u);
    EXPECT_EQ(outcome.channel_stats.shutdowns_sent, 2u);

    boost::json::value doc = boost::json::parse(read_file(path("results.json")));
    EXPECT_EQ(doc.at("total_matches").as_int64(), 1);
    EXPECT_EQ(doc.at("matches").as_array().at(0).at("original").as_string(), "bob");
}

TEST_F(PipelineTest, TargetIsComparedCaseInsensitively) {
    std::string upper = SHA256_BOB;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    Pipeline pipeline(make_config(1, 10, "  " + upper + " "), logger_);

    PipelineOutcome outcome = pipeline.run({"bob"});

    EXPECT_EQ(outcome.report.total_matches, 1u);
}

TEST_F(PipelineTest, EmptyInputCompletesWithEmptyReport) {
    Pipeline pipeline(make_config(3, 5), logger_);

    PipelineOutcome outcome = pipeline.run(std::vector<Candidate>{});

    EXPECT_TRUE(outcome.processing_ok);
    EXPECT_TRUE(outcome.persisted);
    EXPECT_EQ(outcome.report.total_matches, 0u);
    EXPECT_EQ(outcome.items_processed, 0u);
    for (const auto& stats : outcome.worker_stats) {
        EXPECT_EQ(stats.exit, WorkerExit::Shutdown);
    }
    EXPECT_NE(log_contents().find("No matches found"), std::string::npos);
}

TEST_F(PipelineTest, DuplicateCandidatesEachMatch) {
    Pipeline pipeline(make_config(2, 1), logger_);

    PipelineOutcome outcome = pipeline.run({"bob", "x", "bob", "y", "bob"});

    EXPECT_EQ(outcome.report.total_matches, 3u);
    EXPECT_EQ(outcome.items_processed, 5u);
}

TEST_F(PipelineTest, ResultsAreDeterministicAcrossRuns) {
    std::vector<Candidate> candidates;
    for (int i = 0; i < 500; ++i) {
        candidates.push_back(i % 50 == 0 ? "bob" : "filler_" + std::to_string(i));
    }

    auto originals = [](const Report& report) {
        std::vector<std::string> values;
        for (const auto& match : report.matches) {
            values.push_back(match.original);
        }
        return values;
    };

    Pipeline first(make_config(4, 7), logger_);
    Pipeline second(make_config(1, 100), logger_);
    PipelineOutcome a = first.run(candidates);
    PipelineOutcome b = second.run(candidates);

    EXPECT_EQ(a.report.total_matches, 10u);
    EXPECT_EQ(b.report.total_matches, 10u);
    EXPECT_EQ(originals(a.report), originals(b.report));
    EXPECT_EQ(a.items_processed, b.items_processed);
}

TEST_F(PipelineTest, ReadsConfiguredCsvFile) {
    write_file("input.csv", "alice,1\nbob,2\n\ncarol,3\n");
    Pipeline pipeline(make_config(2, 2), logger_);

    PipelineOutcome outcome = pipeline.run();

    EXPECT_TRUE(outcome.processing_ok);
    EXPECT_EQ(outcome.receiver_stats.valid_lines, 3u);
    EXPECT_EQ(outcome.receiver_stats.invalid_lines, 1u);
    EXPECT_EQ(outcome.report.total_matches, 1u);
}

TEST_F(PipelineTest, MissingInputFailsBeforeDispatch) {
    Pipeline pipeline(make_config(2, 2), logger_);

    EXPECT_THROW(pipeline.run(), IOError);
    EXPECT_FALSE(std::filesystem::exists(path("results.json")));
}

TEST_F(PipelineTest, InvalidConfigurationIsRejectedUpFront) {
    PipelineConfig config = make_config(2, 2);
    config.hash.algorithm = "MD5";
    EXPECT_THROW({ Pipeline pipeline(config, logger_); }, ConfigError);

    config = make_config(0, 2);
    EXPECT_THROW({ Pipeline pipeline(config, logger_); }, ConfigError);

    config = make_config(2, 2);
    EXPECT_THROW({ Pipeline pipeline(config, nullptr); }, HashsweepException);
}

TEST_F(PipelineTest, PersistenceFailureDoesNotFailProcessing) {
    write_file("blocker", "x");
    PipelineConfig config = make_config(2, 2);
    config.output.results_path = path("blocker/results.json");
    Pipeline pipeline(config, logger_);

    PipelineOutcome outcome = pipeline.run({"alice", "bob"});

    EXPECT_TRUE(outcome.processing_ok);
    EXPECT_FALSE(outcome.persisted);
    EXPECT_FALSE(outcome.persistence_error.empty());
    EXPECT_EQ(outcome.report.total_matches, 1u);
}

TEST_F(PipelineTest, Pbkdf2Sweep) {
    HashSettings settings;
    settings.algorithm = HashAlgorithm::PBKDF2;
    settings.iterations = 10;
    std::string target = make_hasher(settings)->digest("carol");

    PipelineConfig config = make_config(2, 1, target);
    config.hash.algorithm = "PBKDF2";
    config.hash.pbkdf2_iterations = 10;
    Pipeline pipeline(config, logger_);

    PipelineOutcome outcome = pipeline.run({"alice", "bob", "carol"});

    ASSERT_EQ(outcome.report.total_matches, 1u);
    EXPECT_EQ(outcome.report.matches[0].original, "carol");
    EXPECT_EQ(outcome.report.matches[0].algorithm, "PBKDF2");
}

TEST_F(PipelineTest, StopRequestDoesNotCarryIntoNextRun) {
    // Short timeout so idle workers poll the stop token before any chunk arrives
    PipelineConfig config = make_config(2, 1);
    config.general.worker_timeout_ms = 1;
    Pipeline pipeline(config, logger_);

    pipeline.request_stop();
    PipelineOutcome first = pipeline.run({"alice", "bob"});
    pipeline.request_stop();
    PipelineOutcome second = pipeline.run({"alice", "bob"});

    for (const auto* outcome : {&first, &second}) {
        EXPECT_TRUE(outcome->processing_ok);
        EXPECT_EQ(outcome->items_processed, 2u);
        ASSERT_EQ(outcome->report.total_matches, 1u);
        EXPECT_EQ(outcome->report.matches[0].original, "bob");
        for (const auto& stats : outcome->worker_stats) {
            EXPECT_EQ(stats.exit, WorkerExit::Shutdown);
        }
    }
}

TEST_F(PipelineTest, FailedWorkerFailsProcessingButReportIsStillSaved) {
    HasherFactory factory = []() {
        auto hasher = std::make_unique<NiceMock<MockHasher>>();
        ON_CALL(*hasher, digest(_)).WillByDefault(Return("ff"));
        ON_CALL(*hasher, algorithm()).WillByDefault(Throw(std::runtime_error("algorithm unavailable")));
        return std::unique_ptr<Hasher>(std::move(hasher));
    };
    Pipeline pipeline(make_config(1, 1, "ff"), logger_, factory);

    PipelineOutcome outcome = pipeline.run({"alice", "bob"});

    EXPECT_FALSE(outcome.processing_ok);
    EXPECT_TRUE(outcome.persisted);
    ASSERT_EQ(outcome.worker_stats.size(), 1u);
    EXPECT_EQ(outcome.worker_stats[0].exit, WorkerExit::Failed);
    EXPECT_EQ(outcome.report.total_matches, 0u);
    EXPECT_TRUE(std::filesystem::exists(path("results.json")));
    EXPECT_NE(log_contents().find("did not exit through its shutdown marker"), std::string::npos);
}

TEST_F(PipelineTest, HasherFactoryIsRequired) {
    EXPECT_THROW({ Pipeline pipeline(make_config(1, 1), logger_, HasherFactory{}); }, HashsweepException);
}
