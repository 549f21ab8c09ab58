#include <gtest/gtest.h>
#include "core/logging.hh"
#include "crypto/signature.hh"
#include "crypto/hash.hh"
#include <atomic>
#include <thread>

namespace aether {
namespace {

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MemorySink>();
        Logger::instance().clear_sinks();
        Logger::instance().clear_component_levels();
        Logger::instance().add_sink(sink_);
        Logger::instance().set_level(LogLevel::INFO);
    }

    void TearDown() override {
        Logger::instance().clear_sinks();
        Logger::instance().clear_component_levels();
        Logger::instance().set_level(LogLevel::INFO);
    }

    std::shared_ptr<MemorySink> sink_;
};

TEST_F(LoggingTest, LogLevelNames) {
    EXPECT_EQ(log_level_name(LogLevel::TRACE), "TRACE");
    EXPECT_EQ(log_level_name(LogLevel::DEBUG), "DEBUG");
    EXPECT_EQ(log_level_name(LogLevel::INFO), "INFO");
    EXPECT_EQ(log_level_name(LogLevel::WARN), "WARN");
    EXPECT_EQ(log_level_name(LogLevel::ERROR), "ERROR");
    EXPECT_EQ(log_level_name(LogLevel::FATAL), "FATAL");
    EXPECT_EQ(log_level_name(LogLevel::OFF), "OFF");
}

TEST_F(LoggingTest, LoggerSingleton) {
    EXPECT_EQ(&Logger::instance(), &Logger::instance());
}

TEST_F(LoggingTest, LoggerIsEnabled) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::INFO);

    EXPECT_FALSE(logger.is_enabled(LogLevel::TRACE));
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG));
    EXPECT_TRUE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::ERROR));
    EXPECT_FALSE(logger.is_enabled(LogLevel::OFF));
}

TEST_F(LoggingTest, ParentComponentLevel) {
    Logger& logger = Logger::instance();
    logger.set_level(LogLevel::WARN);
    logger.set_component_level("tracker", LogLevel::DEBUG);

    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "tracker"));
    EXPECT_TRUE(logger.is_enabled(LogLevel::DEBUG, "tracker.job"));
    EXPECT_TRUE(log::tx_wait.is_debug_enabled());

    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG, "rpc"));
    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG, "trackers"));
}

TEST_F(LoggingTest, ChildOverrideWinsOverParent) {
    Logger& logger = Logger::instance();
    logger.set_component_level("ai", LogLevel::ERROR);
    logger.set_component_level("ai.vcr", LogLevel::TRACE);

    EXPECT_TRUE(log::vcr.is_trace_enabled());
    EXPECT_FALSE(log::ai.is_info_enabled());
}

TEST_F(LoggingTest, MemorySinkCapturesRecords) {
    log::core.info() << "answer is " << 42;
    log::rpc.warn("node slow");

    auto entries = sink_->entries();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].component, "core");
    EXPECT_EQ(entries[0].message, "answer is 42");
    EXPECT_EQ(entries[0].level, LogLevel::INFO);
    EXPECT_EQ(entries[1].component, "rpc");
    EXPECT_EQ(entries[1].level, LogLevel::WARN);
    EXPECT_TRUE(sink_->contains("slow"));
}

TEST_F(LoggingTest, DisabledLevelIsNotRecorded) {
    AETHER_LOG_DEBUG(log::core) << "hidden";
    EXPECT_EQ(sink_->size(), 0u);

    Logger::instance().set_level(LogLevel::DEBUG);
    AETHER_LOG_DEBUG(log::core) << "shown";
    EXPECT_EQ(sink_->size(), 1u);
}

TEST_F(LoggingTest, MemorySinkIsBounded) {
    auto small = std::make_shared<MemorySink>(3);
    Logger::instance().add_sink(small);

    for (int i = 0; i < 10; ++i) {
        log::core.info() << "entry " << i;
    }

    auto entries = small->entries();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries.front().message, "entry 7");
    EXPECT_EQ(entries.back().message, "entry 9");

    small->clear();
    EXPECT_EQ(small->size(), 0u);
}

TEST_F(LoggingTest, InitLoggingAppliesConfig) {
    LogConfig config;
    config.default_level = LogLevel::WARN;
    config.console_enabled = false;
    config.component_levels["codec"] = LogLevel::TRACE;

    init_logging(config);
    Logger::instance().add_sink(sink_);

    EXPECT_EQ(Logger::instance().level(), LogLevel::WARN);
    EXPECT_TRUE(log::codec.is_trace_enabled());
    EXPECT_FALSE(log::crypto.is_info_enabled());
}

TEST_F(LoggingTest, SecretKeyNeverLogged) {
    Logger::instance().set_level(LogLevel::TRACE);

    auto seeded = KeyPair::from_seed("never-log-this-seed");
    auto generated = KeyPair::generate();
    auto restored = KeyPair::from_secret_key(seeded.export_secret_key());

    hash_t digest = sha256("message");
    (void)seeded.sign(digest);
    (void)generated.sign(digest);
    (void)restored.sign(digest);

    for (const KeyPair* kp : {&seeded, &generated, &restored}) {
        std::string secret_hex = kp->export_secret_key_hex();
        std::string bare = secret_hex.substr(2);
        for (const auto& entry : sink_->entries()) {
            EXPECT_EQ(entry.message.find(bare), std::string::npos) << entry.message;
        }
    }
}

TEST_F(LoggingTest, ThreadSafety) {
    std::atomic<int> completed{0};

    auto log_func = [&completed]() {
        ComponentLogger thread_logger("thread");
        for (int i = 0; i < 100; ++i) {
            thread_logger.info() << "Thread message " << i;
        }
        completed++;
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back(log_func);
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(completed.load(), 4);
    EXPECT_EQ(sink_->size(), 400u);
}

}  // namespace
}  // namespace aether
