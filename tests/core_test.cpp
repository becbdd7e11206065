// RetroAgent headers
#include "core/AgentConfig.hpp"
#include "core/AgentError.hpp"
#include "core/ConfigLoader.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/Logger.hpp"
#include "core/StateStore.hpp"
#include "core/Supervisor.hpp"
#include "io/SimulatedBackend.hpp"

// RetroAgent fakes
#include "FakeBackend.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

// STL headers
#include <filesystem>
#include <fstream>
#include <future>
#include <map>
#include <sstream>
#include <thread>
#include <vector>

namespace retro::test {

  using core::AgentError;
  using core::EmulatorState;
  using core::ErrorKind;
  using core::ErrorMonitor;
  using core::Logger;
  using core::OperatingMode;
  using core::ProbeReading;
  using core::Supervisor;
  using namespace std::chrono_literals;

  class MockErrorMonitor : public ErrorMonitor {
  public:
    MOCK_METHOD(void, notifyFailure, (const std::string&), (override));
    MOCK_METHOD(void, clear, (), (override));
  };

  ProbeReading reading(bool running, std::optional<std::string> demo = std::nullopt,
                       std::optional<int> pid = std::nullopt) {
    ProbeReading r;
    r.running = running;
    r.currentDemo = std::move(demo);
    r.pid = pid;
    return r;
  }

  // ---------------------------------------------------------------------------
  // Supervisor
  // ---------------------------------------------------------------------------
  class SupervisorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      real = std::make_shared<FakeBackend>();
      sim = std::make_shared<io::SimulatedBackend>();
      errorMonitor = std::make_shared<testing::NiceMock<MockErrorMonitor>>();
      logger = std::make_shared<Logger>(core::LogLevel::Debug);
      logger->setStream(&logText);
      supervisor = std::make_unique<Supervisor>(real, sim, std::static_pointer_cast<ErrorMonitor>(errorMonitor),
                                                logger, 10ms);
    }

    void TearDown() override {
      real->release();
      supervisor.reset();
      logger->stop();
    }

    std::ostringstream logText;
    std::shared_ptr<FakeBackend> real;
    std::shared_ptr<io::SimulatedBackend> sim;
    std::shared_ptr<testing::NiceMock<MockErrorMonitor>> errorMonitor;
    std::shared_ptr<Logger> logger;
    std::unique_ptr<Supervisor> supervisor;
  };

  TEST_F(SupervisorTest, getStatus_StartsIdleInRealMode) {
    auto s = supervisor->getStatus();
    EXPECT_FALSE(s.running);
    EXPECT_FALSE(s.currentDemo.has_value());
    EXPECT_EQ(s.mode, OperatingMode::REAL);
    EXPECT_EQ(supervisor->mode(), OperatingMode::REAL);
    EXPECT_EQ(supervisor->probeCount(), 0u);
  }

  TEST_F(SupervisorTest, reconcile_RealProbeNotRunning) {
    real->setReading(reading(false));
    auto s = supervisor->reconcile();
    EXPECT_FALSE(s.running);
    EXPECT_FALSE(s.currentDemo.has_value());
    EXPECT_EQ(s.mode, OperatingMode::REAL);
    EXPECT_EQ(real->calls(), 1);
  }

  TEST_F(SupervisorTest, reconcile_CopiesRealReading) {
    real->setReading(reading(true, "giana.d64", 4242));
    auto s = supervisor->reconcile();
    EXPECT_TRUE(s.running);
    EXPECT_EQ(s.currentDemo, "giana.d64");
    EXPECT_EQ(s.pid, 4242);
    ASSERT_TRUE(s.runningSince.has_value());
    EXPECT_EQ(*s.runningSince, s.lastUpdated);
    EXPECT_EQ(supervisor->getStatus().currentDemo, "giana.d64");
  }

  TEST_F(SupervisorTest, reconcile_DropsDemoWhenNotRunning) {
    real->setReading(reading(false, "ghost.prg", 7));
    auto s = supervisor->reconcile();
    EXPECT_FALSE(s.running);
    EXPECT_FALSE(s.currentDemo.has_value());
    EXPECT_FALSE(s.pid.has_value());
    EXPECT_FALSE(s.runningSince.has_value());
  }

  TEST_F(SupervisorTest, reconcile_KeepsRunningSinceWithinOneRun) {
    real->setReading(reading(true, "a.prg", 10));
    auto first = supervisor->reconcile();
    std::this_thread::sleep_for(5ms);
    auto second = supervisor->reconcile();
    EXPECT_EQ(first.runningSince, second.runningSince);

    real->setReading(reading(true, "a.prg", 11)); // restarted process
    auto third = supervisor->reconcile();
    EXPECT_NE(third.runningSince, first.runningSince);
  }

  TEST_F(SupervisorTest, setDevState_RejectedInRealMode) {
    real->setReading(reading(false));
    auto before = supervisor->reconcile();

    try {
      supervisor->setDevState(true, std::string("test.prg"));
      FAIL() << "expected AgentError";
    } catch (const AgentError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::InvalidOperation);
    }

    auto after = supervisor->getStatus();
    EXPECT_TRUE(before.sameObservation(after));
    EXPECT_EQ(before.lastUpdated, after.lastUpdated);
    EXPECT_FALSE(sim->probe().running); // simulated backend untouched
  }

  TEST_F(SupervisorTest, setDevState_InSimulatedMode) {
    supervisor->setMode(OperatingMode::SIMULATED);
    auto s = supervisor->setDevState(true, std::string("test.prg"));
    EXPECT_TRUE(s.running);
    EXPECT_EQ(s.currentDemo, "test.prg");
    EXPECT_EQ(s.mode, OperatingMode::SIMULATED);
    EXPECT_FALSE(s.pid.has_value());
    EXPECT_TRUE(supervisor->getStatus().sameObservation(s));
  }

  TEST_F(SupervisorTest, setDevState_StoppedDropsDemo) {
    supervisor->setMode(OperatingMode::SIMULATED);
    auto s = supervisor->setDevState(false, std::string("test.prg"));
    EXPECT_FALSE(s.running);
    EXPECT_FALSE(s.currentDemo.has_value());
  }

  TEST_F(SupervisorTest, setMode_SimulatedTwiceIsIdempotent) {
    auto once = supervisor->setMode(OperatingMode::SIMULATED);
    auto twice = supervisor->setMode(OperatingMode::SIMULATED);
    EXPECT_TRUE(once.sameObservation(twice));
    EXPECT_GE(twice.lastUpdated, once.lastUpdated);
    EXPECT_EQ(supervisor->probeCount(), 2u); // still re-syncs
  }

  TEST_F(SupervisorTest, setMode_BackToRealDoesNotLeakSimulatedState) {
    real->setReading(reading(false));
    supervisor->setMode(OperatingMode::SIMULATED);
    supervisor->setDevState(true, std::string("demo.prg"));

    auto s = supervisor->setMode(OperatingMode::REAL);
    EXPECT_FALSE(s.running);
    EXPECT_FALSE(s.currentDemo.has_value());
    EXPECT_EQ(s.mode, OperatingMode::REAL);
    EXPECT_EQ(real->calls(), 1);
  }

  TEST_F(SupervisorTest, setMode_ReturningToSimulatedSeesEarlierDevState) {
    supervisor->setMode(OperatingMode::SIMULATED);
    supervisor->setDevState(true, std::string("demo.prg"));
    supervisor->setMode(OperatingMode::REAL);
    auto s = supervisor->setMode(OperatingMode::SIMULATED);
    EXPECT_TRUE(s.running);
    EXPECT_EQ(s.currentDemo, "demo.prg");
  }

  TEST_F(SupervisorTest, lastUpdated_NeverDecreases) {
    real->setReading(reading(true, "x.prg", 1));
    auto prev = supervisor->getStatus().lastUpdated;
    for (int i = 0; i < 50; ++i) {
      if (i % 10 == 5)
        supervisor->setMode(i % 20 == 5 ? OperatingMode::SIMULATED : OperatingMode::REAL);
      auto now = supervisor->reconcile().lastUpdated;
      EXPECT_GE(now, prev);
      EXPECT_GE(supervisor->getStatus().lastUpdated, now);
      prev = now;
    }
  }

  TEST_F(SupervisorTest, reconcile_ProbeUnavailableFoldsToNotRunning) {
    real->setReading(reading(true, "x.prg", 1));
    supervisor->reconcile();

    real->setFailure(FakeBackend::Failure::ProbeUnavailable);
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("ProbeUnavailable"))).Times(2);

    auto s = supervisor->reconcile();
    EXPECT_FALSE(s.running);
    EXPECT_FALSE(s.currentDemo.has_value());
    supervisor->reconcile();

    EXPECT_CALL(*errorMonitor, clear()).Times(1);
    real->setFailure(FakeBackend::Failure::None);
    EXPECT_TRUE(supervisor->reconcile().running);
    supervisor->reconcile(); // already recovered, no second clear
  }

  TEST_F(SupervisorTest, reconcile_BackendExceptionFoldsToNotRunning) {
    real->setFailure(FakeBackend::Failure::Runtime);
    EXPECT_CALL(*errorMonitor, notifyFailure(testing::HasSubstr("fake probe exploded"))).Times(1);
    auto s = supervisor->reconcile();
    EXPECT_FALSE(s.running);
  }

  TEST_F(SupervisorTest, reconcile_ConcurrentCallersShareOneProbe) {
    real->hold();
    auto first = std::async(std::launch::async, [&] { return supervisor->reconcile(); });
    ASSERT_TRUE(real->waitEntered(1));

    std::vector<std::future<EmulatorState>> joiners;
    for (int i = 0; i < 4; ++i)
      joiners.push_back(std::async(std::launch::async, [&] { return supervisor->refresh(); }));
    std::this_thread::sleep_for(100ms);

    real->setReading(reading(true, "shared.prg", 9));
    real->release();

    auto leader = first.get();
    for (auto& f : joiners)
      EXPECT_TRUE(f.get().sameObservation(leader));
    EXPECT_EQ(real->calls(), 1);
    EXPECT_EQ(supervisor->probeCount(), 1u);
  }

  TEST_F(SupervisorTest, getStatus_ReadersSeePreOrPostSnapshotOnly) {
    real->setReading(reading(false));
    const auto pre = supervisor->reconcile();

    real->setReading(reading(true, "post.prg", 77));
    real->hold();
    auto writer = std::async(std::launch::async, [&] { return supervisor->reconcile(); });
    ASSERT_TRUE(real->waitEntered(2));

    std::atomic<bool> done{ false };
    std::atomic<int> hybrids{ 0 };
    std::atomic<int> reads{ 0 };
    std::vector<std::thread> readers;
    for (int i = 0; i < 8; ++i) {
      readers.emplace_back([&] {
        while (!done.load()) {
          auto s = supervisor->getStatus();
          ++reads;
          const bool isPre = s.sameObservation(pre);
          const bool isPost = s.running && s.currentDemo == "post.prg" && s.pid == 77;
          if (!isPre && !isPost)
            ++hybrids;
        }
      });
    }

    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(supervisor->getStatus().sameObservation(pre)); // probe still parked
    real->release();
    const auto post = writer.get();
    std::this_thread::sleep_for(20ms);
    done = true;
    for (auto& t : readers)
      t.join();

    EXPECT_GT(reads.load(), 0);
    EXPECT_EQ(hybrids.load(), 0);
    EXPECT_TRUE(post.running);
  }

  TEST_F(SupervisorTest, setMode_WaitsForInFlightThenProbesNewBackend) {
    real->hold();
    auto tick = std::async(std::launch::async, [&] { return supervisor->reconcile(); });
    ASSERT_TRUE(real->waitEntered(1));

    sim->applyDevState(true, std::string("sim.prg"));
    auto switcher = std::async(std::launch::async, [&] { return supervisor->setMode(OperatingMode::SIMULATED); });
    EXPECT_EQ(switcher.wait_for(50ms), std::future_status::timeout);

    real->release();
    tick.get();
    auto s = switcher.get();
    EXPECT_EQ(s.mode, OperatingMode::SIMULATED);
    EXPECT_EQ(s.currentDemo, "sim.prg");
    EXPECT_EQ(real->calls(), 1);
    EXPECT_EQ(supervisor->getStatus().mode, OperatingMode::SIMULATED);
  }

  TEST_F(SupervisorTest, start_TicksUntilStopped) {
    real->setReading(reading(true, "loop.prg", 5));
    supervisor->start();
    ASSERT_TRUE(real->waitEntered(3));
    supervisor->stop();
    supervisor->stop(); // idempotent

    const int after = real->calls();
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(real->calls(), after);
    EXPECT_TRUE(supervisor->getStatus().running);
  }

  TEST_F(SupervisorTest, stop_LetsInFlightReconcileFinish) {
    real->hold();
    supervisor->start();
    ASSERT_TRUE(real->waitEntered(1));

    real->setReading(reading(true, "last.prg", 3));
    auto stopper = std::async(std::launch::async, [&] { supervisor->stop(); });
    EXPECT_EQ(stopper.wait_for(50ms), std::future_status::timeout);

    real->release();
    stopper.get();
    EXPECT_EQ(supervisor->getStatus().currentDemo, "last.prg");
  }

  TEST(supervisor_ctor, rejects_missing_collaborators) {
    auto logger = std::make_shared<Logger>();
    auto monitor = std::make_shared<ErrorMonitor>();
    auto sim = std::make_shared<io::SimulatedBackend>();
    EXPECT_THROW(Supervisor(nullptr, sim, monitor, logger), std::invalid_argument);
    EXPECT_THROW(Supervisor(std::make_shared<FakeBackend>(), sim, nullptr, logger), std::invalid_argument);
    EXPECT_THROW(Supervisor(std::make_shared<FakeBackend>(), sim, monitor, logger, 0ms), std::invalid_argument);
  }

  // ---------------------------------------------------------------------------
  // EmulatorState / StateStore
  // ---------------------------------------------------------------------------
  TEST(emulator_state, parses_modes_exactly) {
    EXPECT_EQ(core::parseMode("REAL"), OperatingMode::REAL);
    EXPECT_EQ(core::parseMode("SIMULATED"), OperatingMode::SIMULATED);
    for (const char* bad : { "real", "Simulated", "", "FAKE" }) {
      try {
        core::parseMode(bad);
        FAIL() << "accepted " << bad;
      } catch (const AgentError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidInput);
      }
    }
  }

  TEST(emulator_state, formats_utc_millis) {
    core::TimePoint tp{ std::chrono::milliseconds{ 1234 } };
    EXPECT_EQ(core::formatTimestamp(tp), "1970-01-01T00:00:01.234Z");
  }

  TEST(emulator_state, uptime_is_zero_when_idle) {
    EmulatorState s;
    s.runningSince = core::TimePoint{};
    s.lastUpdated = core::TimePoint{ std::chrono::seconds{ 30 } };
    EXPECT_EQ(s.uptimeSeconds(), 0);
    s.running = true;
    EXPECT_EQ(s.uptimeSeconds(), 30);
    EXPECT_STREQ(s.phase(), "RUNNING");
  }

  TEST(state_store, clamps_backwards_timestamps) {
    core::StateStore store;
    EmulatorState a;
    a.lastUpdated = core::TimePoint{ std::chrono::seconds{ 100 } };
    store.replace(a);

    EmulatorState b;
    b.running = true;
    b.lastUpdated = core::TimePoint{ std::chrono::seconds{ 50 } };
    auto stored = store.replace(b);
    EXPECT_TRUE(stored.running);
    EXPECT_EQ(stored.lastUpdated, a.lastUpdated);
    EXPECT_EQ(store.snapshot().lastUpdated, a.lastUpdated);
  }

  // ---------------------------------------------------------------------------
  // ErrorMonitor
  // ---------------------------------------------------------------------------
  TEST(error_monitor, forwards_each_message_once_until_cleared) {
    ErrorMonitor monitor;
    std::vector<std::string> escalated;
    monitor.registerEscalation([&](const std::string& m) { escalated.push_back(m); });

    monitor.notifyFailure("probe down");
    monitor.notifyFailure("probe down");
    monitor.notifyFailure("other");
    EXPECT_EQ(escalated.size(), 2u);
    EXPECT_EQ(monitor.activeCount(), 2u);

    monitor.clear();
    monitor.notifyFailure("probe down");
    EXPECT_EQ(escalated.size(), 3u);
  }

  // ---------------------------------------------------------------------------
  // Logger
  // ---------------------------------------------------------------------------
  TEST(logger, writes_formatted_lines_and_filters_level) {
    std::ostringstream out;
    Logger log(core::LogLevel::Info);
    log.setStream(&out);
    log.start();
    Logger::setThreadName("tester");
    log.debug("Comp", "hidden");
    log.info("Comp", "hello");
    log.error("Comp", "boom");
    log.stop();

    const std::string text = out.str();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find(" - tester - INFO - Comp: hello"), std::string::npos);
    EXPECT_NE(text.find(" - tester - ERROR - Comp: boom"), std::string::npos);
  }

  TEST(logger, drops_oldest_when_queue_full) {
    std::ostringstream out;
    Logger log(core::LogLevel::Debug, 2);
    log.setStream(&out);
    for (int i = 0; i < 5; ++i)
      log.info("Q", "msg" + std::to_string(i)); // not started: stays queued
    EXPECT_EQ(log.dropped(), 3u);
    log.stop();

    const std::string text = out.str();
    EXPECT_EQ(text.find("msg2"), std::string::npos);
    EXPECT_NE(text.find("msg3"), std::string::npos);
    EXPECT_NE(text.find("msg4"), std::string::npos);
  }

  // ---------------------------------------------------------------------------
  // Configuration
  // ---------------------------------------------------------------------------
  TEST(agent_config, applies_json_overlay) {
    core::AgentConfig cfg;
    cfg.applyJson(nlohmann::json{ { "host", "127.0.0.1" },
                                  { "port", 8080 },
                                  { "debug", false },
                                  { "processName", "x128" },
                                  { "statusFile", "/run/retro/status.json" },
                                  { "programExtensions", { ".prg" } },
                                  { "reconcileIntervalMs", 250 },
                                  { "probeTimeoutMs", 500 } });
    EXPECT_EQ(cfg.host, "127.0.0.1");
    EXPECT_EQ(cfg.port, 8080);
    EXPECT_FALSE(cfg.debug);
    EXPECT_EQ(cfg.probe.processName, "x128");
    EXPECT_EQ(cfg.probe.statusFile, "/run/retro/status.json");
    EXPECT_EQ(cfg.probe.programExtensions, std::vector<std::string>{ ".prg" });
    EXPECT_EQ(cfg.reconcileInterval, 250ms);
    EXPECT_EQ(cfg.probeTimeout, 500ms);
    EXPECT_NO_THROW(cfg.validate());
  }

  TEST(agent_config, rejects_wrong_types_and_ranges) {
    core::AgentConfig cfg;
    EXPECT_THROW(cfg.applyJson(nlohmann::json{ { "port", "80" } }), std::invalid_argument);
    EXPECT_THROW(cfg.applyJson(nlohmann::json{ { "port", 70000 } }), std::invalid_argument);
    EXPECT_THROW(cfg.applyJson(nlohmann::json{ { "reconcileIntervalMs", 0 } }), std::invalid_argument);
    EXPECT_THROW(cfg.applyJson(nlohmann::json{ { "programExtensions", { 1, 2 } } }), std::invalid_argument);

    cfg.probe.processName.clear();
    EXPECT_THROW(cfg.validate(), std::invalid_argument);
  }

  TEST(agent_config, environment_overrides_file) {
    core::AgentConfig cfg;
    cfg.applyJson(nlohmann::json{ { "port", 8080 }, { "debug", false } });

    std::map<std::string, std::string> env{ { "RETRO_AGENT_PORT", "9090" },
                                            { "RETRO_AGENT_DEBUG", "TRUE" },
                                            { "RETRO_AGENT_PROCESS", "vice" } };
    auto fakeEnv = [&](const char* name) -> std::optional<std::string> {
      auto it = env.find(name);
      if (it == env.end())
        return std::nullopt;
      return it->second;
    };
    cfg.applyEnvironment(fakeEnv);
    EXPECT_EQ(cfg.port, 9090);
    EXPECT_TRUE(cfg.debug);
    EXPECT_EQ(cfg.probe.processName, "vice");
    EXPECT_EQ(cfg.host, "0.0.0.0");

    env["RETRO_AGENT_PORT"] = "not-a-port";
    EXPECT_THROW(cfg.applyEnvironment(fakeEnv), std::invalid_argument);
  }

  TEST(agent_config, bool_flag_parsing) {
    EXPECT_TRUE(core::parseBoolFlag("true"));
    EXPECT_TRUE(core::parseBoolFlag("True"));
    EXPECT_FALSE(core::parseBoolFlag("1"));
    EXPECT_FALSE(core::parseBoolFlag("false"));
  }

  TEST(config_loader, loads_and_reports_errors) {
    const auto dir = std::filesystem::temp_directory_path() / "retro_config_test";
    std::filesystem::create_directories(dir);
    const auto good = dir / "good.json";
    const auto bad = dir / "bad.json";
    std::ofstream(good) << R"({"port": 6000})";
    std::ofstream(bad) << R"({"port": )";

    auto doc = core::ConfigLoader(good.string()).load();
    EXPECT_EQ(doc["port"], 6000);
    EXPECT_THROW(core::ConfigLoader(bad.string()).load(), std::runtime_error);
    EXPECT_THROW(core::ConfigLoader((dir / "missing.json").string()).load(), std::runtime_error);

    std::filesystem::remove_all(dir);
  }

} // namespace retro::test
