#include <chrono>
#include <cmath>
#include <cstdio>
#include <thread>

#include <gtest/gtest.h>

#include "FakeTools.hpp"
#include "hls_pack/progress.hpp"

namespace hls_pack::tests {

TEST(Progress, parseElapsedTime) {
  struct TestCase {
    std::string line;
    std::optional<double> expected;
  } testCases[]{
      {"frame=  100 fps=25 time=00:00:04.00 bitrate=1000kbits/s", 4.0},
      {"size=1024kB time=01:02:03.50 bitrate=N/A speed=1x", 3723.5},
      {"time=00:10:00", 600.0},
      {"out_time=00:00:01.00 time=00:00:02.00", 1.0},
      {"frame=0 time=N/A bitrate=N/A", std::nullopt},
      {"time=12:34 speed=1x", std::nullopt},
      {"time=aa:bb:cc", std::nullopt},
      {"time=-00:00:01.00", std::nullopt},
      {"Stream mapping:", std::nullopt},
      {"", std::nullopt},
  };

  for (const TestCase &testCase : testCases) {
    auto parsed = parse_elapsed_time(testCase.line);
    ASSERT_EQ(parsed.has_value(), testCase.expected.has_value())
        << " line was '" << testCase.line << "'";
    if (parsed) {
      EXPECT_DOUBLE_EQ(*parsed, *testCase.expected)
          << " line was '" << testCase.line << "'";
    }
  }

  EXPECT_TRUE(has_time_marker("frame=0 time=N/A"));
  EXPECT_FALSE(has_time_marker("Press [q] to stop"));
}

TEST(Progress, completedIsMonotonicAndBounded) {
  ProgressRegistry registry;
  ProgressTask task = registry.add_task("video 0 @ 720p", 120.0);

  const double updates[]{10.0, 5.0, 30.0, NAN, 500.0, 20.0};
  double previous = 0.0;
  for (double value : updates) {
    task.update(value);
    auto snap = registry.get(task.id());
    ASSERT_TRUE(snap);
    EXPECT_GE(snap->completed, previous);
    EXPECT_LE(snap->completed, snap->total);
    previous = snap->completed;
  }
  EXPECT_DOUBLE_EQ(registry.get(task.id())->completed, 120.0);
}

TEST(Progress, completeSetsTotal) {
  ProgressRegistry registry;
  ProgressTask task = registry.add_task("audio 0", 60.0);
  task.update(12.0);
  task.complete();
  EXPECT_DOUBLE_EQ(registry.get(task.id())->completed, 60.0);
}

TEST(Progress, nonPositiveTotal) {
  ProgressRegistry registry;
  ProgressTask task = registry.add_task("subtitle 0", 0.0);
  EXPECT_DOUBLE_EQ(registry.get(task.id())->total, 1.0);
}

TEST(Progress, taskHandleLifetime) {
  ProgressRegistry registry;
  TaskId id;
  {
    ProgressTask task = registry.add_task("a", 10.0);
    id = task.id();
    EXPECT_EQ(registry.size(), 1u);

    ProgressTask moved = std::move(task);
    EXPECT_FALSE(task.valid());
    EXPECT_TRUE(moved.valid());
    task.update(5.0);
    EXPECT_DOUBLE_EQ(registry.get(id)->completed, 0.0);
    EXPECT_EQ(registry.size(), 1u);
  }
  EXPECT_EQ(registry.size(), 0u);
  EXPECT_FALSE(registry.get(id));
}

TEST(Progress, concurrentOwners) {
  ProgressRegistry registry;
  constexpr int TASKS = 8;

  std::vector<std::thread> workers;
  for (int t = 0; t < TASKS; ++t) {
    workers.emplace_back([&registry, t]() {
      ProgressTask task = registry.add_task("job " + std::to_string(t), 100.0);
      for (int i = 0; i <= 1000; ++i) {
        task.update(i / 10.0);
        auto snap = registry.get(task.id());
        if (!snap || snap->completed != i / 10.0)
          ADD_FAILURE() << "task " << t << " lost update " << i;
      }
    });
  }
  for (int i = 0; i < 200; ++i) {
    for (const auto &snap : registry.snapshot()) {
      EXPECT_LE(snap.completed, snap.total);
    }
  }
  for (auto &w : workers)
    w.join();
  EXPECT_EQ(registry.size(), 0u);
}

TEST(Progress, runWithProgressSuccess) {
  TempDir dir;
  Logger log("", false);
  auto encoder = write_fake_encoder(dir.path());

  ProgressRegistry registry;
  ProgressTask task = registry.add_task("video 0 @ 240p", 120.0);
  RunOutcome outcome =
      run_with_progress({encoder.string(), (dir.path() / "out.m3u8").string()},
                        task, log);

  EXPECT_TRUE(outcome.success);
  EXPECT_EQ(outcome.exit_status, 0);
  EXPECT_NE(outcome.diagnostics.find("time=00:01:00.50"), std::string::npos);
  EXPECT_DOUBLE_EQ(registry.get(task.id())->completed, 120.0);
  EXPECT_TRUE(std::filesystem::exists(dir.path() / "out.m3u8"));
}

TEST(Progress, runWithProgressFailure) {
  TempDir dir;
  Logger log("", false);
  auto encoder = write_fake_encoder(dir.path(), "480p");

  ProgressRegistry registry;
  ProgressTask task = registry.add_task("video 0 @ 480p", 120.0);
  RunOutcome outcome = run_with_progress(
      {encoder.string(), (dir.path() / "480p.m3u8").string()}, task, log);

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.exit_status, 1);
  EXPECT_NE(outcome.diagnostics.find("Conversion failed!"), std::string::npos);
  EXPECT_DOUBLE_EQ(registry.get(task.id())->completed, 120.0);
  EXPECT_FALSE(std::filesystem::exists(dir.path() / "480p.m3u8"));
}

TEST(Progress, renderProgressLine) {
  TaskSnapshot task{0, "audio 1", 200.0, 50.0};
  EXPECT_EQ(render_progress_line(task, 10),
            "audio 1 [##--------]  25% 00:00:50/00:03:20");

  task.completed = 200.0;
  EXPECT_EQ(render_progress_line(task, 4), "audio 1 [####] 100% 00:03:20/00:03:20");
}

TEST(Progress, displayStopsWithoutWaitingForInterval) {
  ProgressRegistry registry;
  ProgressTask task = registry.add_task("subtitle 0", 10.0);
  std::FILE *out = std::tmpfile();
  ASSERT_NE(out, nullptr);

  auto begin = std::chrono::steady_clock::now();
  for (int i = 0; i < 20; ++i) {
    ProgressDisplay display(registry, out, 60000);
    display.start();
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    display.stop();
    display.stop();
  }
  auto elapsed = std::chrono::steady_clock::now() - begin;
  EXPECT_LT(elapsed, std::chrono::seconds(5));

  std::fflush(out);
  std::rewind(out);
  char buffer[256] = {};
  size_t read = std::fread(buffer, 1, sizeof(buffer) - 1, out);
  std::fclose(out);
  EXPECT_NE(std::string(buffer, read).find("subtitle 0"), std::string::npos);
}

} // namespace hls_pack::tests
