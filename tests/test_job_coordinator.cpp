// Unit tests for JobCoordinator: the shared ceiling, continue-on-error,
// pre-flight validation, the single-batch guard and progress events.

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>

#include "fixtures/fake_tools.hpp"
#include "multicam/job_coordinator.hpp"

namespace multicam {
namespace {

using fakes::FakeExtractor;
using fakes::FixedResourceProbe;
using fakes::MemoryStore;
using fakes::RecordingSink;
using fakes::ScriptedProber;
using fakes::ScriptedTranscoder;
using fakes::SleepRecorder;
using fakes::TempDir;
using fakes::ToolMonitor;

JobDescriptor MakeJob(int sequence, const std::vector<std::string> &angles,
                      const std::string &start = "", const std::string &end = "") {
  JobDescriptor d;
  d.event_date = "10-02";
  d.sequence = sequence;
  /// Non-overlapping hour-long windows by default
  d.window_start = start.empty() ? fmt::format("{:02}:00:00", sequence) : start;
  d.window_end = end.empty() ? fmt::format("{:02}:30:00", sequence) : end;
  for (const auto &a : angles) {
    d.angles[a] = fmt::format("/footage/game{}_{}.mp4", sequence, a);
  }
  return d;
}

// Threads in this process, from /proc/self/status.
int ThreadCount() {
  std::ifstream in("/proc/self/status");
  std::string line;
  while (std::getline(in, line)) {
    if (line.compare(0, 8, "Threads:") == 0) return std::stoi(line.substr(8));
  }
  return 0;
}

// Records the highest thread count seen while extractions run.
class ThreadCountingExtractor : public FakeExtractor {
 public:
  Status extract(const std::string &source_path, double start, double end,
                 const std::string &output_path) override {
    int n = ThreadCount();
    int seen = peak_threads.load();
    while (n > seen && !peak_threads.compare_exchange_weak(seen, n)) {
    }
    return FakeExtractor::extract(source_path, start, end, output_path);
  }

  std::atomic<int> peak_threads{0};
};

std::string KeyFor(int sequence, const std::string &angle) {
  return fmt::format("Games/10-02/Game-{0}/10-02_game{0}_{1}.mp4", sequence,
                     angle);
}

class JobCoordinatorTest : public ::testing::Test {
 protected:
  JobCoordinatorTest()
      : store(std::make_shared<MemoryStore>()),
        transfer(fakes::TestStorage(), fakes::TestPolicy(),
                 fakes::SharedFactory(store)),
        extractor(&monitor),
        probe(8, 16.0, false) {
    transfer.set_sleeper(sleeps.sleeper());
    tools.extractor = &extractor;
    tools.prober = &prober;
    tools.transcoder = &transcoder;
    coordinator = std::make_unique<JobCoordinator>(transfer, tools, probe,
                                                   &sink, dir.path(), "Games");
  }

  const Job &Find(const std::vector<Job> &jobs, const std::string &id) {
    for (const auto &j : jobs) {
      if (j.id == id) return j;
    }
    ADD_FAILURE() << "no job " << id;
    return jobs.front();
  }

  TempDir dir;
  std::shared_ptr<MemoryStore> store;
  TransferClient transfer;
  SleepRecorder sleeps;
  ToolMonitor monitor;
  FakeExtractor extractor;
  ScriptedProber prober;
  ScriptedTranscoder transcoder;
  FixedResourceProbe probe;
  RecordingSink sink;
  MediaTools tools;
  std::unique_ptr<JobCoordinator> coordinator;
};

TEST_F(JobCoordinatorTest, InFlightWorkNeverExceedsCeiling) {
  std::vector<JobDescriptor> jobs;
  for (int i = 1; i <= 5; ++i) jobs.push_back(MakeJob(i, {"a", "b", "c"}));
  monitor.SetBarrier(2);
  monitor.SetHold(std::chrono::milliseconds(10));

  Status s = coordinator->process_batch(jobs, 2);

  ASSERT_TRUE(s.ok()) << s.message;
  EXPECT_EQ(monitor.peak(), 2);
  EXPECT_LE(coordinator->gate().peak(), 2);
  EXPECT_EQ(extractor.calls.load(), 15);

  BatchStatus st = coordinator->status();
  EXPECT_FALSE(st.processing_active);
  EXPECT_EQ(st.total_jobs, 5);
  EXPECT_EQ(st.completed, 5);
  EXPECT_EQ(st.error, 0);
  EXPECT_EQ(st.pending, 0);
  EXPECT_EQ(st.ceiling, 2);
}

TEST_F(JobCoordinatorTest, CeilingComesFromResourceProbe) {
  /// 4 CPUs -> cpuBound 2; 64GB -> memBound 32
  FixedResourceProbe small(4, 64.0, false);
  JobCoordinator c(transfer, tools, small, &sink, dir.path(), "Games");
  std::vector<JobDescriptor> jobs = {MakeJob(1, {"a", "b", "c", "d"})};
  monitor.SetHold(std::chrono::milliseconds(5));

  ASSERT_TRUE(c.process_batch(jobs).ok());
  EXPECT_EQ(c.status().ceiling, 2);
  EXPECT_LE(monitor.peak(), 2);
  EXPECT_EQ(c.resources().cpu_count, 4);
  EXPECT_EQ(c.resources().computed_ceiling, 2);
}

TEST_F(JobCoordinatorTest, CeilingOverrideIsClamped) {
  ASSERT_TRUE(coordinator->process_batch({MakeJob(1, {"a"})}, 10).ok());
  EXPECT_EQ(coordinator->status().ceiling, MAX_CEILING);
}

TEST_F(JobCoordinatorTest, OneFailedAngleFailsOnlyItsJob) {
  extractor.FailFor("/footage/game1_c.mp4");

  Status s = coordinator->process_batch({MakeJob(1, {"a", "b", "c", "d"})});
  ASSERT_TRUE(s.ok());

  std::vector<Job> jobs = coordinator->job_snapshots();
  ASSERT_EQ(jobs.size(), 1u);
  const Job &job = jobs[0];
  EXPECT_EQ(job.status, JobStatus::Error);
  EXPECT_EQ(job.error_message, "1 angles failed");
  EXPECT_EQ(job.angle_status.at("a"), AngleStatus::Complete);
  EXPECT_EQ(job.angle_status.at("b"), AngleStatus::Complete);
  EXPECT_EQ(job.angle_status.at("c"), AngleStatus::Error);
  EXPECT_EQ(job.angle_status.at("d"), AngleStatus::Complete);

  EXPECT_TRUE(store->Has(KeyFor(1, "a")));
  EXPECT_FALSE(store->Has(KeyFor(1, "c")));
  EXPECT_EQ(store->Keys().size(), 3u);
  EXPECT_TRUE(dir.Files().empty());

  BatchStatus st = coordinator->status();
  EXPECT_EQ(st.completed, 0);
  EXPECT_EQ(st.error, 1);
}

TEST_F(JobCoordinatorTest, FailedJobDoesNotStopOtherJobs) {
  extractor.FailFor("/footage/game1_a.mp4");
  extractor.FailFor("/footage/game1_b.mp4");

  ASSERT_TRUE(coordinator
                  ->process_batch({MakeJob(1, {"a", "b"}), MakeJob(2, {"a"}),
                                   MakeJob(3, {"a", "b"})})
                  .ok());

  std::vector<Job> jobs = coordinator->job_snapshots();
  EXPECT_EQ(Find(jobs, "10-02_game1").status, JobStatus::Error);
  EXPECT_EQ(Find(jobs, "10-02_game1").error_message, "2 angles failed");
  EXPECT_EQ(Find(jobs, "10-02_game2").status, JobStatus::Completed);
  EXPECT_EQ(Find(jobs, "10-02_game3").status, JobStatus::Completed);

  BatchStatus st = coordinator->status();
  EXPECT_EQ(st.completed, 2);
  EXPECT_EQ(st.error, 1);
}

TEST_F(JobCoordinatorTest, HdAndUhdAnglesRunConcurrently) {
  prober.Set("_A_", {1920, 1080});
  prober.Set("_B_", {3840, 2160});
  monitor.SetBarrier(2);

  ASSERT_TRUE(coordinator->process_batch({MakeJob(1, {"A", "B"})}, 2).ok());
  coordinator->flush_progress();

  EXPECT_EQ(monitor.peak(), 2);
  EXPECT_EQ(transcoder.calls(), 1);
  EXPECT_EQ(store->Get(KeyFor(1, "A")), "segment:/footage/game1_A.mp4");
  EXPECT_EQ(store->Get(KeyFor(1, "B")),
            "compressed:segment:/footage/game1_B.mp4");

  std::vector<Job> jobs = coordinator->job_snapshots();
  EXPECT_EQ(jobs[0].status, JobStatus::Completed);
  EXPECT_TRUE(sink.HasStage("skipping_compression"));
  EXPECT_TRUE(sink.HasStage("compressing"));
}

TEST_F(JobCoordinatorTest, RerunOfUploadedJobDoesNoWork) {
  std::vector<JobDescriptor> jobs = {MakeJob(1, {"a", "b"})};
  prober.Set("_b_", {3840, 2160});
  ASSERT_TRUE(coordinator->process_batch(jobs).ok());

  int extracts = extractor.calls.load();
  int probes = prober.calls.load();
  int transcodes = transcoder.calls();
  int puts = store->puts.load();

  ASSERT_TRUE(coordinator->process_batch(jobs).ok());

  EXPECT_EQ(extractor.calls.load(), extracts);
  EXPECT_EQ(prober.calls.load(), probes);
  EXPECT_EQ(transcoder.calls(), transcodes);
  EXPECT_EQ(store->puts.load(), puts);
  EXPECT_EQ(coordinator->job_snapshots()[0].status, JobStatus::Completed);
}

TEST_F(JobCoordinatorTest, MissingCredentialsRejectBatchBeforeWork) {
  StorageConfig empty = fakes::TestStorage();
  empty.access_key.clear();
  transfer.reconfigure(empty);

  Status s = coordinator->process_batch({MakeJob(1, {"a"})});
  coordinator->flush_progress();

  EXPECT_EQ(s.kind, ErrorKind::Validation);
  EXPECT_EQ(extractor.calls.load(), 0);
  EXPECT_EQ(probe.snapshots.load(), 0);
  EXPECT_TRUE(sink.events().empty());
  EXPECT_FALSE(coordinator->status().processing_active);
}

TEST_F(JobCoordinatorTest, InvalidDescriptorRejectsWholeBatch) {
  Status s = coordinator->process_batch(
      {MakeJob(1, {"a"}), MakeJob(2, {"a"}, "02:30:00", "02:00:00")});

  EXPECT_EQ(s.kind, ErrorKind::Validation);
  EXPECT_EQ(extractor.calls.load(), 0);
  EXPECT_EQ(coordinator->status().total_jobs, 0);
}

TEST_F(JobCoordinatorTest, OverlappingWindowsRejectBatch) {
  Status s = coordinator->process_batch(
      {MakeJob(1, {"a"}, "01:00:00", "02:00:00"),
       MakeJob(2, {"a"}, "01:30:00", "02:30:00")});

  EXPECT_EQ(s.kind, ErrorKind::Validation);
  EXPECT_EQ(extractor.calls.load(), 0);
}

TEST_F(JobCoordinatorTest, SecondBatchRejectedWhileActive) {
  /// Hold the only extraction until the second call has been made
  monitor.SetBarrier(100);

  Status first;
  std::thread runner([&] { first = coordinator->process_batch({MakeJob(1, {"a"})}); });

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (monitor.in_flight() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  ASSERT_EQ(monitor.in_flight(), 1);
  EXPECT_TRUE(coordinator->status().processing_active);
  EXPECT_EQ(coordinator->status().in_progress, 1);

  Status second = coordinator->process_batch({MakeJob(2, {"a"})});
  EXPECT_EQ(second.kind, ErrorKind::Validation);
  EXPECT_EQ(second.message, "Processing already active");

  monitor.Release();
  runner.join();

  EXPECT_TRUE(first.ok());
  EXPECT_FALSE(coordinator->status().processing_active);
  EXPECT_EQ(coordinator->status().completed, 1);
}

TEST_F(JobCoordinatorTest, ThrowingSinkDoesNotAbortProcessing) {
  sink.throw_on_notify = true;

  ASSERT_TRUE(coordinator->process_batch({MakeJob(1, {"a", "b"})}).ok());
  coordinator->flush_progress();

  EXPECT_EQ(coordinator->status().completed, 1);
  EXPECT_FALSE(sink.events().empty());
}

TEST_F(JobCoordinatorTest, EventsCoverBatchJobAndAngleLifecycle) {
  ASSERT_TRUE(coordinator->process_batch({MakeJob(1, {"a"})}).ok());
  coordinator->flush_progress();

  std::vector<ProgressEvent> events = sink.events();
  ASSERT_GE(events.size(), 4u);
  EXPECT_EQ(events.front().stage, "batch_started");
  EXPECT_EQ(events.front().aggregate.total, 1);
  EXPECT_EQ(events.back().stage, "batch_completed");
  EXPECT_EQ(events.back().aggregate.completed, 1);
  EXPECT_EQ(events.back().aggregate.failed, 0);

  std::vector<std::string> job_stages = {"started", "completed"};
  EXPECT_EQ(sink.Stages("10-02_game1", ""), job_stages);

  std::vector<std::string> angle_stages = {
      "angle_started", "extracting", "checking_resolution",
      "skipping_compression", "uploading", "angle_completed"};
  EXPECT_EQ(sink.Stages("10-02_game1", "a"), angle_stages);

  for (const auto &e : events) {
    if (e.angle_id == "a" && e.stage == "uploading") {
      EXPECT_EQ(e.angle_status.at("a"), AngleStatus::Uploading);
      EXPECT_EQ(e.status, JobStatus::Processing);
    }
  }
}

TEST_F(JobCoordinatorTest, FailedAngleEventCarriesError) {
  extractor.FailFor("/footage/game1_a.mp4");

  ASSERT_TRUE(coordinator->process_batch({MakeJob(1, {"a"})}).ok());
  coordinator->flush_progress();

  bool seen = false;
  for (const auto &e : sink.events()) {
    if (e.stage == "angle_error") {
      seen = true;
      EXPECT_EQ(e.angle_id, "a");
      EXPECT_FALSE(e.error.empty());
    }
    if (e.stage == "error") {
      EXPECT_EQ(e.error, "1 angles failed");
      EXPECT_EQ(e.aggregate.failed, 1);
    }
  }
  EXPECT_TRUE(seen);
}

TEST_F(JobCoordinatorTest, AcceleratorUsedOnlyWhenEnabledAndPresent) {
  prober.SetDefault({3840, 2160});
  StorageConfig accel = fakes::TestStorage();
  accel.accelerator_enabled = true;
  transfer.reconfigure(accel);

  FixedResourceProbe with_gpu(8, 16.0, true);
  JobCoordinator gpu(transfer, tools, with_gpu, nullptr, dir.path(), "Games");
  ASSERT_TRUE(gpu.process_batch({MakeJob(1, {"a"})}).ok());
  ASSERT_EQ(transcoder.backends().size(), 1u);
  EXPECT_EQ(transcoder.backends()[0], TranscodeBackend::Hardware);
  /// Accelerator present: ceiling capped at 2
  EXPECT_EQ(gpu.status().ceiling, 2);

  /// Enabled in configuration but no device detected
  ASSERT_TRUE(coordinator->process_batch({MakeJob(2, {"a"})}).ok());
  ASSERT_EQ(transcoder.backends().size(), 2u);
  EXPECT_EQ(transcoder.backends()[1], TranscodeBackend::Software);
}

TEST_F(JobCoordinatorTest, LargeBatchRunsOnBoundedWorkerPool) {
  ThreadCountingExtractor counting;
  tools.extractor = &counting;
  JobCoordinator c(transfer, tools, probe, &sink, dir.path(), "Games");

  /// One job per event date so the windows never overlap
  std::vector<JobDescriptor> jobs;
  for (int i = 0; i < 300; ++i) {
    JobDescriptor d = MakeJob(1, {"a", "b", "c", "d"});
    d.event_date = fmt::format("day{}", i);
    jobs.push_back(d);
  }

  int baseline = ThreadCount();
  Status s = c.process_batch(jobs, 1);

  ASSERT_TRUE(s.ok()) << s.message;
  EXPECT_EQ(counting.calls.load(), 1200);
  /// One pool worker at ceiling 1, plus slack for multipart workers
  EXPECT_LE(counting.peak_threads.load(), baseline + 1 + 2);

  BatchStatus st = c.status();
  EXPECT_EQ(st.total_jobs, 300);
  EXPECT_EQ(st.completed, 300);
  EXPECT_EQ(st.error, 0);
  EXPECT_EQ(st.pending, 0);
  EXPECT_EQ(st.in_progress, 0);
}

TEST_F(JobCoordinatorTest, SlowSinkDoesNotHoldUpProcessing) {
  sink.delay = std::chrono::milliseconds(100);

  auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(coordinator->process_batch({MakeJob(1, {"a"})}).ok());
  auto elapsed = std::chrono::steady_clock::now() - start;

  /// Ten events at 100ms each would take a second if delivered inline
  EXPECT_LT(elapsed, std::chrono::milliseconds(300));
  EXPECT_EQ(coordinator->status().completed, 1);

  coordinator->flush_progress();
  std::vector<ProgressEvent> events = sink.events();
  ASSERT_GE(events.size(), 4u);
  EXPECT_EQ(events.front().stage, "batch_started");
  EXPECT_EQ(events.back().stage, "batch_completed");
}

TEST_F(JobCoordinatorTest, SinkThrowingNonStandardExceptionDoesNotAbort) {
  sink.throw_int = true;

  ASSERT_TRUE(coordinator->process_batch({MakeJob(1, {"a", "b"})}).ok());
  coordinator->flush_progress();

  EXPECT_EQ(coordinator->status().completed, 1);
  EXPECT_TRUE(sink.HasStage("batch_completed"));
}

TEST(BatchExitCodeTest, FailedJobsNeverMapToSuccess) {
  BatchStatus st;
  EXPECT_EQ(batch_exit_code(st), 0);
  st.error = 3;
  EXPECT_EQ(batch_exit_code(st), 3);
  st.error = 255;
  EXPECT_EQ(batch_exit_code(st), 255);
  st.error = 256;
  EXPECT_EQ(batch_exit_code(st), 255);
  st.error = 1000;
  EXPECT_EQ(batch_exit_code(st), 255);
}

}  // namespace
}  // namespace multicam
