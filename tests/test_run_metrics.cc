#include <gtest/gtest.h>
#include "hawk_challenge_event_log.h"
#include "hawk_checkpoint_writer.h"
#include "hawk_debug_artifacts.h"
#include "hawk_file_utils.h"
#include "hawk_run_metrics.h"
#include "hawk_test_fakes.h"

namespace hawk {
namespace {

using json = nlohmann::json;

json ReadJson(const std::string& path) {
  std::string content;
  EXPECT_TRUE(ReadFileToString(path, &content)) << path;
  return json::parse(content);
}

std::vector<JobPosting> MakeJobs(int count) {
  std::vector<JobPosting> jobs;
  for (int i = 0; i < count; ++i) {
    JobPosting job;
    job.title = "Engineer " + std::to_string(i);
    job.source = "indeed";
    if (i % 2 == 0) job.salary = "$100k";
    jobs.push_back(job);
  }
  return jobs;
}

TEST(RunMetricsTest, CountersGaugesAndEvents) {
  testing::FakeTimeSource clock;
  RunMetrics metrics("indeed", clock.source());

  metrics.Inc("challenges_detected");
  metrics.Inc("challenges_detected", 2);
  metrics.Inc("");
  metrics.SetGauge("items_total", 12);
  metrics.RecordEvent("challenge_detected", {{"reason", "title:just a moment..."},
                                             {"url", nullptr}});
  clock.Advance(std::chrono::seconds(90));

  EXPECT_EQ(metrics.Counter("challenges_detected"), 3);
  EXPECT_EQ(metrics.Counter("never_touched"), 0);

  json doc = metrics.Finalize();
  EXPECT_EQ(doc["board"], "indeed");
  EXPECT_EQ(doc["runId"], metrics.run_id());
  EXPECT_DOUBLE_EQ(doc["durationSeconds"].get<double>(), 90.0);
  EXPECT_EQ(doc["counters"]["challenges_detected"], 3);
  EXPECT_DOUBLE_EQ(doc["gauges"]["items_total"].get<double>(), 12.0);
  ASSERT_EQ(doc["events"].size(), 1u);
  EXPECT_EQ(doc["events"][0]["kind"], "challenge_detected");
  EXPECT_FALSE(doc["events"][0].contains("url"));
  EXPECT_TRUE(doc["events"][0].contains("t"));
  EXPECT_FALSE(doc.contains("extra"));
  EXPECT_FALSE(doc.contains("outputPath"));
}

TEST(RunMetricsTest, WriteJsonRendersTimestampAndRecordsPath) {
  testing::TempDir dir;
  RunMetrics metrics("linkedin");
  metrics.Inc("items_collected", 5);

  std::string path = metrics.WriteJson(dir.File("metrics_{timestamp}.json"),
                                       {{"aborted", false}});
  ASSERT_FALSE(path.empty());
  EXPECT_EQ(path.find("{timestamp}"), std::string::npos);

  json doc = ReadJson(path);
  EXPECT_EQ(doc["outputPath"], path);
  EXPECT_EQ(doc["extra"]["aborted"], false);
  EXPECT_EQ(doc["counters"]["items_collected"], 5);
}

TEST(RunMetricsTest, UnwritablePathReturnsEmpty) {
  testing::TempDir dir;
  std::string blocker = dir.File("file");
  ASSERT_TRUE(WriteFileAtomic(blocker, "x"));

  RunMetrics metrics("indeed");
  EXPECT_EQ(metrics.WriteJson(blocker + "/metrics.json"), "");
  EXPECT_FALSE(metrics.Finalize().contains("outputPath"));
}

TEST(CheckpointWriterTest, WritesAtEachIntervalOnly) {
  testing::TempDir dir;
  std::string path = dir.File("progress_checkpoint.json");
  CheckpointWriter writer(path, 25);

  std::vector<JobPosting> all = MakeJobs(60);
  std::vector<JobPosting> collected;
  std::vector<size_t> written_at;
  for (const auto& job : all) {
    collected.push_back(job);
    if (writer.MaybeWrite(collected, "rust")) {
      written_at.push_back(collected.size());
    }
  }

  ASSERT_EQ(written_at.size(), 2u);
  EXPECT_EQ(written_at[0], 25u);
  EXPECT_EQ(written_at[1], 50u);
  EXPECT_EQ(writer.write_count(), 2);

  json doc = ReadJson(path);
  EXPECT_EQ(doc["totalCollected"], 50);
  EXPECT_EQ(doc["totalWithSalary"], 25);
  EXPECT_EQ(doc["currentQuery"], "rust");
  EXPECT_EQ(doc["items"].size(), 50u);

  ASSERT_TRUE(writer.WriteCheckpoint(collected, "rust"));
  EXPECT_EQ(ReadJson(path)["totalCollected"], 60);
}

TEST(CheckpointWriterTest, SameTotalIsNotRewritten) {
  testing::TempDir dir;
  CheckpointWriter writer(dir.File("cp.json"), 5);
  std::vector<JobPosting> jobs = MakeJobs(5);
  EXPECT_TRUE(writer.MaybeWrite(jobs, "q"));
  EXPECT_FALSE(writer.MaybeWrite(jobs, "q"));

  CheckpointWriter disabled(dir.File("never.json"), 0);
  EXPECT_FALSE(disabled.MaybeWrite(jobs, "q"));
  EXPECT_FALSE(FileExists(dir.File("never.json")));
}

TEST(ChallengeEventLogTest, RewritesWholeArray) {
  testing::TempDir dir;
  std::string path = dir.File("logs/captcha_log.json");
  ChallengeEventLog log(path);

  ChallengeEvent first;
  first.query = "rust";
  first.sequence_number = 3;
  first.detail_fetch_count = 7;
  first.url = "https://x.com/jobs";
  first.reason = "title:just a moment...";
  ASSERT_TRUE(log.Append(first));

  ChallengeEvent second;
  second.timestamp = "2026-10-19T10:00:00";
  second.reason = "selector:cf-turnstile";
  ASSERT_TRUE(log.Append(second));

  json doc = ReadJson(path);
  ASSERT_TRUE(doc.is_array());
  ASSERT_EQ(doc.size(), 2u);
  EXPECT_EQ(doc[0]["sequenceNumber"], 3);
  EXPECT_EQ(doc[0]["detailFetchCount"], 7);
  EXPECT_EQ(doc[0]["reason"], "title:just a moment...");
  EXPECT_FALSE(doc[0]["timestamp"].get<std::string>().empty());
  EXPECT_EQ(doc[1]["timestamp"], "2026-10-19T10:00:00");
}

TEST(ChallengeEventLogTest, EmptyPathKeepsEventsInMemory) {
  ChallengeEventLog log("");
  EXPECT_TRUE(log.Append(ChallengeEvent()));
  EXPECT_EQ(log.size(), 1u);
}

TEST(DebugArtifactRecorderTest, CapturesOnlyTheFirstChallenge) {
  testing::TempDir dir;
  testing::FakeBrowserPage page;
  page.html = "<html>challenge</html>";
  DebugArtifactRecorder recorder(dir.File("artifacts"), true);

  EXPECT_TRUE(recorder.CaptureOnce(page, "challenge"));
  EXPECT_TRUE(recorder.captured());
  EXPECT_TRUE(FileExists(recorder.last_screenshot()));

  std::string html;
  ASSERT_TRUE(ReadFileToString(recorder.last_html(), &html));
  EXPECT_EQ(html, "<html>challenge</html>");

  EXPECT_FALSE(recorder.CaptureOnce(page, "challenge"));
  EXPECT_EQ(page.screenshots.size(), 1u);
}

TEST(DebugArtifactRecorderTest, HtmlAloneCounts) {
  testing::TempDir dir;
  testing::FakeBrowserPage page;
  page.failures["screenshot"] = PageStatus::NOT_SUPPORTED;
  DebugArtifactRecorder recorder(dir.path(), true);
  EXPECT_TRUE(recorder.CaptureOnce(page, "challenge"));
  EXPECT_TRUE(recorder.last_screenshot().empty());
  EXPECT_FALSE(recorder.last_html().empty());
}

TEST(DebugArtifactRecorderTest, DisabledRecorderDoesNothing) {
  testing::FakeBrowserPage page;
  DebugArtifactRecorder recorder("unused", false);
  EXPECT_FALSE(recorder.CaptureOnce(page, "challenge"));
  EXPECT_TRUE(page.screenshots.empty());
}

}  // namespace
}  // namespace hawk
