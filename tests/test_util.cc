#include <gtest/gtest.h>
#include <set>
#include <string>
#include "hawk_extractor_chain.h"
#include "hawk_file_utils.h"
#include "hawk_hash.h"
#include "hawk_string_utils.h"
#include "hawk_test_fakes.h"
#include "hawk_time_source.h"
#include "hawk_url_utils.h"
#include "logger.h"

namespace hawk {
namespace {

TEST(StringUtilsTest, NormalizeTextCollapsesWhitespace) {
  EXPECT_EQ(NormalizeText("  Senior\t\tRust   Engineer \n"), "senior rust engineer");
  EXPECT_EQ(NormalizeText(""), "");
}

TEST(StringUtilsTest, SplitAndTrimDropsEmptyPieces) {
  auto parts = SplitAndTrim(" a, b ,,c ,", ',');
  ASSERT_EQ(parts.size(), 3u);
  EXPECT_EQ(parts[0], "a");
  EXPECT_EQ(parts[1], "b");
  EXPECT_EQ(parts[2], "c");
}

TEST(StringUtilsTest, TruncateMarksShortenedValues) {
  EXPECT_EQ(Truncate("abcdef", 3), "abc...");
  EXPECT_EQ(Truncate("abc", 3), "abc");
  EXPECT_EQ(ReplaceAll("a{x}b{x}", "{x}", "-"), "a-b-");
}

TEST(UrlUtilsTest, ParseUrlSplitsComponents) {
  ParsedUrl parsed = ParseUrl("HTTPS://Example.com:8443/jobs/view?jk=1&q=a#top");
  EXPECT_EQ(parsed.scheme, "https");
  EXPECT_EQ(parsed.authority, "Example.com:8443");
  EXPECT_EQ(parsed.path, "/jobs/view");
  EXPECT_EQ(parsed.query, "jk=1&q=a");
  EXPECT_EQ(parsed.fragment, "top");
}

TEST(UrlUtilsTest, QueryParamsAreDecoded) {
  EXPECT_EQ(GetQueryParam("https://x.com/?q=rust+engineer&l=New%20York", "l"),
            std::optional<std::string>("New York"));
  EXPECT_EQ(GetQueryParam("https://x.com/?q=rust+engineer", "q"),
            std::optional<std::string>("rust engineer"));
  EXPECT_FALSE(GetQueryParam("https://x.com/?q=", "q").has_value());
  EXPECT_FALSE(GetQueryParam("https://x.com/", "q").has_value());
}

TEST(UrlUtilsTest, FormBodyEncodesReservedCharacters) {
  EXPECT_EQ(BuildFormBody({{"key", "a b"}, {"url", "https://x.com/?a=1&b=2"}}),
            "key=a%20b&url=https%3A%2F%2Fx.com%2F%3Fa%3D1%26b%3D2");
}

TEST(UrlUtilsTest, CacheNormalizationDropsTrackingAndFragment) {
  EXPECT_EQ(NormalizeUrlForCache(" https://WWW.Indeed.com/viewjob?jk=abc&utm_source=x&UTM_medium=y#frag "),
            "https://www.indeed.com/viewjob?jk=abc");
  EXPECT_EQ(NormalizeUrlForCache("https://x.com/a?b=2&a=1"), "https://x.com/a?b=2&a=1");
  EXPECT_EQ(NormalizeUrlForCache("https://x.com/Path?utm_campaign=z"), "https://x.com/Path");
}

TEST(HashTest, Sha256MatchesKnownDigest) {
  EXPECT_EQ(Sha256Hex("abc"),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashTest, StableBucketUsesDigestPrefix) {
  // 0xba7816bf % 10
  EXPECT_EQ(StableBucket("abc", 10), 9);
  EXPECT_EQ(StableBucket("abc", 1), 0);
  EXPECT_EQ(StableBucket("anything", 0), 0);
  for (int i = 0; i < 50; ++i) {
    int bucket = StableBucket("query-" + std::to_string(i), 7);
    EXPECT_GE(bucket, 0);
    EXPECT_LT(bucket, 7);
  }
}

TEST(HashTest, SessionIdsAreShortHex) {
  std::set<std::string> seen;
  for (int i = 0; i < 20; ++i) {
    std::string id = GenerateSessionId();
    ASSERT_EQ(id.size(), 12u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    seen.insert(id);
  }
  EXPECT_GT(seen.size(), 1u);
}

TEST(TimeSourceTest, JitterStaysInRange) {
  for (int i = 0; i < 100; ++i) {
    Millis jitter = RandomJitter(100, 250);
    EXPECT_GE(jitter.count(), 100);
    EXPECT_LE(jitter.count(), 250);
  }
  EXPECT_EQ(RandomJitter(500, 500).count(), 500);
  EXPECT_EQ(RandomJitter(-5, -10).count(), 0);
}

TEST(TimeSourceTest, TimestampTemplateIsRendered) {
  std::string rendered = RenderTimestampTemplate("out/metrics_{timestamp}.json");
  EXPECT_EQ(rendered.find("{timestamp}"), std::string::npos);
  EXPECT_EQ(rendered.size(), std::string("out/metrics_20261019_101502.json").size());
}

TEST(FileUtilsTest, AtomicWriteAndAppend) {
  testing::TempDir dir;
  std::string path = JoinPath(JoinPath(dir.path(), "nested/deeper"), "state.json");

  ASSERT_TRUE(WriteFileAtomic(path, "{\"a\":1}"));
  EXPECT_TRUE(FileExists(path));
  EXPECT_FALSE(FileExists(path + ".tmp"));

  std::string content;
  ASSERT_TRUE(ReadFileToString(path, &content));
  EXPECT_EQ(content, "{\"a\":1}");

  std::string log = JoinPath(dir.path(), "logs/events.jsonl");
  ASSERT_TRUE(AppendToFile(log, "one\n"));
  ASSERT_TRUE(AppendToFile(log, "two\n"));
  ASSERT_TRUE(ReadFileToString(log, &content));
  EXPECT_EQ(content, "one\ntwo\n");

  EXPECT_FALSE(ReadFileToString(JoinPath(dir.path(), "missing"), &content));
}

TEST(ExtractorChainTest, FirstProducingStepWins) {
  int calls = 0;
  ExtractorChain<std::string, int> chain;
  chain.Add("empty", [&](const std::string&) -> std::optional<int> { calls++; return std::nullopt; })
       .Add("length", [&](const std::string& s) -> std::optional<int> {
         calls++;
         if (s.empty()) return std::nullopt;
         return static_cast<int>(s.size());
       })
       .Add("never", [&](const std::string&) -> std::optional<int> { calls++; return 99; });

  auto match = chain.Run("abcd");
  ASSERT_TRUE(match.has_value());
  EXPECT_EQ(match->value, 4);
  EXPECT_EQ(match->source, "length");
  EXPECT_EQ(calls, 2);

  EXPECT_EQ(chain.Run("")->source, "never");
  EXPECT_EQ(chain.size(), 3u);
}

TEST(LoggerTest, ParseLevelAcceptsCommonSpellings) {
  EXPECT_EQ(HawkLogger::Logger::ParseLevel("WARNING"), HawkLogger::WARN);
  EXPECT_EQ(HawkLogger::Logger::ParseLevel(" debug "), HawkLogger::DEBUG);
  EXPECT_EQ(HawkLogger::Logger::ParseLevel("error"), HawkLogger::ERROR);
  EXPECT_EQ(HawkLogger::Logger::ParseLevel("loud", HawkLogger::WARN), HawkLogger::WARN);
}

TEST(LoggerTest, FormatLineCarriesLevelAndComponent) {
  std::string line = HawkLogger::Logger::FormatLine(HawkLogger::WARN, "RunSession", "blocked");
  EXPECT_EQ(line.size(), std::string("[00:00:00.000] [WARN ] [RunSession] blocked").size());
  EXPECT_NE(line.find("] [WARN ] [RunSession] blocked"), std::string::npos);
}

TEST(LoggerTest, SecretsAreMaskedInFileOutput) {
  testing::TempDir dir;
  std::string path = dir.File("hawk.log");
  ASSERT_TRUE(HawkLogger::Logger::Init(path));
  HawkLogger::Logger::AddSecret("sk-live-123456");
  HawkLogger::Logger::AddSecret("abc");  // too short to mask

  EXPECT_EQ(HawkLogger::Logger::Mask("key=sk-live-123456&x=abc"), "key=***&x=abc");
  LOG_WARN("Test", "submitting with sk-live-123456");
  LOG_DEBUG("Test", "only in debug builds");

  std::string content;
  ASSERT_TRUE(ReadFileToString(path, &content));
  EXPECT_NE(content.find("[Test] submitting with ***"), std::string::npos);
  EXPECT_EQ(content.find("sk-live"), std::string::npos);

  HawkLogger::Logger::SetLevel(HawkLogger::ERROR);
  LOG_WARN("Test", "filtered");
  ASSERT_TRUE(ReadFileToString(path, &content));
  EXPECT_EQ(content.find("filtered"), std::string::npos);

  HawkLogger::Logger::ClearSecrets();
  HawkLogger::Logger::Init();
}

}  // namespace
}  // namespace hawk
