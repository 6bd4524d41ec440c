#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <chrono>
#include <memory>

#include "mocks_test.hpp"
#include "relay_core/cache/response_cache.hpp"
#include "relay_core/cache/sqlite_cache_store.hpp"
#include "utilities_test.hpp"

namespace relay_tests {

using namespace relay_core;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

CachedAnswer make_cached(const std::string& text) {
  CachedAnswer value;
  value.answer = text;
  value.sources = nlohmann::json::array({"handbook.pdf"});
  return value;
}

}  // namespace

TEST(ResponseCacheTest, NormalizeFoldsCaseAndWhitespace) {
  EXPECT_EQ(ResponseCache::normalize("  What   IS\tthe\nPolicy?  "), "what is the policy?");
  EXPECT_EQ(ResponseCache::normalize(""), "");
  EXPECT_EQ(ResponseCache::normalize(" \t "), "");
}

TEST(ResponseCacheTest, NormalizeKeepsMultibyteCharacters) {
  EXPECT_EQ(ResponseCache::normalize("Caf\xC3\xA9  OK"), "caf\xC3\xA9 ok");
  // CJK has no case and passes through
  EXPECT_EQ(ResponseCache::normalize("\xE6\x97\xA5\xE6\x9C\xAC"), "\xE6\x97\xA5\xE6\x9C\xAC");
}

TEST(ResponseCacheTest, NormalizeFoldsNonAsciiLetters) {
  // CAFÉ / café
  EXPECT_EQ(ResponseCache::normalize("CAF\xC3\x89"), "caf\xC3\xA9");
  // ŁÓDŹ / łódź
  EXPECT_EQ(ResponseCache::normalize("\xC5\x81\xC3\x93D\xC5\xB9"), "\xC5\x82\xC3\xB3""d\xC5\xBA");
  // ΑΘΉΝΑ / αθήνα
  EXPECT_EQ(ResponseCache::normalize("\xCE\x91\xCE\x98\xCE\x89\xCE\x9D\xCE\x91"),
            "\xCE\xB1\xCE\xB8\xCE\xAE\xCE\xBD\xCE\xB1");
  // МОСКВА / москва
  EXPECT_EQ(ResponseCache::normalize("\xD0\x9C\xD0\x9E\xD0\xA1\xD0\x9A\xD0\x92\xD0\x90"),
            "\xD0\xBC\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0");
  // The multiplication sign sits among the capitals but has no lowercase
  EXPECT_EQ(ResponseCache::normalize("2\xC3\x97""3"), "2\xC3\x97""3");

  ResponseCache cache(CacheOptions{});
  EXPECT_EQ(cache.fingerprint("CAF\xC3\x89"), cache.fingerprint("caf\xC3\xA9"));
}

TEST(ResponseCacheTest, NormalizeTreatsUnicodeSpacesAsWhitespace) {
  // no-break space, em space, ideographic space
  EXPECT_EQ(ResponseCache::normalize("hello\xC2\xA0\xE2\x80\x83world\xE3\x80\x80"), "hello world");
  EXPECT_EQ(ResponseCache::normalize("\xC2\xA0 hi"), "hi");
}

TEST(ResponseCacheTest, NormalizeReplacesInvalidSequences) {
  // A lone continuation byte becomes U+FFFD rather than failing
  EXPECT_EQ(ResponseCache::normalize("A\x80"), "a\xEF\xBF\xBD");
}

TEST(ResponseCacheTest, FingerprintIsDeterministicAndPrefixed) {
  ResponseCache cache(CacheOptions{});

  const std::string a = cache.fingerprint("Hello World");
  const std::string b = cache.fingerprint("  hello   world ");
  EXPECT_EQ(a, b);
  EXPECT_NE(a, cache.fingerprint("hello worlds"));

  // "chat:" + 32 hex characters of MD5
  ASSERT_EQ(a.size(), 5u + 32u);
  EXPECT_EQ(a.substr(0, 5), "chat:");
  // md5("hello world")
  EXPECT_EQ(a.substr(5), "5eb63bbbe01eeed093cb22bb8f5acdc3");
}

TEST(ResponseCacheTest, MemoryOnlyCacheStoresAndCountsHits) {
  ResponseCache cache(CacheOptions{});
  const std::string key = cache.fingerprint("q");

  EXPECT_FALSE(cache.get(key).has_value());
  cache.set(key, make_cached("answer"));
  auto hit = cache.get(key);

  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->answer, "answer");
  EXPECT_EQ(hit->sources, nlohmann::json::array({"handbook.pdf"}));

  CacheStats stats = cache.get_stats();
  EXPECT_EQ(stats.hits, 1);
  EXPECT_EQ(stats.misses, 1);
  EXPECT_EQ(stats.sets, 1);
  EXPECT_DOUBLE_EQ(stats.hit_rate(), 50.0);
  EXPECT_EQ(stats.fallback_size, 1u);
  EXPECT_FALSE(stats.durable);
  EXPECT_FALSE(cache.durable());

  cache.reset_stats();
  EXPECT_EQ(cache.get_stats().hits, 0);
}

TEST(ResponseCacheTest, DisabledCacheNeverHits) {
  CacheOptions options;
  options.enabled = false;
  ResponseCache cache(options);
  const std::string key = cache.fingerprint("q");

  cache.set(key, make_cached("answer"));
  EXPECT_FALSE(cache.get(key).has_value());
  EXPECT_EQ(cache.size(), 0u);
  EXPECT_TRUE(cache.health_check());
}

TEST(ResponseCacheTest, ExplicitTtlOverridesDefault) {
  ResponseCache cache(CacheOptions{});
  const std::string key = cache.fingerprint("q");

  cache.set(key, make_cached("short-lived"), 0s);
  EXPECT_FALSE(cache.get(key).has_value());
}

TEST(ResponseCacheTest, RemoveAndClear) {
  ResponseCache cache(CacheOptions{});
  cache.set(cache.fingerprint("one"), make_cached("1"));
  cache.set(cache.fingerprint("two"), make_cached("2"));

  EXPECT_EQ(cache.size(), 2u);
  EXPECT_TRUE(cache.remove(cache.fingerprint("one")));
  EXPECT_FALSE(cache.remove(cache.fingerprint("one")));
  EXPECT_EQ(cache.clear(), 1u);
  EXPECT_EQ(cache.size(), 0u);
}

TEST(ResponseCacheTest, PrimaryHitIsServedFromPrimary) {
  auto primary = std::make_unique<NiceMock<MockCacheStore>>();
  auto* mock = primary.get();
  ResponseCache cache(CacheOptions{}, std::move(primary));
  const std::string key = cache.fingerprint("q");

  EXPECT_CALL(*mock, get(key))
      .WillOnce(Return(std::optional<std::string>(R"({"answer":"from primary","sources":[]})")));

  auto hit = cache.get(key);
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->answer, "from primary");
  EXPECT_TRUE(cache.durable());
}

TEST(ResponseCacheTest, PrimaryFailureFallsBackToMemory) {
  auto primary = std::make_unique<NiceMock<MockCacheStore>>();
  auto* mock = primary.get();
  ResponseCache cache(CacheOptions{}, std::move(primary));
  const std::string key = cache.fingerprint("q");

  EXPECT_CALL(*mock, set(key, _, std::chrono::seconds(3600)))
      .WillOnce(Throw(CacheStoreError("connection refused")));
  EXPECT_CALL(*mock, get(key)).WillOnce(Throw(CacheStoreError("connection refused")));

  EXPECT_NO_THROW(cache.set(key, make_cached("kept locally")));
  auto hit = cache.get(key);

  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->answer, "kept locally");
  EXPECT_EQ(cache.get_stats().errors, 2);
}

TEST(ResponseCacheTest, CorruptEntryIsTreatedAsMiss) {
  auto primary = std::make_unique<NiceMock<MockCacheStore>>();
  auto* mock = primary.get();
  ResponseCache cache(CacheOptions{}, std::move(primary));
  const std::string key = cache.fingerprint("q");

  EXPECT_CALL(*mock, get(key)).WillOnce(Return(std::optional<std::string>("not json")));

  EXPECT_FALSE(cache.get(key).has_value());
  CacheStats stats = cache.get_stats();
  EXPECT_EQ(stats.misses, 1);
  EXPECT_EQ(stats.errors, 1);
}

TEST(ResponseCacheTest, HealthCheckRoundTripsMarkerEntry) {
  ResponseCache memory_only(CacheOptions{});
  EXPECT_TRUE(memory_only.health_check());
  // The marker entry does not linger
  EXPECT_EQ(memory_only.size(), 0u);

  auto primary = std::make_unique<NiceMock<MockCacheStore>>();
  auto* mock = primary.get();
  ResponseCache durable(CacheOptions{}, std::move(primary));
  ON_CALL(*mock, is_available()).WillByDefault(Return(false));
  EXPECT_FALSE(durable.health_check());
}

TEST(ResponseCacheTest, PurgeExpiredSweepsBothStores) {
  auto primary = std::make_unique<NiceMock<MockCacheStore>>();
  auto* mock = primary.get();
  ResponseCache cache(CacheOptions{}, std::move(primary));

  cache.set(cache.fingerprint("stale"), make_cached("old"), 0s);
  cache.set(cache.fingerprint("fresh"), make_cached("new"));

  EXPECT_CALL(*mock, purge_expired()).WillOnce(Return(4u));
  // Four from the primary, one from the in-process fallback
  EXPECT_EQ(cache.purge_expired(), 5u);
  EXPECT_EQ(cache.get_stats().fallback_size, 1u);
}

TEST(ResponseCacheTest, PurgeFailureInPrimaryStillSweepsFallback) {
  auto primary = std::make_unique<NiceMock<MockCacheStore>>();
  auto* mock = primary.get();
  ResponseCache cache(CacheOptions{}, std::move(primary));
  cache.set(cache.fingerprint("stale"), make_cached("old"), 0s);

  EXPECT_CALL(*mock, purge_expired()).WillOnce(Throw(CacheStoreError("database is locked")));

  EXPECT_EQ(cache.purge_expired(), 1u);
  EXPECT_EQ(cache.get_stats().errors, 1);
}

class DurableResponseCacheTest : public DatabaseTestBase {};

TEST_F(DurableResponseCacheTest, PurgeExpiredDeletesStaleRows) {
  ResponseCache cache(CacheOptions{}, std::make_unique<SqliteCacheStore>(*db_manager_));
  cache.set(cache.fingerprint("stale"), make_cached("old"), 0s);
  cache.set(cache.fingerprint("fresh"), make_cached("new"));

  // One row from the database and its copy in the fallback
  EXPECT_EQ(cache.purge_expired(), 2u);
  EXPECT_EQ(cache.purge_expired(), 0u);
  EXPECT_EQ(cache.size(), 1u);
}

TEST_F(DurableResponseCacheTest, AnswersPersistAcrossCacheInstances) {
  const std::string query = "Where is the office?";
  {
    ResponseCache cache(CacheOptions{}, std::make_unique<SqliteCacheStore>(*db_manager_));
    cache.set(cache.fingerprint(query), make_cached("Second floor"));
    EXPECT_TRUE(cache.health_check());
  }

  ResponseCache fresh(CacheOptions{}, std::make_unique<SqliteCacheStore>(*db_manager_));
  auto hit = fresh.get(fresh.fingerprint("where IS the office?"));
  ASSERT_TRUE(hit.has_value());
  EXPECT_EQ(hit->answer, "Second floor");
  EXPECT_EQ(fresh.size(), 1u);
}

}  // namespace relay_tests
