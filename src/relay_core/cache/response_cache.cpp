#include "relay_core/cache/response_cache.hpp"

#include <openssl/evp.h>
#include <utf8.h>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "relay_core/util/time_utils.hpp"

namespace relay_core {

namespace {

const char *const kHealthKeySuffix = "__health_check__";

std::string md5_hex(const std::string &content) {
  EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
  if (!mdctx) {
    throw std::runtime_error("Failed to create EVP context for hashing");
  }

  if (EVP_DigestInit_ex(mdctx, EVP_md5(), nullptr) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to initialize MD5 digest");
  }

  if (EVP_DigestUpdate(mdctx, content.data(), content.length()) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to update MD5 digest");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;
  if (EVP_DigestFinal_ex(mdctx, hash, &hash_len) != 1) {
    EVP_MD_CTX_free(mdctx);
    throw std::runtime_error("Failed to finalize MD5 digest");
  }

  EVP_MD_CTX_free(mdctx);

  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::string serialize(const CachedAnswer &value) {
  nlohmann::json j;
  j["answer"] = value.answer;
  j["sources"] = value.sources;
  j["cachedAt"] = now_epoch_ms();
  return j.dump();
}

// ASCII whitespace, the Unicode space separators, line and paragraph
// separators, and the byte order mark.
bool is_unicode_space(char32_t cp) {
  switch (cp) {
    case 0x0009: case 0x000A: case 0x000B: case 0x000C: case 0x000D: case 0x0020:
    case 0x00A0: case 0x1680: case 0x2028: case 0x2029: case 0x202F:
    case 0x205F: case 0x3000: case 0xFEFF:
      return true;
    default:
      return cp >= 0x2000 && cp <= 0x200A;
  }
}

// Simple lowercase mapping for the alphabetic blocks queries arrive in:
// Basic Latin, Latin-1, Latin Extended-A, Greek and Cyrillic. Code points
// outside those blocks are left unchanged.
char32_t fold_case(char32_t cp) {
  if (cp < 0x80) {
    return (cp >= 'A' && cp <= 'Z') ? cp + 0x20 : cp;
  }
  // Latin-1: A-grave through thorn, except the multiplication sign
  if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) {
    return cp + 0x20;
  }
  if (cp >= 0x0100 && cp <= 0x017F) {
    if (cp == 0x0130) {
      return 'i';
    }
    if (cp == 0x0178) {
      return 0x00FF;
    }
    // Upper/lower pairs start on even code points, except these two runs
    const bool odd_pairs = (cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E);
    if (cp == 0x0138 || cp == 0x0149 || cp == 0x017F) {
      return cp;
    }
    return ((cp % 2 == 0) != odd_pairs) ? cp + 1 : cp;
  }
  if (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) {
    return cp + 0x20;
  }
  if (cp >= 0x0388 && cp <= 0x038A) {
    return cp + 0x25;
  }
  if (cp == 0x0386) {
    return 0x03AC;
  }
  if (cp == 0x038C) {
    return 0x03CC;
  }
  if (cp == 0x038E || cp == 0x038F) {
    return cp + 0x3F;
  }
  if (cp >= 0x0400 && cp <= 0x040F) {
    return cp + 0x50;
  }
  if (cp >= 0x0410 && cp <= 0x042F) {
    return cp + 0x20;
  }
  return cp;
}

CachedAnswer deserialize(const std::string &raw) {
  const auto j = nlohmann::json::parse(raw);
  CachedAnswer value;
  value.answer = j.at("answer").get<std::string>();
  if (j.contains("sources") && j["sources"].is_array()) {
    value.sources = j["sources"];
  }
  return value;
}

}  // namespace

ResponseCache::ResponseCache(CacheOptions options, std::unique_ptr<ICacheStore> primary)
    : options_(std::move(options)),
      primary_(std::move(primary)),
      fallback_(options_.fallback_capacity) {
  stats_.enabled = options_.enabled;
  stats_.durable = primary_ != nullptr;
  std::cout << "[ResponseCache] " << (options_.enabled ? "Enabled" : "Disabled") << " ("
            << (primary_ ? "durable store + memory fallback" : "memory only") << ", ttl "
            << options_.ttl.count() << "s)" << std::endl;
}

std::string ResponseCache::normalize(const std::string &text) {
  std::string valid;
  valid.reserve(text.size());
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(valid));

  std::string out;
  out.reserve(valid.size());
  bool pending_space = false;
  auto it = valid.begin();
  while (it != valid.end()) {
    const char32_t cp = static_cast<char32_t>(utf8::next(it, valid.end()));
    if (is_unicode_space(cp)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    utf8::append(static_cast<std::uint32_t>(fold_case(cp)), std::back_inserter(out));
  }
  return out;
}

std::string ResponseCache::fingerprint(const std::string &text) const {
  return options_.key_prefix + md5_hex(normalize(text));
}

std::optional<CachedAnswer> ResponseCache::get(const std::string &key) {
  if (!options_.enabled) {
    return std::nullopt;
  }

  std::optional<std::string> raw;
  if (primary_) {
    try {
      raw = primary_->get(key);
    } catch (const CacheStoreError &e) {
      record_error("get", e);
    }
  }
  if (!raw) {
    raw = fallback_.get(key);
  }

  if (raw) {
    try {
      CachedAnswer value = deserialize(*raw);
      std::lock_guard<std::mutex> lock(stats_mutex_);
      ++stats_.hits;
      return value;
    } catch (const nlohmann::json::exception &e) {
      record_error("decode", e);
    }
  }

  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.misses;
  return std::nullopt;
}

void ResponseCache::set(const std::string &key, const CachedAnswer &value,
                        std::optional<std::chrono::seconds> ttl) {
  if (!options_.enabled) {
    return;
  }
  const auto effective_ttl = ttl.value_or(options_.ttl);
  const std::string raw = serialize(value);

  if (primary_) {
    try {
      primary_->set(key, raw, effective_ttl);
    } catch (const CacheStoreError &e) {
      record_error("set", e);
    }
  }
  fallback_.set(key, raw, effective_ttl);

  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.sets;
}

bool ResponseCache::remove(const std::string &key) {
  bool removed = false;
  if (primary_) {
    try {
      removed = primary_->remove(key);
    } catch (const CacheStoreError &e) {
      record_error("remove", e);
    }
  }
  removed = fallback_.remove(key) || removed;

  if (removed) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ++stats_.deletes;
  }
  return removed;
}

std::size_t ResponseCache::clear() {
  std::size_t cleared = 0;
  if (primary_) {
    try {
      cleared = primary_->clear(options_.key_prefix);
    } catch (const CacheStoreError &e) {
      record_error("clear", e);
    }
  }
  const std::size_t fallback_cleared = fallback_.clear(options_.key_prefix);
  if (!primary_) {
    cleared = fallback_cleared;
  }

  std::cout << "[ResponseCache] Cleared " << cleared << " entries" << std::endl;
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_.deletes += static_cast<long long>(cleared);
  return cleared;
}

std::size_t ResponseCache::size() {
  if (primary_) {
    try {
      return primary_->size(options_.key_prefix);
    } catch (const CacheStoreError &e) {
      record_error("size", e);
    }
  }
  return fallback_.size(options_.key_prefix);
}

std::size_t ResponseCache::purge_expired() {
  std::size_t purged = 0;
  if (primary_) {
    try {
      purged = primary_->purge_expired();
    } catch (const CacheStoreError &e) {
      record_error("purge", e);
    }
  }
  purged += fallback_.purge_expired();
  if (purged > 0) {
    std::cout << "[ResponseCache] Purged " << purged << " expired entries" << std::endl;
  }
  return purged;
}

bool ResponseCache::health_check() {
  if (!options_.enabled) {
    return true;
  }
  // Serving from the fallback alone still works, but is reported as unhealthy.
  if (primary_ && !primary_->is_available()) {
    std::cerr << "[ResponseCache] Primary store is unavailable" << std::endl;
    return false;
  }
  ICacheStore &store = primary_ ? *primary_ : static_cast<ICacheStore &>(fallback_);
  const std::string key = options_.key_prefix + kHealthKeySuffix;
  const std::string marker = std::to_string(now_epoch_ms());
  try {
    store.set(key, marker, std::chrono::seconds(10));
    const auto read_back = store.get(key);
    store.remove(key);
    if (!read_back || *read_back != marker) {
      std::cerr << "[ResponseCache] Health check read back a different value" << std::endl;
      return false;
    }
    return true;
  } catch (const CacheStoreError &e) {
    record_error("health_check", e);
    return false;
  }
}

CacheStats ResponseCache::get_stats() const {
  CacheStats snapshot;
  {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    snapshot = stats_;
  }
  snapshot.fallback_size = fallback_.size(options_.key_prefix);
  return snapshot;
}

void ResponseCache::reset_stats() {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  stats_ = CacheStats{};
  stats_.enabled = options_.enabled;
  stats_.durable = primary_ != nullptr;
}

void ResponseCache::record_error(const std::string &operation, const std::exception &e) {
  std::cerr << "[ResponseCache] " << operation << " error: " << e.what() << std::endl;
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.errors;
}

}  // namespace relay_core
