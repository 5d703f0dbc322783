#include <cxg/cache_store.h>

#include <cstdint>
#include <iomanip>
#include <regex>
#include <sstream>
#include <stdexcept>

namespace cxg {
namespace {

constexpr std::uint64_t kFnvOffsetBasis = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;
constexpr char kFieldSeparator = '\x1f';

void HashInto(std::uint64_t &hash, const std::string &value) {
  for (const auto character : value) {
    hash ^= static_cast<unsigned char>(character);
    hash *= kFnvPrime;
  }
  hash ^= static_cast<unsigned char>(kFieldSeparator);
  hash *= kFnvPrime;
}

} // namespace

void ValidateCacheOptions(const CacheOptions &options) {
  if (options.max_entries == 0) {
    throw std::invalid_argument("Cache max_entries must be positive");
  }
  if (options.max_size_bytes == 0) {
    throw std::invalid_argument("Cache max_size_bytes must be positive");
  }
  if (options.default_ttl.count() <= 0) {
    throw std::invalid_argument("Cache ttl must be positive");
  }
  if (options.cleanup_interval.count() <= 0) {
    throw std::invalid_argument("Cache cleanup_interval must be positive");
  }
  if (options.hit_weight < 0.0 || options.recency_weight < 0.0) {
    throw std::invalid_argument("Cache eviction weights cannot be negative");
  }
}

std::string GenerateCacheKey(const std::string &content,
                             const std::string &language,
                             const RequestOptions &options) {
  std::uint64_t hash = kFnvOffsetBasis;
  HashInto(hash, content);
  HashInto(hash, language);
  for (const auto &[name, value] : options) {
    HashInto(hash, name);
    HashInto(hash, value);
  }

  std::ostringstream key;
  key << "analysis_" << std::hex << std::setw(16) << std::setfill('0') << hash
      << '_' << language;
  return key.str();
}

double EvictionScore(std::size_t hits, TimePoint created_at,
                     const CacheOptions &options) {
  const auto created_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          created_at.time_since_epoch())
          .count();
  return options.hit_weight * static_cast<double>(hits) +
         options.recency_weight * (static_cast<double>(created_ms) / 1000000.0);
}

std::function<bool(const std::string &)>
MakeKeyMatcher(const std::string &pattern) {
  try {
    std::regex expression(pattern, std::regex::ECMAScript);
    return [expression](const std::string &key) {
      return std::regex_search(key, expression);
    };
  } catch (const std::regex_error &) {
    return [pattern](const std::string &key) {
      return key.find(pattern) != std::string::npos;
    };
  }
}

} // namespace cxg
