#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace Hashgate
{
  /// @brief Identifier the storage backend hands out for a stored blob.
  using ID = std::int64_t;

  /// @brief Raw digest bytes as produced by an accumulator.
  using DigestBytes = std::vector<std::uint8_t>;

  /// @brief Free-form key/value metadata stored beside a blob.
  using Metadata = std::map<std::string, std::string>;

  /// @brief Default window for chunked hashing (128 MiB).
  inline constexpr std::int64_t DEFAULT_WINDOW_SIZE = 128LL * 1024LL * 1024LL;

  /// @brief Metadata keys owned by the ingestion path.
  namespace MetadataKeys
  {
    inline constexpr const char *Digest = "digest";
    inline constexpr const char *Algorithm = "algorithm";
    inline constexpr const char *Filename = "filename";
  }
}
