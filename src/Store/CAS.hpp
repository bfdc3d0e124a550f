#pragma once
#include "../Digest/DigestRegistry.hpp"
#include "../Stream/ByteSource.hpp"
#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>

/// @brief Content addressable object files, named by digest and compressed with zstd.
namespace Hashgate::Store::CAS
{
  /// @brief Object path for a digest: <root>/Objects/ab/cd/abcd...
  [[nodiscard]] std::filesystem::path Location(
      const std::filesystem::path &root,
      const std::string &digest);

  /// @brief Compresses the remaining bytes of source into the object for digest.
  /// @param session Fresh session for the digest's algorithm; the written bytes must hash to digest.
  /// @param level zstd compression level.
  /// @return Number of uncompressed bytes written.
  /// @throws IoFailure on read/write failure or if the bytes do not match digest.
  std::uint64_t Write(
      const std::filesystem::path &root,
      const std::string &digest,
      Stream::ByteSource &source,
      Digest::DigestSession &session,
      int level);

  /// @brief Decompresses the object for digest into out.
  void Retrieve(
      const std::filesystem::path &root,
      const std::string &digest,
      std::ostream &out);

  /// @brief Removes the object for digest and any parent directories left empty.
  /// @return false if there was no such object.
  bool Delete(
      const std::filesystem::path &root,
      const std::string &digest);
}
