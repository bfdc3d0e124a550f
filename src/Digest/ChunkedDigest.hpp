#pragma once
#include "DigestRegistry.hpp"
#include "../Stream/ByteSource.hpp"
#include <filesystem>
#include <memory>
#include <string>

/// @brief Content digests computed window by window so memory stays bounded for any file size.
namespace Hashgate::Digest
{
  /// @brief Lowercase hex, two characters per byte, no separators.
  [[nodiscard]] std::string ToHex(const std::uint8_t *d, std::size_t n);
  [[nodiscard]] std::string ToHex(const DigestBytes &bytes);

  class ChunkedDigestComputer
  {
  public:
    /// @throws InvalidArgument if registry is null.
    explicit ChunkedDigestComputer(std::shared_ptr<const DigestRegistry> registry);

    /// @brief Hashes every byte of source from offset 0 to its end.
    /// The result does not depend on windowSize.
    /// @param source Source to hash; it is left positioned at its end.
    /// @param algorithm Digest algorithm name, e.g. "SHA-256".
    /// @param windowSize Bytes read per step. Must be positive.
    /// @return Lowercase hexadecimal digest.
    /// @throws InvalidArgument, UnsupportedAlgorithm, IoFailure
    [[nodiscard]] std::string Compute(
        Stream::ByteSource &source,
        const std::string &algorithm,
        std::int64_t windowSize = DEFAULT_WINDOW_SIZE) const;

    /// @brief Hashes a local file. The file is closed on every path.
    [[nodiscard]] std::string Compute(
        const std::filesystem::path &file,
        const std::string &algorithm,
        std::int64_t windowSize = DEFAULT_WINDOW_SIZE) const;

    /// @brief Capability probe; never throws UnsupportedAlgorithm.
    [[nodiscard]] bool IsAlgorithmSupported(const std::string &algorithm) const;

    [[nodiscard]] inline const DigestRegistry &Registry() const noexcept { return *m_Registry; }

  private:
    std::shared_ptr<const DigestRegistry> m_Registry;
  };
}
