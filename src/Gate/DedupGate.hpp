#pragma once
#include "../Digest/ChunkedDigest.hpp"
#include "../Store/BlobStore.hpp"
#include "../Stream/ByteSource.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace Hashgate::Gate
{
  struct GateConfig
  {
    std::string Algorithm = "SHA-256";
    std::int64_t WindowSize = DEFAULT_WINDOW_SIZE;
    /// @brief Reset policy of the wrapped stream; off means reset returns to the explicit mark.
    bool AutoRewind = false;
  };

  /// @brief Ingestion checkpoint: hash, reject known digests, rewind, store.
  ///
  /// For one upload the order is fixed: the whole stream is hashed, then the digest is
  /// looked up, and only unknown content is rewound and handed to the store together
  /// with its digest. The source is closed on every path.
  class DedupGate
  {
  public:
    /// @throws InvalidArgument if a collaborator is missing or WindowSize is not positive.
    /// @throws UnsupportedAlgorithm if config.Algorithm is not available.
    DedupGate(std::shared_ptr<Store::BlobStore> store,
              std::shared_ptr<const Digest::ChunkedDigestComputer> digests,
              GateConfig config = {});

    /// @brief Ingests one upload.
    /// @param source Upload bytes; owned and closed by the gate.
    /// @param filename Name recorded with the blob.
    /// @param metadata Extra metadata; digest/algorithm/filename keys are ignored.
    /// @return Identifier assigned by the store.
    /// @throws DuplicateContent if the digest is already stored; the store is not written.
    ID Ingest(std::unique_ptr<Stream::ByteSource> source,
              const std::string &filename,
              const Metadata &metadata = {});

    /// @brief Ingests a local file.
    ID Ingest(const std::filesystem::path &file,
              const std::string &filename,
              const Metadata &metadata = {});

    [[nodiscard]] inline const GateConfig &Config() const noexcept { return m_Config; }

  private:
    std::shared_ptr<Store::BlobStore> m_Store;
    std::shared_ptr<const Digest::ChunkedDigestComputer> m_Digests;
    const GateConfig m_Config;
  };
}
