#pragma once
#include "BlobStore.hpp"
#include "../Digest/DigestRegistry.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>

namespace Hashgate::Store
{
  struct VaultConfig
  {
    /// @brief Directory holding vault.db and the Objects tree.
    std::filesystem::path Root;
    /// @brief zstd level used for new objects.
    int CompressionLevel = 3;
    /// @brief Age after which an unfinished claim is treated as abandoned.
    std::chrono::milliseconds StaleClaimAfter = std::chrono::hours(1);
    /// @brief How long SQLite waits on a locked index before failing.
    int BusyTimeoutMs = 5000;
  };

  /// @brief Disk backed blob store: zstd compressed objects named by digest plus a SQLite index.
  ///
  /// A digest is claimed in the index (Pending) before its object is written and marked
  /// Ready once installed, so two writers racing on the same content store it once.
  /// Claims older than StaleClaimAfter are released on open and may be taken over by Store.
  class VaultStore final : public BlobStore
  {
  public:
    /// @throws InvalidArgument on bad config, IoFailure if the index cannot be opened.
    [[nodiscard]] static std::unique_ptr<VaultStore> Open(
        const VaultConfig &config,
        std::shared_ptr<const Digest::DigestRegistry> registry)
    {
      return std::unique_ptr<VaultStore>(new VaultStore(config, std::move(registry)));
    }

  public:
    ~VaultStore() override;

    [[nodiscard]] inline const std::filesystem::path &Root() const noexcept
    {
      return m_Config.Root;
    }

    [[nodiscard]] inline std::filesystem::path DatabaseFile() const
    {
      return m_Config.Root / "vault.db";
    }

    bool ExistsByDigest(const std::string &digest) override;
    std::optional<ID> FindByDigest(const std::string &digest) override;
    ID Store(Stream::ByteSource &source, const Metadata &metadata) override;
    void Fetch(ID id, std::ostream &out) override;
    void Delete(ID id) override;
    bool ExistsById(ID id) override;
    BlobInfo Info(ID id) override;
    std::vector<BlobInfo> List(const ListQuery &query) override;
    std::uint64_t Count() override;
    bool FilenameExists(const std::string &filename) override;

    /// @brief Fetches a blob into outFile through a temp file and rename.
    void FetchToFile(ID id, const std::filesystem::path &outFile);

  private:
    VaultStore(const VaultConfig &config, std::shared_ptr<const Digest::DigestRegistry> registry);

    VaultStore(const VaultStore &) = delete;
    VaultStore &operator=(const VaultStore &) = delete;
    VaultStore(VaultStore &&) = delete;
    VaultStore &operator=(VaultStore &&) = delete;

    /// @brief One row of the blobs table.
    struct Row
    {
      ID Id{};
      std::string Digest;
      std::string Algorithm;
      std::string Filename;
      std::uint64_t Length{};
      std::int64_t UploadDate{};
      bool Ready = false;
    };

    void ExecSQL(const char *sql);

    void OpenTransaction();
    void Commit();
    void Rollback();

    std::optional<ID> SelectIdByDigest(const std::string &digest, bool readyOnly = true);
    std::optional<Row> SelectRow(ID id);
    BlobInfo LoadInfo(const Row &row);
    Row ReadyRow(ID id);

    ID Claim(const std::string &digest, const std::string &algorithm,
             const std::string &filename, const Metadata &extra);
    /// @return false if the claim no longer exists.
    bool MarkReady(ID id, std::uint64_t length);
    void Forget(ID id);
    void ReleaseClaim(ID id) noexcept;
    void DropObject(const std::string &digest) noexcept;
    /// @brief Deletes Pending rows older than StaleClaimAfter, for one digest or all.
    /// @return Digests of the deleted rows.
    std::vector<std::string> ExpireClaims(const std::string *digest);

  private:
    const VaultConfig m_Config;
    std::shared_ptr<const Digest::DigestRegistry> m_Registry;
    struct Impl;
    std::unique_ptr<Impl> m_Database;
    std::mutex m_Mutex;
  };
}
