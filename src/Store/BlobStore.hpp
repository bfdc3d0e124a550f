#pragma once
#include "../Stream/ByteSource.hpp"
#include "../Types.hpp"
#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Hashgate::Store
{
  /// @brief What the store knows about one blob.
  struct BlobInfo
  {
    ID Id{};
    std::string Filename;
    std::uint64_t Length{};
    std::chrono::system_clock::time_point UploadDate;
    std::string Digest;
    std::string Algorithm;
    Metadata Extra;
  };

  enum class SortField : std::uint8_t
  {
    Id,
    Filename,
    Length,
    UploadDate
  };

  /// @brief Blobs whose extra metadata holds Key with exactly Value.
  struct MetadataMatch
  {
    std::string Key;
    std::string Value;
  };

  /// @brief Filter and paging for @ref BlobStore::List. Limit 0 means no limit.
  struct ListQuery
  {
    std::optional<std::string> Filename;
    std::optional<MetadataMatch> MetadataEquals;
    /// @brief Upload date bounds, both inclusive.
    std::optional<std::chrono::system_clock::time_point> From;
    std::optional<std::chrono::system_clock::time_point> To;
    std::size_t Limit = 0;
    std::size_t Skip = 0;
    /// @brief Sort keys by priority; empty sorts by id. Descending applies to every key.
    std::vector<SortField> Sort;
    bool Descending = false;
  };

  /// @brief Storage backend the ingestion gate forwards verified streams to.
  class BlobStore
  {
  public:
    virtual ~BlobStore() = default;

    /// @brief Lookups by digest only see fully stored blobs.
    [[nodiscard]] virtual bool ExistsByDigest(const std::string &digest) = 0;
    [[nodiscard]] virtual std::optional<ID> FindByDigest(const std::string &digest) = 0;

    /// @brief Stores the remaining bytes of source.
    /// @param metadata Must carry MetadataKeys::Digest and MetadataKeys::Algorithm.
    /// @return Identifier of the new blob.
    /// @throws DuplicateContent if the digest is already stored.
    [[nodiscard]] virtual ID Store(Stream::ByteSource &source, const Metadata &metadata) = 0;

    /// @brief Writes the original bytes of a blob to out.
    virtual void Fetch(ID id, std::ostream &out) = 0;
    virtual void Delete(ID id) = 0;
    [[nodiscard]] virtual bool ExistsById(ID id) = 0;

    [[nodiscard]] virtual BlobInfo Info(ID id) = 0;
    /// @throws InvalidArgument if From is after To.
    [[nodiscard]] virtual std::vector<BlobInfo> List(const ListQuery &query) = 0;
    [[nodiscard]] virtual std::uint64_t Count() = 0;
    [[nodiscard]] virtual bool FilenameExists(const std::string &filename) = 0;
  };
}
