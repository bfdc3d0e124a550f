#pragma once
#include "Types.hpp"
#include <optional>
#include <stdexcept>
#include <string>

namespace Hashgate
{
  /// @brief Base of every error raised by Hashgate.
  class Error : public std::runtime_error
  {
  public:
    using std::runtime_error::runtime_error;
  };

  /// @brief Malformed caller input. Always raised before any I/O.
  class InvalidArgument : public Error
  {
  public:
    using Error::Error;
  };

  /// @brief The requested digest algorithm is not available.
  class UnsupportedAlgorithm : public Error
  {
  public:
    explicit UnsupportedAlgorithm(const std::string &algorithm)
        : Error("Unsupported hash algorithm: " + algorithm),
          m_Algorithm(algorithm)
    {
    }

    [[nodiscard]] const std::string &Algorithm() const noexcept { return m_Algorithm; }

  private:
    std::string m_Algorithm;
  };

  /// @brief Read, seek, write or index failure against a resource.
  class IoFailure : public Error
  {
  public:
    using Error::Error;
  };

  /// @brief Content with the same digest is already stored.
  class DuplicateContent : public Error
  {
  public:
    explicit DuplicateContent(const std::string &digest, std::optional<ID> existingId = std::nullopt)
        : Error("A document already exists with hash: " + digest),
          m_Digest(digest),
          m_ExistingId(existingId)
    {
    }

    [[nodiscard]] const std::string &Digest() const noexcept { return m_Digest; }
    [[nodiscard]] const std::optional<ID> &ExistingId() const noexcept { return m_ExistingId; }

  private:
    std::string m_Digest;
    std::optional<ID> m_ExistingId;
  };

  /// @brief The storage backend holds no blob with the given identifier.
  class NotFound : public Error
  {
  public:
    explicit NotFound(ID id)
        : Error("ID " + std::to_string(id) + " does not exist"),
          m_Id(id)
    {
    }

    [[nodiscard]] ID Id() const noexcept { return m_Id; }

  private:
    ID m_Id;
  };
}
