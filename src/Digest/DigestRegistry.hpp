#pragma once
#include "../Types.hpp"
#include <memory>
#include <string>

namespace Hashgate::Digest
{
  /// @brief One running digest computation. Fed with Update() and consumed by a single Finalize().
  class DigestSession
  {
  public:
    virtual ~DigestSession() = default;

    virtual void Update(const std::uint8_t *data, std::size_t len) = 0;

    /// @brief Produces the digest. The session cannot be used afterwards.
    /// @throws std::logic_error if called twice.
    [[nodiscard]] virtual DigestBytes Finalize() = 0;

    [[nodiscard]] virtual const std::string &Algorithm() const noexcept = 0;
  };

  /// @brief Resolves algorithm names to fresh digest sessions.
  class DigestRegistry
  {
  public:
    virtual ~DigestRegistry() = default;

    /// @return A new session, or nullptr when the algorithm is not available.
    [[nodiscard]] virtual std::unique_ptr<DigestSession> Create(const std::string &algorithm) const = 0;

    [[nodiscard]] virtual bool IsSupported(const std::string &algorithm) const = 0;
  };
}
