#pragma once
#include "DigestRegistry.hpp"

namespace Hashgate::Digest
{
  /// @brief Digest registry backed by the OpenSSL default provider.
  ///
  /// Names are matched case-insensitively against OpenSSL names and aliases,
  /// e.g. "SHA-256", "sha256", "SHA-1", "SHA-512", "SHA3-256", "MD5".
  /// Extendable-output functions (SHAKE) have no fixed length and are not offered.
  class OpenSslDigestRegistry final : public DigestRegistry
  {
  public:
    [[nodiscard]] std::unique_ptr<DigestSession> Create(const std::string &algorithm) const override;
    [[nodiscard]] bool IsSupported(const std::string &algorithm) const override;
  };
}
