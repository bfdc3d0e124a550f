#include "OpenSslDigestRegistry.hpp"
#include "../Errors.hpp"
#include <openssl/err.h>
#include <openssl/evp.h>

using namespace Hashgate;
using namespace Hashgate::Digest;

namespace
{
  struct MdDeleter
  {
    void operator()(EVP_MD *md) const noexcept { EVP_MD_free(md); }
  };

  struct MdCtxDeleter
  {
    void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
  };

  using MdPtr = std::unique_ptr<EVP_MD, MdDeleter>;
  using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

  MdPtr Fetch(const std::string &algorithm)
  {
    if (algorithm.empty())
      return nullptr;

    MdPtr md(EVP_MD_fetch(nullptr, algorithm.c_str(), nullptr));
    if (!md)
    {
      // Unknown names leave an entry on the thread's error queue.
      ERR_clear_error();
      return nullptr;
    }

    if ((EVP_MD_get_flags(md.get()) & EVP_MD_FLAG_XOF) != 0)
      return nullptr;

    return md;
  }

  class OpenSslDigestSession final : public DigestSession
  {
  public:
    OpenSslDigestSession(std::string algorithm, MdPtr md)
        : m_Algorithm(std::move(algorithm)),
          m_Md(std::move(md)),
          m_Ctx(EVP_MD_CTX_new())
    {
      if (!m_Ctx)
        throw Error("EVP_MD_CTX_new failed");

      if (EVP_DigestInit_ex(m_Ctx.get(), m_Md.get(), nullptr) != 1)
        throw Error("EVP_DigestInit_ex failed for " + m_Algorithm);
    }

    void Update(const std::uint8_t *data, std::size_t len) override
    {
      if (m_Finalized)
        throw std::logic_error("DigestSession: update after finalize");

      if (EVP_DigestUpdate(m_Ctx.get(), data, len) != 1)
        throw Error("EVP_DigestUpdate failed");
    }

    DigestBytes Finalize() override
    {
      if (m_Finalized)
        throw std::logic_error("DigestSession: already finalized");
      m_Finalized = true;

      unsigned char mdBuf[EVP_MAX_MD_SIZE];
      unsigned int mdLen = 0;
      if (EVP_DigestFinal_ex(m_Ctx.get(), mdBuf, &mdLen) != 1)
        throw Error("EVP_DigestFinal_ex failed");

      return DigestBytes(mdBuf, mdBuf + mdLen);
    }

    const std::string &Algorithm() const noexcept override { return m_Algorithm; }

  private:
    const std::string m_Algorithm;
    MdPtr m_Md;
    MdCtxPtr m_Ctx;
    bool m_Finalized = false;
  };
}

std::unique_ptr<DigestSession> OpenSslDigestRegistry::Create(const std::string &algorithm) const
{
  auto md = ::Fetch(algorithm);
  if (!md)
    return nullptr;

  return std::make_unique<OpenSslDigestSession>(algorithm, std::move(md));
}

bool OpenSslDigestRegistry::IsSupported(const std::string &algorithm) const
{
  return ::Fetch(algorithm) != nullptr;
}
