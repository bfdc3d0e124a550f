#include "ChunkedDigest.hpp"
#include "../Errors.hpp"
#include "../Stream/ByteWindowIterator.hpp"
#include "../Stream/FileByteSource.hpp"

using namespace Hashgate;
using namespace Hashgate::Digest;
namespace fs = std::filesystem;

std::string Hashgate::Digest::ToHex(const std::uint8_t *d, std::size_t n)
{
  static const char *H = "0123456789abcdef";

  std::string s;
  s.resize(n * 2);

  for (std::size_t i = 0; i < n; i++)
  {
    s[2 * i] = H[(d[i] >> 4) & 0xF];
    s[2 * i + 1] = H[d[i] & 0xF];
  }

  return s;
}

std::string Hashgate::Digest::ToHex(const DigestBytes &bytes)
{
  return ToHex(bytes.data(), bytes.size());
}

ChunkedDigestComputer::ChunkedDigestComputer(std::shared_ptr<const DigestRegistry> registry)
    : m_Registry(std::move(registry))
{
  if (!m_Registry)
    throw InvalidArgument("ChunkedDigestComputer: registry is required");
}

std::string ChunkedDigestComputer::Compute(Stream::ByteSource &source,
                                           const std::string &algorithm,
                                           std::int64_t windowSize) const
{
  Stream::ByteWindowIterator windows(source, windowSize);

  auto session = m_Registry->Create(algorithm);
  if (!session)
    throw UnsupportedAlgorithm(algorithm);

  Stream::ByteWindow window;
  while (windows.Next(window))
    session->Update(window.Data, window.Length);

  return ToHex(session->Finalize());
}

std::string ChunkedDigestComputer::Compute(const fs::path &file,
                                           const std::string &algorithm,
                                           std::int64_t windowSize) const
{
  if (windowSize <= 0)
    throw InvalidArgument("windowSize must be positive, got " + std::to_string(windowSize));
  if (!IsAlgorithmSupported(algorithm))
    throw UnsupportedAlgorithm(algorithm);

  Stream::FileByteSource source(file);
  auto hex = Compute(source, algorithm, windowSize);
  source.Close();
  return hex;
}

bool ChunkedDigestComputer::IsAlgorithmSupported(const std::string &algorithm) const
{
  return m_Registry->IsSupported(algorithm);
}
