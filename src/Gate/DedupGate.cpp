#include "DedupGate.hpp"
#include "../Errors.hpp"
#include "../Stream/FileByteSource.hpp"
#include "../Stream/ResettableByteSource.hpp"
#include <algorithm>
#include <cctype>

using namespace Hashgate;
using namespace Hashgate::Gate;
namespace fs = std::filesystem;

namespace
{
  bool IsReservedKey(std::string key)
  {
    std::transform(key.begin(), key.end(), key.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return key == MetadataKeys::Digest || key == MetadataKeys::Algorithm || key == MetadataKeys::Filename;
  }
}

DedupGate::DedupGate(std::shared_ptr<Store::BlobStore> store,
                     std::shared_ptr<const Digest::ChunkedDigestComputer> digests,
                     GateConfig config)
    : m_Store(std::move(store)),
      m_Digests(std::move(digests)),
      m_Config(std::move(config))
{
  if (!m_Store)
    throw InvalidArgument("DedupGate: store is required");
  if (!m_Digests)
    throw InvalidArgument("DedupGate: digest computer is required");
  if (m_Config.WindowSize <= 0)
    throw InvalidArgument("DedupGate: windowSize must be positive, got " + std::to_string(m_Config.WindowSize));
  if (!m_Digests->IsAlgorithmSupported(m_Config.Algorithm))
    throw UnsupportedAlgorithm(m_Config.Algorithm);
}

ID DedupGate::Ingest(std::unique_ptr<Stream::ByteSource> source,
                     const std::string &filename,
                     const Metadata &metadata)
{
  if (!source)
    throw InvalidArgument("DedupGate: source is required");
  if (filename.empty())
  {
    source->Close();
    throw InvalidArgument("DedupGate: filename is required");
  }

  Stream::ResettableByteSource stream(std::move(source), m_Config.AutoRewind);
  stream.Seek(0);
  stream.Mark();

  const std::string digest = m_Digests->Compute(stream, m_Config.Algorithm, m_Config.WindowSize);

  stream.Reset();

  if (auto existing = m_Store->FindByDigest(digest))
    throw DuplicateContent(digest, existing);

  Metadata storeMeta;
  for (const auto &[key, value] : metadata)
  {
    if (!::IsReservedKey(key))
      storeMeta.emplace(key, value);
  }
  storeMeta[MetadataKeys::Digest] = digest;
  storeMeta[MetadataKeys::Algorithm] = m_Config.Algorithm;
  storeMeta[MetadataKeys::Filename] = filename;

  const ID id = m_Store->Store(stream, storeMeta);
  stream.Close();
  return id;
}

ID DedupGate::Ingest(const fs::path &file,
                     const std::string &filename,
                     const Metadata &metadata)
{
  if (filename.empty())
    throw InvalidArgument("DedupGate: filename is required");

  return Ingest(std::make_unique<Stream::FileByteSource>(file), filename, metadata);
}
