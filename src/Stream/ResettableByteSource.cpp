#include "ResettableByteSource.hpp"
#include "../Errors.hpp"

using namespace Hashgate;
using namespace Hashgate::Stream;

namespace
{
  ByteSource &Checked(const std::unique_ptr<ByteSource> &source)
  {
    if (!source)
      throw InvalidArgument("ResettableByteSource: source is required");
    return *source;
  }
}

ResettableByteSource::ResettableByteSource(std::unique_ptr<ByteSource> source, bool autoRewind)
    : m_Source(std::move(source)),
      m_AutoRewind(autoRewind),
      m_Size(::Checked(m_Source).Size())
{
}

ResettableByteSource::~ResettableByteSource()
{
  Close();
}

void ResettableByteSource::Mark(std::size_t /*readLimit*/)
{
  std::lock_guard lock(m_Mutex);
  m_MarkPosition = m_Source->Position();
}

void ResettableByteSource::Reset()
{
  std::lock_guard lock(m_Mutex);

  // Exhausted stream with auto-rewind goes back to the start even if a mark was set.
  if (m_AutoRewind && m_Source->Position() >= m_Size)
  {
    m_Source->Seek(0);
    return;
  }

  m_Source->Seek(m_MarkPosition);
}

std::size_t ResettableByteSource::Read(std::uint8_t *buffer, std::size_t maxLen)
{
  std::lock_guard lock(m_Mutex);
  return m_Source->Read(buffer, maxLen);
}

void ResettableByteSource::Seek(std::uint64_t position)
{
  std::lock_guard lock(m_Mutex);
  m_Source->Seek(position);
}

std::uint64_t ResettableByteSource::Position() const
{
  std::lock_guard lock(m_Mutex);
  return m_Source->Position();
}

std::uint64_t ResettableByteSource::MarkPosition() const
{
  std::lock_guard lock(m_Mutex);
  return m_MarkPosition;
}

void ResettableByteSource::Close()
{
  std::lock_guard lock(m_Mutex);
  m_Source->Close();
}

bool ResettableByteSource::IsOpen() const
{
  std::lock_guard lock(m_Mutex);
  return m_Source->IsOpen();
}
