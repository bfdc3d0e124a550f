#include "ByteWindowIterator.hpp"
#include "../Errors.hpp"
#include <algorithm>

using namespace Hashgate;
using namespace Hashgate::Stream;

namespace
{
  std::uint64_t CheckedWindowSize(std::int64_t windowSize)
  {
    if (windowSize <= 0)
      throw InvalidArgument("windowSize must be positive, got " + std::to_string(windowSize));
    return static_cast<std::uint64_t>(windowSize);
  }
}

ByteWindowIterator::ByteWindowIterator(ByteSource &source, std::int64_t windowSize)
    : m_Source(source),
      m_WindowSize(::CheckedWindowSize(windowSize))
{
}

void ByteWindowIterator::Start()
{
  m_Started = true;
  m_Size = m_Source.Size();
  m_Source.Seek(0);

  const std::uint64_t bufferSize = std::min(m_WindowSize, m_Size);
  m_Buffer.resize(static_cast<std::size_t>(bufferSize));
}

bool ByteWindowIterator::Next(ByteWindow &window)
{
  if (!m_Started)
    Start();

  if (m_Offset >= m_Size)
  {
    // Drop the buffer as soon as the walk is over.
    std::vector<std::uint8_t>().swap(m_Buffer);
    return false;
  }

  const auto length = static_cast<std::size_t>(std::min(m_WindowSize, m_Size - m_Offset));

  std::size_t filled = 0;
  while (filled < length)
  {
    const std::size_t got = m_Source.Read(m_Buffer.data() + filled, length - filled);
    if (got == 0)
      throw IoFailure("ByteWindowIterator: source ended at offset " +
                      std::to_string(m_Offset + filled) + ", expected " + std::to_string(m_Size) + " bytes");
    filled += got;
  }

  window.Offset = m_Offset;
  window.Length = length;
  window.Data = m_Buffer.data();

  m_Offset += length;
  return true;
}
