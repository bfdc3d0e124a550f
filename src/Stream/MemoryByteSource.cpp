#include "MemoryByteSource.hpp"
#include "../Errors.hpp"
#include <algorithm>
#include <cstring>

using namespace Hashgate;
using namespace Hashgate::Stream;

MemoryByteSource::MemoryByteSource(std::vector<std::uint8_t> data)
    : m_Data(std::move(data))
{
}

MemoryByteSource::MemoryByteSource(std::string_view data)
    : m_Data(data.begin(), data.end())
{
}

std::size_t MemoryByteSource::Read(std::uint8_t *buffer, std::size_t maxLen)
{
  if (!m_Open)
    throw IoFailure("MemoryByteSource: read on closed source");

  if (maxLen == 0 || m_Position >= m_Data.size())
    return 0;

  const auto remaining = static_cast<std::size_t>(m_Data.size() - m_Position);
  const std::size_t toCopy = std::min(remaining, maxLen);
  std::memcpy(buffer, m_Data.data() + m_Position, toCopy);
  m_Position += toCopy;
  return toCopy;
}

void MemoryByteSource::Seek(std::uint64_t position)
{
  if (!m_Open)
    throw IoFailure("MemoryByteSource: seek on closed source");
  if (position > m_Data.size())
    throw InvalidArgument("MemoryByteSource: seek position " + std::to_string(position) +
                          " past end " + std::to_string(m_Data.size()));

  m_Position = position;
}
