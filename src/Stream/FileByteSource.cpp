#include "FileByteSource.hpp"
#include "../Errors.hpp"

using namespace Hashgate;
using namespace Hashgate::Stream;
namespace fs = std::filesystem;

FileByteSource::FileByteSource(const fs::path &file)
    : m_Path(file)
{
  std::error_code ec;
  if (!fs::is_regular_file(m_Path, ec))
    throw IoFailure("FileByteSource: not a regular file: " + m_Path.string());

  m_Size = static_cast<std::uint64_t>(fs::file_size(m_Path, ec));
  if (ec)
    throw IoFailure("FileByteSource: cannot stat input: " + ec.message());

  m_In.open(m_Path, std::ios::binary);
  if (!m_In)
    throw IoFailure("FileByteSource: cannot open input: " + m_Path.string());
}

FileByteSource::~FileByteSource()
{
  Close();
}

std::size_t FileByteSource::Read(std::uint8_t *buffer, std::size_t maxLen)
{
  if (!m_In.is_open())
    throw IoFailure("FileByteSource: read on closed source");

  if (maxLen == 0 || m_Position >= m_Size)
    return 0;

  m_In.read(reinterpret_cast<char *>(buffer), static_cast<std::streamsize>(maxLen));
  const std::streamsize got = m_In.gcount();

  if (m_In.bad())
    throw IoFailure("FileByteSource: read failed: " + m_Path.string());

  // Short read at end of file leaves eof|fail set; clear so later seeks work.
  if (!m_In)
    m_In.clear();

  m_Position += static_cast<std::uint64_t>(got);
  return static_cast<std::size_t>(got);
}

void FileByteSource::Seek(std::uint64_t position)
{
  if (!m_In.is_open())
    throw IoFailure("FileByteSource: seek on closed source");

  if (position > m_Size)
    throw InvalidArgument("FileByteSource: seek position " + std::to_string(position) +
                          " past end " + std::to_string(m_Size));

  m_In.clear();
  m_In.seekg(static_cast<std::streamoff>(position), std::ios::beg);
  if (!m_In)
    throw IoFailure("FileByteSource: seek failed: " + m_Path.string());

  m_Position = position;
}

void FileByteSource::Close()
{
  if (m_In.is_open())
    m_In.close();
}
