#pragma once
#include "ByteSource.hpp"
#include <cstdint>
#include <vector>

namespace Hashgate::Stream
{
  /// @brief A contiguous slice of a source. Data stays valid until the next call to Next().
  struct ByteWindow
  {
    std::uint64_t Offset = 0;
    std::size_t Length = 0;
    const std::uint8_t *Data = nullptr;
  };

  /// @brief Walks a source from offset 0 to its end in windows of at most windowSize bytes.
  ///
  /// Each window holds min(windowSize, size - offset) bytes. The sequence is lazy,
  /// finite and single-pass; iterating again needs a new iterator. Memory held is
  /// one window buffer, never more than min(windowSize, size).
  class ByteWindowIterator
  {
  public:
    /// @throws InvalidArgument if windowSize is not positive. The source is not touched.
    ByteWindowIterator(ByteSource &source, std::int64_t windowSize);

    ByteWindowIterator(const ByteWindowIterator &) = delete;
    ByteWindowIterator &operator=(const ByteWindowIterator &) = delete;

    /// @brief Produces the next window.
    /// @return false once the whole source has been produced.
    /// @throws IoFailure if the source ends early or fails.
    [[nodiscard]] bool Next(ByteWindow &window);

    [[nodiscard]] inline std::uint64_t Offset() const noexcept { return m_Offset; }

  private:
    void Start();

  private:
    ByteSource &m_Source;
    const std::uint64_t m_WindowSize;
    std::uint64_t m_Size = 0;
    std::uint64_t m_Offset = 0;
    bool m_Started = false;
    std::vector<std::uint8_t> m_Buffer;
  };
}
