#pragma once
#include <cstddef>
#include <cstdint>

namespace Hashgate::Stream
{
  /// @brief A finite sequence of bytes with a cursor that advances on read and can be
  /// moved to any absolute position in [0, Size()].
  ///
  /// A source is owned by exactly one component; that component closes it on every path.
  class ByteSource
  {
  public:
    virtual ~ByteSource() = default;

    /// @brief Reads up to maxLen bytes at the cursor and advances it.
    /// @return Number of bytes read, 0 at end of stream.
    /// @throws IoFailure if the underlying resource fails or is closed.
    virtual std::size_t Read(std::uint8_t *buffer, std::size_t maxLen) = 0;

    /// @brief Moves the cursor to an absolute position.
    /// @throws InvalidArgument if position is past Size().
    virtual void Seek(std::uint64_t position) = 0;

    [[nodiscard]] virtual std::uint64_t Position() const = 0;
    [[nodiscard]] virtual std::uint64_t Size() const = 0;

    /// @brief Releases the underlying resource. Calling it again has no effect.
    virtual void Close() = 0;
    [[nodiscard]] virtual bool IsOpen() const = 0;
  };
}
