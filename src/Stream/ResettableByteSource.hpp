#pragma once
#include "ByteSource.hpp"
#include <memory>
#include <mutex>

namespace Hashgate::Stream
{
  /// @brief Wraps a seekable source with mark/reset so one physical stream can be read twice.
  ///
  /// Reset() policy:
  /// - autoRewind and the cursor is at or past the end: go back to 0, the mark is ignored.
  /// - otherwise: go back to the mark (0 if Mark() was never called).
  ///
  /// The mark is set only by Mark() and never cleared. One instance serves one owner;
  /// Mark/Read/Reset are serialized by an internal mutex so sharing does not corrupt the cursor.
  class ResettableByteSource final : public ByteSource
  {
  public:
    /// @throws InvalidArgument if source is null.
    explicit ResettableByteSource(std::unique_ptr<ByteSource> source, bool autoRewind = false);
    ~ResettableByteSource() override;

    ResettableByteSource(const ResettableByteSource &) = delete;
    ResettableByteSource &operator=(const ResettableByteSource &) = delete;

    /// @brief Records the current position. readLimit is accepted and ignored:
    /// seeking back is not limited by buffered memory.
    void Mark(std::size_t readLimit = 0);
    void Reset();

    std::size_t Read(std::uint8_t *buffer, std::size_t maxLen) override;
    void Seek(std::uint64_t position) override;

    [[nodiscard]] std::uint64_t Position() const override;
    [[nodiscard]] std::uint64_t Size() const override { return m_Size; }

    void Close() override;
    [[nodiscard]] bool IsOpen() const override;

    [[nodiscard]] inline bool AutoRewind() const noexcept { return m_AutoRewind; }
    [[nodiscard]] std::uint64_t MarkPosition() const;

  private:
    std::unique_ptr<ByteSource> m_Source;
    const bool m_AutoRewind;
    const std::uint64_t m_Size;
    std::uint64_t m_MarkPosition = 0;
    mutable std::mutex m_Mutex;
  };
}
