#pragma once
#include "ByteSource.hpp"
#include <string_view>
#include <vector>

namespace Hashgate::Stream
{
  /// @brief Byte source over an owned in-memory buffer.
  class MemoryByteSource final : public ByteSource
  {
  public:
    explicit MemoryByteSource(std::vector<std::uint8_t> data);
    explicit MemoryByteSource(std::string_view data);

    std::size_t Read(std::uint8_t *buffer, std::size_t maxLen) override;
    void Seek(std::uint64_t position) override;

    [[nodiscard]] std::uint64_t Position() const override { return m_Position; }
    [[nodiscard]] std::uint64_t Size() const override { return m_Data.size(); }

    void Close() override { m_Open = false; }
    [[nodiscard]] bool IsOpen() const override { return m_Open; }

  private:
    std::vector<std::uint8_t> m_Data;
    std::uint64_t m_Position = 0;
    bool m_Open = true;
  };
}
