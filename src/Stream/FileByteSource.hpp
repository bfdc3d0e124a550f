#pragma once
#include "ByteSource.hpp"
#include <filesystem>
#include <fstream>

namespace Hashgate::Stream
{
  /// @brief Read-only byte source over a local file.
  class FileByteSource final : public ByteSource
  {
  public:
    /// @throws IoFailure if the file cannot be opened.
    explicit FileByteSource(const std::filesystem::path &file);
    ~FileByteSource() override;

    FileByteSource(const FileByteSource &) = delete;
    FileByteSource &operator=(const FileByteSource &) = delete;

    std::size_t Read(std::uint8_t *buffer, std::size_t maxLen) override;
    void Seek(std::uint64_t position) override;

    [[nodiscard]] std::uint64_t Position() const override { return m_Position; }
    [[nodiscard]] std::uint64_t Size() const override { return m_Size; }

    void Close() override;
    [[nodiscard]] bool IsOpen() const override { return m_In.is_open(); }

    [[nodiscard]] inline const std::filesystem::path &Path() const noexcept
    {
      return m_Path;
    }

  private:
    const std::filesystem::path m_Path;
    std::ifstream m_In;
    std::uint64_t m_Size = 0;
    std::uint64_t m_Position = 0;
  };
}
