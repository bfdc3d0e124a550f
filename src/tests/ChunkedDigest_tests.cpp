#include <gtest/gtest.h>

#include "TestSupport.hpp"
#include "../Digest/ChunkedDigest.hpp"
#include "../Stream/FileByteSource.hpp"

using namespace Hashgate;
using namespace Hashgate::Digest;
using namespace Hashgate::Stream;

namespace
{
  const char *HELLO_WORLD_SHA256 = "a591a6d40bf420404a011733cfb7b190d62c65bf0bcda32b57b277d9ad9f146e";

  ChunkedDigestComputer Computer()
  {
    return ChunkedDigestComputer(Registry());
  }
}

// ------------- Tests -----------------

TEST(ChunkedDigest, Sha256_HelloWorld_DefaultWindow)
{
  MemoryByteSource src(std::string_view("Hello World"));
  EXPECT_EQ(Computer().Compute(src, "SHA-256"), HELLO_WORLD_SHA256);
}

TEST(ChunkedDigest, Sha256_HelloWorld_16KiBWindow)
{
  MemoryByteSource src(std::string_view("Hello World"));
  EXPECT_EQ(Computer().Compute(src, "SHA-256", 16 * 1024), HELLO_WORLD_SHA256);
}

TEST(ChunkedDigest, Sha256_HelloWorld_OneByteWindow)
{
  MemoryByteSource src(std::string_view("Hello World"));
  EXPECT_EQ(Computer().Compute(src, "SHA-256", 1), HELLO_WORLD_SHA256);
}

TEST(ChunkedDigest, Sha256_EmptyInput)
{
  MemoryByteSource src(std::string_view(""));
  EXPECT_EQ(Computer().Compute(src, "SHA-256"),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(ChunkedDigest, KnownVectors_Sha1_Sha512)
{
  auto computer = Computer();

  MemoryByteSource a(std::string_view("abc"));
  EXPECT_EQ(computer.Compute(a, "SHA-1"), "a9993e364706816aba3e25717850c26c9cd0d89d");

  MemoryByteSource b(std::string_view("abc"));
  EXPECT_EQ(computer.Compute(b, "SHA-512"),
            "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
            "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(ChunkedDigest, Result_IsIndependentOfWindowSize)
{
  auto computer = Computer();
  const auto data = RandomBytes(100000);

  for (const char *algorithm : {"SHA-1", "SHA-256", "SHA-512"})
  {
    MemoryByteSource reference(data);
    const auto expected = computer.Compute(reference, algorithm, DEFAULT_WINDOW_SIZE);

    for (std::int64_t window : {1, 7, 64, 4096, 65536, 99999, 100000, 1 << 20})
    {
      MemoryByteSource src(data);
      EXPECT_EQ(computer.Compute(src, algorithm, window), expected)
          << algorithm << " window " << window;
    }
  }
}

TEST(ChunkedDigest, Output_IsLowercaseHex_TwoCharsPerByte)
{
  MemoryByteSource src(RandomBytes(333));
  const auto hex = Computer().Compute(src, "SHA-512");
  EXPECT_EQ(hex.size(), 128u);
  for (char c : hex)
    EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
}

TEST(ChunkedDigest, LeavesSourceAtEnd)
{
  MemoryByteSource src(std::string_view("0123456789"));
  (void)Computer().Compute(src, "SHA-256", 3);
  EXPECT_EQ(src.Position(), src.Size());
}

TEST(ChunkedDigest, UnsupportedAlgorithm_CarriesName)
{
  MemoryByteSource src(std::string_view("SomeContent"));
  try
  {
    (void)Computer().Compute(src, "NON_EXISTENT_ALGO");
    FAIL() << "expected UnsupportedAlgorithm";
  }
  catch (const UnsupportedAlgorithm &e)
  {
    EXPECT_EQ(e.Algorithm(), "NON_EXISTENT_ALGO");
  }
}

TEST(ChunkedDigest, IsAlgorithmSupported)
{
  auto computer = Computer();
  EXPECT_TRUE(computer.IsAlgorithmSupported("SHA-256"));
  EXPECT_TRUE(computer.IsAlgorithmSupported("sha256"));
  EXPECT_TRUE(computer.IsAlgorithmSupported("SHA-512"));
  EXPECT_FALSE(computer.IsAlgorithmSupported("NON_EXISTENT_ALGO"));
  EXPECT_FALSE(computer.IsAlgorithmSupported("FOO-123"));
  EXPECT_FALSE(computer.IsAlgorithmSupported(""));
}

TEST(ChunkedDigest, NonPositiveWindow_IsInvalidArgument)
{
  auto computer = Computer();
  MemoryByteSource src(std::string_view("AnotherContent"));
  EXPECT_THROW((void)computer.Compute(src, "SHA-256", 0), InvalidArgument);
  EXPECT_THROW((void)computer.Compute(src, "SHA-256", -1), InvalidArgument);
  EXPECT_EQ(src.Position(), 0u);
}

TEST(ChunkedDigest, WindowIsValidatedBeforeAlgorithm)
{
  MemoryByteSource src(std::string_view("x"));
  EXPECT_THROW((void)Computer().Compute(src, "NON_EXISTENT_ALGO", 0), InvalidArgument);
}

TEST(ChunkedDigest, File_MatchesMemory)
{
  TempDir td;
  const auto data = RandomBytes(1024 * 64 + 3);
  auto file = MakeFile(td.dir / "data.bin", data);

  auto computer = Computer();
  MemoryByteSource mem(data);
  EXPECT_EQ(computer.Compute(file, "SHA-256", 4096), computer.Compute(mem, "SHA-256"));
}

TEST(ChunkedDigest, File_HelloWorld)
{
  TempDir td;
  auto file = MakeFile(td.dir / "hello.txt", "Hello World");

  FileByteSource src(file);
  EXPECT_EQ(Computer().Compute(src, "SHA-256", 16 * 1024), HELLO_WORLD_SHA256);
}

TEST(ChunkedDigest, File_Missing_IsIoFailure)
{
  TempDir td;
  EXPECT_THROW((void)Computer().Compute(td.dir / "nope.bin", "SHA-256"), IoFailure);
}

TEST(ChunkedDigest, File_BadArguments_DoNotOpenFile)
{
  TempDir td;
  // Nonexistent path: argument errors must win over the open failure.
  EXPECT_THROW((void)Computer().Compute(td.dir / "nope.bin", "SHA-256", 0), InvalidArgument);
  EXPECT_THROW((void)Computer().Compute(td.dir / "nope.bin", "NON_EXISTENT_ALGO"), UnsupportedAlgorithm);
}

TEST(ChunkedDigest, ReadFailure_IsIoFailure)
{
  auto state = std::make_shared<TrackingState>();
  TrackingSource src(RandomBytes(1000), state, 500);
  EXPECT_THROW((void)Computer().Compute(src, "SHA-256", 128), IoFailure);
}

TEST(ChunkedDigest, ToHex)
{
  const DigestBytes bytes{0x00, 0x0f, 0xab, 0xff};
  EXPECT_EQ(ToHex(bytes), "000fabff");
  EXPECT_EQ(ToHex(DigestBytes{}), "");
}

TEST(ChunkedDigest, NullRegistry_IsInvalidArgument)
{
  EXPECT_THROW(ChunkedDigestComputer(nullptr), InvalidArgument);
}

TEST(DigestSession, FinalizeTwice_IsLogicError)
{
  auto session = Registry()->Create("SHA-256");
  ASSERT_TRUE(session);
  (void)session->Finalize();
  EXPECT_THROW((void)session->Finalize(), std::logic_error);
}
