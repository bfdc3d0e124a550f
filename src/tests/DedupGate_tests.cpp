#include <gtest/gtest.h>
#include <future>
#include <sstream>
#include <vector>

#include "TestSupport.hpp"
#include "../Digest/ChunkedDigest.hpp"
#include "../Gate/DedupGate.hpp"
#include "../Store/VaultStore.hpp"

using namespace Hashgate;
using namespace Hashgate::Gate;

namespace
{
  class DedupGateTest : public ::testing::Test
  {
  protected:
    void SetUp() override
    {
      m_Vault = Store::VaultStore::Open({m_Temp.dir / "vault", 3}, Registry());
      m_Spy = std::make_shared<SpyStore>(m_Vault);
      m_Digests = std::make_shared<Digest::ChunkedDigestComputer>(Registry());
    }

    DedupGate MakeGate(GateConfig config = {})
    {
      return DedupGate(m_Spy, m_Digests, std::move(config));
    }

    std::string HashOf(const std::string &data, const std::string &algorithm = "SHA-256")
    {
      Stream::MemoryByteSource src(data);
      return m_Digests->Compute(src, algorithm);
    }

    std::string Fetch(ID id)
    {
      std::ostringstream out;
      m_Vault->Fetch(id, out);
      return out.str();
    }

    static std::unique_ptr<Stream::ByteSource> Source(const std::string &data)
    {
      return std::make_unique<Stream::MemoryByteSource>(data);
    }

    TempDir m_Temp;
    std::shared_ptr<Store::VaultStore> m_Vault;
    std::shared_ptr<SpyStore> m_Spy;
    std::shared_ptr<Digest::ChunkedDigestComputer> m_Digests;
  };
}

// ------------- Tests -----------------

TEST_F(DedupGateTest, SecondIngestOfSameContent_IsDuplicate_AndNeverStored)
{
  auto gate = MakeGate();
  const auto data = RandomBytes(50000);

  const ID id = gate.Ingest(Source(data), "first.bin");
  EXPECT_EQ(m_Spy->StoreCalls.load(), 1);
  EXPECT_EQ(m_Vault->Info(id).Digest, HashOf(data));

  try
  {
    (void)gate.Ingest(Source(data), "second.bin");
    FAIL() << "expected DuplicateContent";
  }
  catch (const DuplicateContent &e)
  {
    EXPECT_EQ(e.Digest(), HashOf(data));
    ASSERT_TRUE(e.ExistingId().has_value());
    EXPECT_EQ(*e.ExistingId(), id);
  }

  EXPECT_EQ(m_Spy->StoreCalls.load(), 1);
  EXPECT_EQ(m_Vault->Count(), 1u);
}

TEST_F(DedupGateTest, StoresRewoundStream_WithoutAutoRewind)
{
  auto gate = MakeGate();
  const auto data = RandomBytes(100000, 7);

  const ID id = gate.Ingest(Source(data), "data.bin");
  EXPECT_EQ(Fetch(id), data);
}

TEST_F(DedupGateTest, StoresRewoundStream_WithAutoRewind)
{
  GateConfig config;
  config.AutoRewind = true;
  auto gate = MakeGate(config);
  const auto data = RandomBytes(100000, 8);

  const ID id = gate.Ingest(Source(data), "data.bin");
  EXPECT_EQ(Fetch(id), data);
}

TEST_F(DedupGateTest, SmallWindow_SameDigestAsDefault)
{
  GateConfig config;
  config.WindowSize = 7;
  auto gate = MakeGate(config);
  const auto data = RandomBytes(10007, 9);

  const ID id = gate.Ingest(Source(data), "odd.bin");
  EXPECT_EQ(m_Vault->Info(id).Digest, HashOf(data));
  EXPECT_EQ(Fetch(id), data);
}

TEST_F(DedupGateTest, SourceAlreadyAdvanced_IsIngestedWhole)
{
  auto gate = MakeGate();
  auto src = std::make_unique<Stream::MemoryByteSource>(std::string_view("0123456789"));
  src->Seek(6);

  const ID id = gate.Ingest(std::move(src), "digits.txt");
  EXPECT_EQ(Fetch(id), "0123456789");
}

TEST_F(DedupGateTest, OtherAlgorithm_IsRecordedWithBlob)
{
  GateConfig config;
  config.Algorithm = "SHA-512";
  auto gate = MakeGate(config);

  const ID id = gate.Ingest(Source("Hello World"), "hello.txt");
  auto info = m_Vault->Info(id);
  EXPECT_EQ(info.Algorithm, "SHA-512");
  EXPECT_EQ(info.Digest, HashOf("Hello World", "SHA-512"));
}

TEST_F(DedupGateTest, CallerCannotOverrideReservedMetadata)
{
  auto gate = MakeGate();
  Metadata meta{{"digest", "bogus"}, {"ALGORITHM", "MD5"}, {"Filename", "spoof"}, {"owner", "ops"}};

  const ID id = gate.Ingest(Source("payload"), "real.txt", meta);
  auto info = m_Vault->Info(id);
  EXPECT_EQ(info.Digest, HashOf("payload"));
  EXPECT_EQ(info.Algorithm, "SHA-256");
  EXPECT_EQ(info.Filename, "real.txt");

  Metadata expected{{"owner", "ops"}};
  EXPECT_EQ(info.Extra, expected);
}

TEST_F(DedupGateTest, DuplicateWithDifferentName_IsStillDuplicate)
{
  auto gate = MakeGate();
  (void)gate.Ingest(Source("same"), "a.txt");
  EXPECT_THROW((void)gate.Ingest(Source("same"), "b.txt"), DuplicateContent);
  EXPECT_FALSE(m_Vault->FilenameExists("b.txt"));
}

TEST_F(DedupGateTest, SourceIsClosed_OnSuccess)
{
  auto gate = MakeGate();
  auto state = std::make_shared<TrackingState>();

  (void)gate.Ingest(std::make_unique<TrackingSource>("content", state), "c.txt");
  EXPECT_EQ(state->Closes.load(), 1);
}

TEST_F(DedupGateTest, SourceIsClosed_OnDuplicate)
{
  auto gate = MakeGate();
  (void)gate.Ingest(Source("content"), "c.txt");

  auto state = std::make_shared<TrackingState>();
  EXPECT_THROW((void)gate.Ingest(std::make_unique<TrackingSource>("content", state), "c.txt"), DuplicateContent);
  EXPECT_EQ(state->Closes.load(), 1);
}

TEST_F(DedupGateTest, ReadFailureWhileHashing_IsIoFailure_AndNothingStored)
{
  auto gate = MakeGate();
  auto state = std::make_shared<TrackingState>();

  EXPECT_THROW((void)gate.Ingest(std::make_unique<TrackingSource>(RandomBytes(4096), state, 1000), "bad.bin"),
               IoFailure);
  EXPECT_EQ(state->Closes.load(), 1);
  EXPECT_EQ(m_Spy->LookupCalls.load(), 0);
  EXPECT_EQ(m_Spy->StoreCalls.load(), 0);
  EXPECT_EQ(m_Vault->Count(), 0u);
}

TEST_F(DedupGateTest, EmptyFilename_IsInvalidArgument_AndClosesSource)
{
  auto gate = MakeGate();
  auto state = std::make_shared<TrackingState>();

  EXPECT_THROW((void)gate.Ingest(std::make_unique<TrackingSource>("x", state), ""), InvalidArgument);
  EXPECT_EQ(state->Closes.load(), 1);
  EXPECT_EQ(state->BytesRead.load(), 0u);
  EXPECT_EQ(m_Spy->StoreCalls.load(), 0);
}

TEST_F(DedupGateTest, NullSource_IsInvalidArgument)
{
  auto gate = MakeGate();
  EXPECT_THROW((void)gate.Ingest(std::unique_ptr<Stream::ByteSource>{}, "n.txt"), InvalidArgument);
}

TEST_F(DedupGateTest, Construction_ValidatesConfig)
{
  GateConfig zeroWindow;
  zeroWindow.WindowSize = 0;
  EXPECT_THROW(MakeGate(zeroWindow), InvalidArgument);

  GateConfig unknown;
  unknown.Algorithm = "NON_EXISTENT_ALGO";
  EXPECT_THROW(MakeGate(unknown), UnsupportedAlgorithm);

  EXPECT_THROW(DedupGate(nullptr, m_Digests), InvalidArgument);
  EXPECT_THROW(DedupGate(m_Spy, nullptr), InvalidArgument);
}

TEST_F(DedupGateTest, IngestFile)
{
  auto gate = MakeGate();
  const auto data = RandomBytes(1024 * 64, 11);
  auto file = MakeFile(m_Temp.dir / "upload" / "doc.pdf", data);

  const ID id = gate.Ingest(file, "doc.pdf", {{"ticket", "T-7"}});
  auto info = m_Vault->Info(id);
  EXPECT_EQ(info.Filename, "doc.pdf");
  EXPECT_EQ(info.Length, data.size());
  EXPECT_EQ(info.Extra.at("ticket"), "T-7");
  EXPECT_EQ(Fetch(id), data);

  EXPECT_THROW((void)gate.Ingest(file, "doc-copy.pdf"), DuplicateContent);
}

TEST_F(DedupGateTest, IngestMissingFile_IsIoFailure)
{
  auto gate = MakeGate();
  EXPECT_THROW((void)gate.Ingest(m_Temp.dir / "missing.bin", "missing.bin"), IoFailure);
  EXPECT_EQ(m_Spy->StoreCalls.load(), 0);
}

TEST_F(DedupGateTest, ConcurrentIngestOfSameContent_StoresOnce)
{
  const auto data = RandomBytes(256 * 1024, 13);

  const int N = 8;
  std::vector<std::future<std::optional<ID>>> futs;
  for (int i = 0; i < N; ++i)
  {
    futs.emplace_back(std::async(std::launch::async, [&, i]() -> std::optional<ID>
                                 {
      auto gate = MakeGate();
      try
      {
        return gate.Ingest(Source(data), "race-" + std::to_string(i) + ".bin");
      }
      catch (const DuplicateContent &)
      {
        return std::nullopt;
      } }));
  }

  int stored = 0;
  for (auto &f : futs)
    if (f.get())
      ++stored;

  EXPECT_EQ(stored, 1);
  EXPECT_EQ(m_Vault->Count(), 1u);
}

TEST_F(DedupGateTest, AbandonedClaim_DoesNotBlockIngest)
{
  auto gate = MakeGate();
  IndexConnection index(m_Vault->DatabaseFile());
  const ID abandoned = index.SeedPendingClaim(HashOf("payload"), 0);

  const ID id = gate.Ingest(Source("payload"), "payload.txt");
  EXPECT_NE(id, abandoned);
  EXPECT_TRUE(m_Vault->ExistsById(id));
  EXPECT_EQ(m_Vault->Count(), 1u);
  EXPECT_EQ(m_Vault->Info(id).Digest, HashOf("payload"));
  EXPECT_EQ(Fetch(id), "payload");

  EXPECT_THROW((void)gate.Ingest(Source("payload"), "again.txt"), DuplicateContent);
}
