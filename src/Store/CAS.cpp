#include "CAS.hpp"
#include "../Digest/ChunkedDigest.hpp"
#include "../Errors.hpp"
#include <atomic>
#include <fstream>
#include <initializer_list>
#include <random>
#include <vector>
#include <zstd.h>

namespace fs = std::filesystem;
using namespace Hashgate;

namespace
{
  struct CCtxDeleter
  {
    void operator()(ZSTD_CCtx *ctx) const noexcept { ZSTD_freeCCtx(ctx); }
  };

  struct DCtxDeleter
  {
    void operator()(ZSTD_DCtx *ctx) const noexcept { ZSTD_freeDCtx(ctx); }
  };

  /// @brief Removes the temp file unless it was installed.
  struct TempFile
  {
    fs::path Path;
    bool Installed = false;

    ~TempFile()
    {
      if (!Installed)
      {
        std::error_code ec;
        fs::remove(Path, ec);
      }
    }
  };

  inline fs::path ObjectStore(const fs::path &root) noexcept
  {
    return root / "Objects";
  }

  /// @brief Unique temp name per thread and call.
  std::string TempName()
  {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    static std::atomic<std::uint64_t> counter{0};
    return "ingest-" + std::to_string(gen()) + "-" + std::to_string(counter++) + ".zst";
  }

  void WriteOut(std::ostream &out, const char *data, size_t len)
  {
    out.write(data, static_cast<std::streamsize>(len));
    if (!out)
      throw IoFailure("CAS: write failed");
  }

  /// @brief Feeds input to the compressor and writes everything it produces.
  /// With ZSTD_e_end keeps going until the frame is complete.
  void Compress(ZSTD_CCtx *cctx, ZSTD_inBuffer &input, ZSTD_EndDirective mode,
                std::vector<char> &scratch, std::ostream &out)
  {
    size_t remaining = 0;
    do
    {
      ZSTD_outBuffer output{scratch.data(), scratch.size(), 0};
      remaining = ZSTD_compressStream2(cctx, &output, &input, mode);
      if (ZSTD_isError(remaining))
        throw IoFailure(std::string("CAS: compression failed: ") + ZSTD_getErrorName(remaining));
      ::WriteOut(out, scratch.data(), output.pos);
    } while (mode == ZSTD_e_end ? remaining != 0 : input.pos < input.size);
  }
}

fs::path Hashgate::Store::CAS::Location(const fs::path &root, const std::string &digest)
{
  if (digest.size() < 4)
    throw InvalidArgument("CAS: digest too short: '" + digest + "'");

  return ObjectStore(root) / digest.substr(0, 2) / digest.substr(2, 2) / digest;
}

std::uint64_t Hashgate::Store::CAS::Write(const fs::path &root,
                                const std::string &digest,
                                Stream::ByteSource &source,
                                Digest::DigestSession &session,
                                int level)
{
  const fs::path objPath = Location(root, digest);

  std::unique_ptr<ZSTD_CCtx, CCtxDeleter> cctx(ZSTD_createCCtx());
  if (!cctx)
    throw IoFailure("ZSTD_createCCtx failed");

  const auto pledged = static_cast<unsigned long long>(source.Size() - source.Position());
  for (size_t r : {ZSTD_CCtx_setPledgedSrcSize(cctx.get(), pledged),
                   ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_contentSizeFlag, 1),
                   ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, level)})
  {
    if (ZSTD_isError(r))
      throw IoFailure(std::string("CAS: zstd setup failed: ") + ZSTD_getErrorName(r));
  }

  // Temp lives under Objects/.tmp so the final rename stays on one filesystem.
  const fs::path tmpDir = ObjectStore(root) / ".tmp";
  fs::create_directories(tmpDir);

  TempFile tmp{tmpDir / ::TempName()};

  std::ofstream out(tmp.Path, std::ios::binary | std::ios::trunc);
  if (!out)
    throw IoFailure("CAS: open temp failed");

  std::vector<std::uint8_t> chunk(std::size_t(1) << 20);
  std::vector<char> scratch(ZSTD_CStreamOutSize());

  std::uint64_t total = 0;
  for (std::size_t got; (got = source.Read(chunk.data(), chunk.size())) != 0; total += got)
  {
    session.Update(chunk.data(), got);
    ZSTD_inBuffer input{chunk.data(), got, 0};
    ::Compress(cctx.get(), input, ZSTD_e_continue, scratch, out);
  }

  ZSTD_inBuffer tail{nullptr, 0, 0};
  ::Compress(cctx.get(), tail, ZSTD_e_end, scratch, out);

  out.close();
  if (!out)
    throw IoFailure("CAS: closing temp failed");

  const std::string written = Digest::ToHex(session.Finalize());
  if (written != digest)
    throw IoFailure("CAS: content changed since hashing: expected " + digest + ", got " + written);

  fs::create_directories(objPath.parent_path());

  // Same content may already be installed by a concurrent writer.
  std::error_code ec;
  fs::rename(tmp.Path, objPath, ec);
  if (ec && !fs::exists(objPath))
    throw IoFailure(std::string("CAS: rename failed: ") + ec.message());

  if (!ec)
    tmp.Installed = true;

  return total;
}

void Hashgate::Store::CAS::Retrieve(const fs::path &root, const std::string &digest, std::ostream &out)
{
  const fs::path obj = Location(root, digest);
  if (!fs::exists(obj))
    throw IoFailure("CAS: object missing for " + digest);

  std::ifstream in(obj, std::ios::binary);
  if (!in)
    throw IoFailure("CAS: cannot open compressed object");

  std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
  if (!dctx)
    throw IoFailure("ZSTD_createDCtx failed");

  std::vector<char> packed(ZSTD_DStreamInSize());
  std::vector<char> plain(ZSTD_DStreamOutSize());

  // Objects hold a single frame; 0 from ZSTD_decompressStream marks its end.
  size_t pending = 1;
  while (pending != 0)
  {
    in.read(packed.data(), static_cast<std::streamsize>(packed.size()));
    const auto got = static_cast<size_t>(in.gcount());
    if (in.bad())
      throw IoFailure("CAS: read failed for " + digest);
    if (got == 0)
      throw IoFailure("CAS: truncated object " + digest);

    ZSTD_inBuffer input{packed.data(), got, 0};
    while (input.pos < input.size && pending != 0)
    {
      ZSTD_outBuffer output{plain.data(), plain.size(), 0};
      pending = ZSTD_decompressStream(dctx.get(), &output, &input);
      if (ZSTD_isError(pending))
        throw IoFailure(std::string("CAS: decompression failed: ") + ZSTD_getErrorName(pending));
      ::WriteOut(out, plain.data(), output.pos);
    }
  }

  out.flush();
  if (!out)
    throw IoFailure("CAS: flush failed");
}

bool Hashgate::Store::CAS::Delete(const fs::path &root, const std::string &digest)
{
  const fs::path objectStore = ObjectStore(root);
  const fs::path obj = Location(root, digest);

  std::error_code ec;
  if (!fs::remove(obj, ec))
  {
    if (ec)
      throw IoFailure("CAS: remove failed: " + ec.message());
    return false;
  }

  // Prune now-empty shard directories; a concurrent writer may refill one.
  for (fs::path dir = obj.parent_path(); dir != objectStore; dir = dir.parent_path())
  {
    std::error_code ignored;
    if (!fs::is_empty(dir, ignored) || !fs::remove(dir, ignored))
      break;
  }

  return true;
}
