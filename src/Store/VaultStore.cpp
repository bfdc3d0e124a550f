#include "VaultStore.hpp"
#include "CAS.hpp"
#include "VaultSchema.h"
#include "../Errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <iostream>
#include <random>
#include <sqlite3.h>
#include <zstd.h>

namespace fs = std::filesystem;
using namespace Hashgate;
using namespace Hashgate::Store;

struct VaultStore::Impl
{
  sqlite3 *m_db = nullptr;

  explicit Impl(sqlite3 *db)
      : m_db(db)
  {
  }

  ~Impl()
  {
    if (m_db)
      sqlite3_close(m_db);
    m_db = nullptr;
  }
};

namespace
{
  /// @brief Prepared statement finalized on scope exit.
  class Statement
  {
  public:
    Statement(sqlite3 *db, const char *sql)
        : m_db(db)
    {
      if (sqlite3_prepare_v2(db, sql, -1, &m_Stmt, nullptr) != SQLITE_OK)
        throw IoFailure(std::string("prepare failed: ") + sqlite3_errmsg(db));
    }

    ~Statement()
    {
      sqlite3_finalize(m_Stmt);
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    void Bind(int index, std::int64_t value) { sqlite3_bind_int64(m_Stmt, index, value); }
    void Bind(int index, const std::string &value) { sqlite3_bind_text(m_Stmt, index, value.c_str(), -1, SQLITE_TRANSIENT); }

    /// @return true if a row is available.
    bool Step()
    {
      const int rc = sqlite3_step(m_Stmt);
      if (rc == SQLITE_ROW)
        return true;
      if (rc == SQLITE_DONE)
        return false;
      throw IoFailure(std::string("step failed: ") + sqlite3_errmsg(m_db));
    }

    std::int64_t Int(int col) const { return sqlite3_column_int64(m_Stmt, col); }

    std::string Text(int col) const
    {
      const auto *text = sqlite3_column_text(m_Stmt, col);
      return text ? std::string{reinterpret_cast<const char *>(text)} : std::string{};
    }

  private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_Stmt = nullptr;
  };

  std::string Lower(std::string s)
  {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return s;
  }

  bool IsReservedKey(const std::string &key)
  {
    const auto k = Lower(key);
    return k == MetadataKeys::Digest || k == MetadataKeys::Algorithm || k == MetadataKeys::Filename;
  }

  const std::string &Required(const Metadata &metadata, const char *key)
  {
    auto it = metadata.find(key);
    if (it == metadata.end() || it->second.empty())
      throw InvalidArgument(std::string("Store: metadata '") + key + "' is required");
    return it->second;
  }

  void CheckDigest(const std::string &digest)
  {
    const bool hex = std::all_of(digest.begin(), digest.end(), [](char c)
                                 { return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'); });
    if (!hex || digest.size() < 4)
      throw InvalidArgument("Store: digest must be lowercase hex: '" + digest + "'");
  }

  const char *SortColumn(SortField field) noexcept
  {
    switch (field)
    {
    case SortField::Filename:
      return "filename";
    case SortField::Length:
      return "length";
    case SortField::UploadDate:
      return "upload_date";
    case SortField::Id:
      break;
    }
    return "id";
  }

  std::int64_t NowMillis()
  {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  }

  uint64_t Rand64() noexcept
  {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng();
  }
}

VaultStore::VaultStore(const VaultConfig &config, std::shared_ptr<const Digest::DigestRegistry> registry)
    : m_Config(config),
      m_Registry(std::move(registry))
{
  if (m_Config.Root.empty())
    throw InvalidArgument("VaultStore: root is required");
  if (!m_Registry)
    throw InvalidArgument("VaultStore: digest registry is required");
  if (m_Config.CompressionLevel < ZSTD_minCLevel() || m_Config.CompressionLevel > ZSTD_maxCLevel())
    throw InvalidArgument("VaultStore: compression level out of range: " + std::to_string(m_Config.CompressionLevel));
  if (m_Config.StaleClaimAfter.count() < 0 || m_Config.BusyTimeoutMs < 0)
    throw InvalidArgument("VaultStore: timeouts must not be negative");

  std::error_code ec;
  fs::create_directories(m_Config.Root, ec);
  if (ec)
    throw IoFailure("VaultStore: cannot create root: " + ec.message());

  const fs::path databaseFile = DatabaseFile();

  sqlite3 *poDatabase = nullptr;
  if (sqlite3_open(databaseFile.string().c_str(), &poDatabase) == SQLITE_OK && poDatabase)
  {
    m_Database = std::make_unique<Impl>(poDatabase);
  }
  else
  {
    std::string msg = "SQLite open failed";
    if (poDatabase)
    {
      msg += std::string(": ") + sqlite3_errmsg(poDatabase);
      sqlite3_close(poDatabase);
      poDatabase = nullptr;
    }

    throw IoFailure(msg);
  }

  sqlite3_busy_timeout(m_Database->m_db, m_Config.BusyTimeoutMs);
  ExecSQL("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL; PRAGMA foreign_keys = ON;");
  ExecSQL(VAULT_SCHEMA);

  std::cout << "Vault: " << m_Config.Root << std::endl;

  // Claims left by a writer that died between claim and install.
  std::vector<std::string> expired;
  OpenTransaction();
  try
  {
    expired = ExpireClaims(nullptr);
    for (const auto &digest : expired)
      CAS::Delete(m_Config.Root, digest);
    Commit();
  }
  catch (...)
  {
    Rollback();
    throw;
  }

  if (!expired.empty())
    std::cout << "Vault: released " << expired.size() << " stale claim(s)" << std::endl;
}

VaultStore::~VaultStore() = default;

void VaultStore::ExecSQL(const char *sql)
{
  char *err = nullptr;
  if (sqlite3_exec(m_Database->m_db, sql, nullptr, nullptr, &err) != SQLITE_OK)
  {
    std::string msg = err ? err : "unknown sql error";
    sqlite3_free(err);
    throw IoFailure("SQLite exec failed: " + msg);
  }
}

void VaultStore::OpenTransaction()
{
  char *err = nullptr;
  if (sqlite3_exec(m_Database->m_db, "BEGIN IMMEDIATE;", nullptr, nullptr, &err) != SQLITE_OK)
  {
    std::string msg = err ? err : "unknown";
    sqlite3_free(err);
    throw IoFailure("BEGIN failed: " + msg);
  }
}

void VaultStore::Commit()
{
  char *err = nullptr;
  if (sqlite3_exec(m_Database->m_db, "COMMIT;", nullptr, nullptr, &err) != SQLITE_OK)
  {
    std::string msg = err ? err : "unknown";
    sqlite3_free(err);
    throw IoFailure("COMMIT failed: " + msg);
  }
}

void VaultStore::Rollback()
{
  sqlite3_exec(m_Database->m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
}

std::optional<ID> VaultStore::SelectIdByDigest(const std::string &digest, bool readyOnly)
{
  Statement sel(m_Database->m_db, readyOnly
                                      ? "SELECT id FROM blobs WHERE digest = ?1 AND status = 1;"
                                      : "SELECT id FROM blobs WHERE digest = ?1;");
  sel.Bind(1, digest);
  if (!sel.Step())
    return std::nullopt;
  return static_cast<ID>(sel.Int(0));
}

std::optional<VaultStore::Row> VaultStore::SelectRow(ID id)
{
  Statement sel(m_Database->m_db,
                "SELECT id, digest, algorithm, filename, length, upload_date, status "
                "FROM blobs WHERE id = ?1;");
  sel.Bind(1, id);
  if (!sel.Step())
    return std::nullopt;

  Row row;
  row.Id = static_cast<ID>(sel.Int(0));
  row.Digest = sel.Text(1);
  row.Algorithm = sel.Text(2);
  row.Filename = sel.Text(3);
  row.Length = static_cast<std::uint64_t>(sel.Int(4));
  row.UploadDate = sel.Int(5);
  row.Ready = static_cast<BlobStatus>(sel.Int(6)) == BlobStatus::Ready;
  return row;
}

VaultStore::Row VaultStore::ReadyRow(ID id)
{
  auto row = SelectRow(id);
  if (!row || !row->Ready)
    throw NotFound(id);
  return *row;
}

BlobInfo VaultStore::LoadInfo(const Row &row)
{
  BlobInfo info;
  info.Id = row.Id;
  info.Filename = row.Filename;
  info.Length = row.Length;
  info.UploadDate = std::chrono::system_clock::time_point(std::chrono::milliseconds(row.UploadDate));
  info.Digest = row.Digest;
  info.Algorithm = row.Algorithm;

  Statement sel(m_Database->m_db, "SELECT key, value FROM blob_metadata WHERE blob_id = ?1;");
  sel.Bind(1, row.Id);
  while (sel.Step())
    info.Extra[sel.Text(0)] = sel.Text(1);

  return info;
}

ID VaultStore::Claim(const std::string &digest, const std::string &algorithm,
                     const std::string &filename, const Metadata &extra)
{
  OpenTransaction();
  try
  {
    ExpireClaims(&digest);

    Statement ins(m_Database->m_db,
                  "INSERT INTO blobs(digest, algorithm, filename, length, upload_date, status) "
                  "VALUES(?1, ?2, ?3, 0, ?4, ?5) ON CONFLICT(digest) DO NOTHING;");
    ins.Bind(1, digest);
    ins.Bind(2, algorithm);
    ins.Bind(3, filename);
    ins.Bind(4, NowMillis());
    ins.Bind(5, static_cast<std::int64_t>(BlobStatus::Pending));
    ins.Step();

    if (sqlite3_changes(m_Database->m_db) == 0)
    {
      // No id yet if the other copy is still being written.
      auto existing = SelectIdByDigest(digest);
      Rollback();
      throw DuplicateContent(digest, existing);
    }

    const ID id = static_cast<ID>(sqlite3_last_insert_rowid(m_Database->m_db));

    for (const auto &[key, value] : extra)
    {
      Statement meta(m_Database->m_db, "INSERT INTO blob_metadata(blob_id, key, value) VALUES(?1, ?2, ?3);");
      meta.Bind(1, id);
      meta.Bind(2, key);
      meta.Bind(3, value);
      meta.Step();
    }

    Commit();
    return id;
  }
  catch (const DuplicateContent &)
  {
    throw;
  }
  catch (...)
  {
    Rollback();
    throw;
  }
}

bool VaultStore::MarkReady(ID id, std::uint64_t length)
{
  Statement upd(m_Database->m_db, "UPDATE blobs SET status = ?2, length = ?3 WHERE id = ?1 AND status = ?4;");
  upd.Bind(1, id);
  upd.Bind(2, static_cast<std::int64_t>(BlobStatus::Ready));
  upd.Bind(3, static_cast<std::int64_t>(length));
  upd.Bind(4, static_cast<std::int64_t>(BlobStatus::Pending));
  upd.Step();
  return sqlite3_changes(m_Database->m_db) > 0;
}

void VaultStore::Forget(ID id)
{
  Statement del(m_Database->m_db, "DELETE FROM blobs WHERE id = ?1;");
  del.Bind(1, id);
  del.Step();
}

void VaultStore::ReleaseClaim(ID id) noexcept
{
  try
  {
    std::lock_guard lock(m_Mutex);
    Forget(id);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Vault: cannot release claim for ID " << id << ", it expires later: " << e.what() << std::endl;
  }
}

void VaultStore::DropObject(const std::string &digest) noexcept
{
  try
  {
    CAS::Delete(m_Config.Root, digest);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Vault: cannot remove object " << digest << ": " << e.what() << std::endl;
  }
}

std::vector<std::string> VaultStore::ExpireClaims(const std::string *digest)
{
  const std::int64_t cutoff = NowMillis() - m_Config.StaleClaimAfter.count();
  const std::string where = std::string(" FROM blobs WHERE status = 0 AND upload_date < ?1") +
                            (digest ? " AND digest = ?2;" : ";");

  std::vector<std::string> expired;
  {
    Statement sel(m_Database->m_db, ("SELECT digest" + where).c_str());
    sel.Bind(1, cutoff);
    if (digest)
      sel.Bind(2, *digest);
    while (sel.Step())
      expired.push_back(sel.Text(0));
  }

  if (!expired.empty())
  {
    Statement del(m_Database->m_db, ("DELETE" + where).c_str());
    del.Bind(1, cutoff);
    if (digest)
      del.Bind(2, *digest);
    del.Step();
  }
  return expired;
}

bool VaultStore::ExistsByDigest(const std::string &digest)
{
  return FindByDigest(digest).has_value();
}

std::optional<ID> VaultStore::FindByDigest(const std::string &digest)
{
  std::lock_guard lock(m_Mutex);
  return SelectIdByDigest(digest);
}

ID VaultStore::Store(Stream::ByteSource &source, const Metadata &metadata)
{
  const std::string &digest = ::Required(metadata, MetadataKeys::Digest);
  const std::string &algorithm = ::Required(metadata, MetadataKeys::Algorithm);
  const std::string &filename = ::Required(metadata, MetadataKeys::Filename);
  ::CheckDigest(digest);

  auto session = m_Registry->Create(algorithm);
  if (!session)
    throw UnsupportedAlgorithm(algorithm);

  Metadata extra;
  for (const auto &[key, value] : metadata)
  {
    if (!::IsReservedKey(key))
      extra.emplace(key, value);
  }

  ID id{};
  {
    std::lock_guard lock(m_Mutex);
    id = Claim(digest, algorithm, filename, extra);
  }

  bool installed = false;
  try
  {
    const auto length = CAS::Write(m_Config.Root, digest, source, *session, m_Config.CompressionLevel);

    std::lock_guard lock(m_Mutex);
    installed = MarkReady(id, length);
    // A claim deleted or expired while writing; keep the object only for a newer claim.
    if (!installed && !SelectIdByDigest(digest, false))
      DropObject(digest);
  }
  catch (...)
  {
    ReleaseClaim(id);
    throw;
  }

  if (!installed)
    throw IoFailure("Store: claim for ID " + std::to_string(id) + " was released before '" + filename + "' was installed");

  std::cout << "Stored '" << filename << "' (ID: " << id << ") " << algorithm << " " << digest << std::endl;
  return id;
}

void VaultStore::Fetch(ID id, std::ostream &out)
{
  Row row;
  {
    std::lock_guard lock(m_Mutex);
    row = ReadyRow(id);
  }
  CAS::Retrieve(m_Config.Root, row.Digest, out);
}

void VaultStore::FetchToFile(ID id, const fs::path &outFile)
{
  Row row;
  {
    std::lock_guard lock(m_Mutex);
    row = ReadyRow(id);
  }

  if (!outFile.parent_path().empty())
    fs::create_directories(outFile.parent_path());

  const fs::path tmpFile = fs::path(outFile).concat("-" + std::to_string(Rand64()) + ".part");
  try
  {
    {
      std::ofstream out(tmpFile, std::ios::binary | std::ios::trunc);
      if (!out)
        throw IoFailure("Fetch: cannot open temp output");
      CAS::Retrieve(m_Config.Root, row.Digest, out);
    }

    std::error_code ec;
    fs::rename(tmpFile, outFile, ec);
    if (ec)
      throw IoFailure("Fetch: install failed: " + ec.message());
  }
  catch (...)
  {
    std::error_code ec;
    fs::remove(tmpFile, ec);
    throw;
  }
}

void VaultStore::Delete(ID id)
{
  std::lock_guard lock(m_Mutex);

  auto row = SelectRow(id);
  if (!row)
    throw NotFound(id);

  OpenTransaction();
  try
  {
    Forget(id);
    // A pending row may not have an object yet.
    if (!CAS::Delete(m_Config.Root, row->Digest) && row->Ready)
      throw IoFailure("Delete: object missing for " + row->Digest);
    Commit();
  }
  catch (...)
  {
    Rollback();
    throw;
  }

  std::cout << "Deleted ID " << id << std::endl;
}

bool VaultStore::ExistsById(ID id)
{
  std::lock_guard lock(m_Mutex);
  auto row = SelectRow(id);
  return row && row->Ready;
}

BlobInfo VaultStore::Info(ID id)
{
  std::lock_guard lock(m_Mutex);
  return LoadInfo(ReadyRow(id));
}

std::vector<BlobInfo> VaultStore::List(const ListQuery &query)
{
  using namespace std::chrono;
  if (query.From && query.To && *query.From > *query.To)
    throw InvalidArgument("List: start date is after end date");

  std::string sql = "SELECT b.id, b.digest, b.algorithm, b.filename, b.length, b.upload_date FROM blobs b";
  if (query.MetadataEquals)
    sql += " JOIN blob_metadata m ON m.blob_id = b.id AND m.key = ? AND m.value = ?";
  sql += " WHERE b.status = 1";
  if (query.Filename)
    sql += " AND b.filename = ?";
  if (query.From)
    sql += " AND b.upload_date >= ?";
  if (query.To)
    sql += " AND b.upload_date <= ?";

  const char *direction = query.Descending ? " DESC" : " ASC";
  sql += " ORDER BY ";
  for (const auto field : query.Sort)
    sql += std::string("b.") + ::SortColumn(field) + direction + ", ";
  // id last keeps paging stable between equal keys
  sql += std::string("b.id") + direction + " LIMIT ? OFFSET ?;";

  std::lock_guard lock(m_Mutex);

  Statement sel(m_Database->m_db, sql.c_str());
  int next = 1;
  if (query.MetadataEquals)
  {
    sel.Bind(next++, query.MetadataEquals->Key);
    sel.Bind(next++, query.MetadataEquals->Value);
  }
  if (query.Filename)
    sel.Bind(next++, *query.Filename);
  if (query.From)
    sel.Bind(next++, static_cast<std::int64_t>(duration_cast<milliseconds>(query.From->time_since_epoch()).count()));
  if (query.To)
    sel.Bind(next++, static_cast<std::int64_t>(duration_cast<milliseconds>(query.To->time_since_epoch()).count()));
  sel.Bind(next++, query.Limit > 0 ? static_cast<std::int64_t>(query.Limit) : -1);
  sel.Bind(next++, static_cast<std::int64_t>(query.Skip));

  std::vector<Row> rows;
  while (sel.Step())
  {
    Row row;
    row.Id = static_cast<ID>(sel.Int(0));
    row.Digest = sel.Text(1);
    row.Algorithm = sel.Text(2);
    row.Filename = sel.Text(3);
    row.Length = static_cast<std::uint64_t>(sel.Int(4));
    row.UploadDate = sel.Int(5);
    row.Ready = true;
    rows.push_back(std::move(row));
  }

  std::vector<BlobInfo> res;
  res.reserve(rows.size());
  for (const auto &row : rows)
    res.push_back(LoadInfo(row));
  return res;
}

std::uint64_t VaultStore::Count()
{
  std::lock_guard lock(m_Mutex);
  Statement sel(m_Database->m_db, "SELECT COUNT(*) FROM blobs WHERE status = 1;");
  sel.Step();
  return static_cast<std::uint64_t>(sel.Int(0));
}

bool VaultStore::FilenameExists(const std::string &filename)
{
  std::lock_guard lock(m_Mutex);
  Statement sel(m_Database->m_db, "SELECT 1 FROM blobs WHERE status = 1 AND filename = ?1 LIMIT 1;");
  sel.Bind(1, filename);
  return sel.Step();
}
