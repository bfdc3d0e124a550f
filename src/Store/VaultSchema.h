#pragma once
#include <cstdint>

namespace Hashgate::Store
{
  /// @brief Status of a blob row
  /// - is the object still being written or ready to fetch.
  enum class BlobStatus : std::uint8_t
  {
    Pending = 0,
    Ready = 1
  };

  /// @brief The vault index schema that is always executed on open.
  static const char *VAULT_SCHEMA = R"SQL(

    CREATE TABLE IF NOT EXISTS blobs (
      id          INTEGER PRIMARY KEY AUTOINCREMENT, -- ids are never reused
      digest      TEXT NOT NULL,
      algorithm   TEXT NOT NULL,
      filename    TEXT NOT NULL,
      length      INTEGER NOT NULL DEFAULT 0,
      upload_date INTEGER NOT NULL,
      status      INT NOT NULL CHECK (status IN (0,1)), -- 0 pending, 1 ready
      UNIQUE(digest)
    );

    CREATE INDEX IF NOT EXISTS idx_blobs_filename ON blobs(filename);

    CREATE TABLE IF NOT EXISTS blob_metadata (
      blob_id   INTEGER NOT NULL REFERENCES blobs(id) ON DELETE CASCADE,
      key       TEXT NOT NULL,
      value     TEXT NOT NULL,
      PRIMARY KEY(blob_id, key)
    );

  )SQL";
}
