#pragma once

namespace trackq::db::sql {

/*
  Canonical SQL used by the sqlite backend.

  Column order of QUEUE_ITEM_COLUMNS is relied on by the row readers.
  LIMIT -1 means "no limit".
*/

#define TRACKQ_QUEUE_ITEM_COLUMNS                                                          \
  "id,type,title,artist,album,status,progress,output_path,download_url,error_message," \
  "retry_count,total_tracks,completed_tracks,bytes_downloaded,total_bytes,"            \
  "created_at_ms,updated_at_ms,completed_at_ms,next_attempt_at_ms,"                  \
  "speed_bytes_per_sec,eta_seconds"

#define TRACKQ_CHILD_TRACK_COLUMNS                                                         \
  "parent_id,track_id,position,title,artist,status,error_message,attempts,file_path," \
  "file_size_bytes,updated_at_ms"

#define TRACKQ_HISTORY_COLUMNS \
  "id,track_id,title,artist,album,file_path,file_size_bytes,quality,downloaded_at_ms"

// queue items

static constexpr const char* INSERT_QUEUE_ITEM =
    "INSERT INTO queue_items(" TRACKQ_QUEUE_ITEM_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_QUEUE_ITEM =
    "SELECT " TRACKQ_QUEUE_ITEM_COLUMNS " FROM queue_items WHERE id=?;";

static constexpr const char* UPDATE_QUEUE_ITEM =
    "UPDATE queue_items SET type=?,title=?,artist=?,album=?,status=?,progress=?,output_path=?,"
    "download_url=?,error_message=?,retry_count=?,total_tracks=?,completed_tracks=?,"
    "bytes_downloaded=?,total_bytes=?,created_at_ms=?,updated_at_ms=?,completed_at_ms=?,"
    "next_attempt_at_ms=?,speed_bytes_per_sec=?,eta_seconds=?"
    " WHERE id=?;";

static constexpr const char* DELETE_QUEUE_ITEM =
    "DELETE FROM queue_items WHERE id=?;";

static constexpr const char* LIST_QUEUE_ITEMS =
    "SELECT " TRACKQ_QUEUE_ITEM_COLUMNS " FROM queue_items"
    " ORDER BY created_at_ms, id LIMIT ? OFFSET ?;";

static constexpr const char* LIST_QUEUE_ITEMS_BY_STATUS =
    "SELECT " TRACKQ_QUEUE_ITEM_COLUMNS " FROM queue_items WHERE status=?"
    " ORDER BY created_at_ms, id LIMIT ? OFFSET ?;";

static constexpr const char* SELECT_NEXT_PENDING =
    "SELECT " TRACKQ_QUEUE_ITEM_COLUMNS " FROM queue_items"
    " WHERE status=? AND next_attempt_at_ms<=?"
    " ORDER BY updated_at_ms, created_at_ms, id LIMIT 1;";

static constexpr const char* COUNT_BY_STATUS =
    "SELECT status, COUNT(*) FROM queue_items GROUP BY status;";

static constexpr const char* DELETE_COMPLETED =
    "DELETE FROM queue_items WHERE status=?"
    " AND NOT (total_tracks > 0 AND completed_tracks < total_tracks);";

static constexpr const char* DELETE_ALL_ITEMS =
    "DELETE FROM queue_items;";

// child tracks

static constexpr const char* UPSERT_CHILD_TRACK =
    "INSERT INTO child_tracks(" TRACKQ_CHILD_TRACK_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(parent_id,track_id) DO UPDATE SET"
    " position=excluded.position,"
    " title=excluded.title,"
    " artist=excluded.artist,"
    " status=excluded.status,"
    " error_message=excluded.error_message,"
    " attempts=excluded.attempts,"
    " file_path=excluded.file_path,"
    " file_size_bytes=excluded.file_size_bytes,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_CHILD_TRACKS =
    "SELECT " TRACKQ_CHILD_TRACK_COLUMNS " FROM child_tracks WHERE parent_id=?"
    " ORDER BY position, track_id;";

// history

static constexpr const char* INSERT_HISTORY =
    "INSERT INTO download_history(track_id,title,artist,album,file_path,file_size_bytes,quality,downloaded_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* LIST_HISTORY =
    "SELECT " TRACKQ_HISTORY_COLUMNS " FROM download_history"
    " ORDER BY downloaded_at_ms DESC, id DESC LIMIT ? OFFSET ?;";

} // namespace trackq::db::sql
