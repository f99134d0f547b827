#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace trackq::db::sqlite {

using trackq::db::ErrorCode;
using trackq::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

// LIMIT -1 is unbounded in sqlite
static void BindLimit(sqlite3_stmt* st, int idx, uint64_t limit) {
    sqlite3_bind_int64(st, idx, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

// Binds every column but id, starting at idx. Returns the next free index.
static int BindItemFields(sqlite3_stmt* st, int idx, const model::QueueItemRecord& r) {
    BindI32(st, idx++, static_cast<int>(r.type));
    BindText(st, idx++, r.title);
    BindText(st, idx++, r.artist);
    BindText(st, idx++, r.album);
    BindI32(st, idx++, static_cast<int>(r.status));
    BindI32(st, idx++, static_cast<int>(r.progress));
    BindText(st, idx++, r.output_path);
    BindText(st, idx++, r.download_url);
    BindText(st, idx++, r.error_message);
    BindI32(st, idx++, static_cast<int>(r.retry_count));
    BindI32(st, idx++, static_cast<int>(r.total_tracks));
    BindI32(st, idx++, static_cast<int>(r.completed_tracks));
    BindU64(st, idx++, r.bytes_downloaded);
    BindU64(st, idx++, r.total_bytes);
    BindU64(st, idx++, r.created_at_ms);
    BindU64(st, idx++, r.updated_at_ms);
    BindU64(st, idx++, r.completed_at_ms);
    BindU64(st, idx++, r.next_attempt_at_ms);
    BindU64(st, idx++, r.speed_bytes_per_sec);
    BindU64(st, idx++, r.eta_seconds);
    return idx;
}

static model::QueueItemRecord ReadItem(sqlite3_stmt* st) {
    model::QueueItemRecord r;
    r.id                  = ColText(st, 0);
    r.type                = static_cast<trackq::v1::ItemType>(ColI32(st, 1));
    r.title               = ColText(st, 2);
    r.artist              = ColText(st, 3);
    r.album               = ColText(st, 4);
    r.status              = static_cast<trackq::v1::ItemStatus>(ColI32(st, 5));
    r.progress            = static_cast<uint32_t>(ColI32(st, 6));
    r.output_path         = ColText(st, 7);
    r.download_url        = ColText(st, 8);
    r.error_message       = ColText(st, 9);
    r.retry_count         = static_cast<uint32_t>(ColI32(st, 10));
    r.total_tracks        = static_cast<uint32_t>(ColI32(st, 11));
    r.completed_tracks    = static_cast<uint32_t>(ColI32(st, 12));
    r.bytes_downloaded    = ColU64(st, 13);
    r.total_bytes         = ColU64(st, 14);
    r.created_at_ms       = ColU64(st, 15);
    r.updated_at_ms       = ColU64(st, 16);
    r.completed_at_ms     = ColU64(st, 17);
    r.next_attempt_at_ms  = ColU64(st, 18);
    r.speed_bytes_per_sec = ColU64(st, 19);
    r.eta_seconds         = ColU64(st, 20);
    return r;
}

static model::ChildTrackRecord ReadChild(sqlite3_stmt* st) {
    model::ChildTrackRecord r;
    r.parent_id       = ColText(st, 0);
    r.track_id        = ColText(st, 1);
    r.position        = static_cast<uint32_t>(ColI32(st, 2));
    r.title           = ColText(st, 3);
    r.artist          = ColText(st, 4);
    r.status          = static_cast<trackq::v1::ChildStatus>(ColI32(st, 5));
    r.error_message   = ColText(st, 6);
    r.attempts        = static_cast<uint32_t>(ColI32(st, 7));
    r.file_path       = ColText(st, 8);
    r.file_size_bytes = ColU64(st, 9);
    r.updated_at_ms   = ColU64(st, 10);
    return r;
}

static model::HistoryRecord ReadHistory(sqlite3_stmt* st) {
    model::HistoryRecord r;
    r.id               = ColU64(st, 0);
    r.track_id         = ColText(st, 1);
    r.title            = ColText(st, 2);
    r.artist           = ColText(st, 3);
    r.album            = ColText(st, 4);
    r.file_path        = ColText(st, 5);
    r.file_size_bytes  = ColU64(st, 6);
    r.quality          = ColText(st, 7);
    r.downloaded_at_ms = ColU64(st, 8);
    return r;
}

template <typename Row, typename Reader>
static std::vector<Row> StepAll(sqlite3* db, sqlite3_stmt* st, Reader read) {
    std::vector<Row> rows;
    int              rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        rows.push_back(read(st));
    }
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
    }
    return rows;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY)
                return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Queue items
// ------------------------------------------------------------------

Result SqliteRepository::InsertItem(Transaction& t, const model::QueueItemRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_QUEUE_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindItemFields(st, 2, r);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::optional<model::QueueItemRecord>
SqliteRepository::GetItem(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::SELECT_QUEUE_ITEM);

    BindText(st, 1, id);

    auto rows = StepAll<model::QueueItemRecord>(db, st, ReadItem);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

Result SqliteRepository::UpdateItem(Transaction& t, const model::QueueItemRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPDATE_QUEUE_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    int idx = BindItemFields(st, 1, r);
    BindText(st, idx, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "queue item not found: " + r.id);

    return Translate(db, rc);
}

Result SqliteRepository::DeleteItem(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::DELETE_QUEUE_ITEM, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "queue item not found: " + id);

    return Translate(db, rc);
}

std::vector<model::QueueItemRecord>
SqliteRepository::ListItems(Transaction& t, uint64_t offset, uint64_t limit) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::LIST_QUEUE_ITEMS);

    BindLimit(st, 1, limit);
    BindU64(st, 2, offset);

    return StepAll<model::QueueItemRecord>(db, st, ReadItem);
}

std::vector<model::QueueItemRecord>
SqliteRepository::ListItemsByStatus(Transaction& t, trackq::v1::ItemStatus status, uint64_t offset, uint64_t limit) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::LIST_QUEUE_ITEMS_BY_STATUS);

    BindI32(st, 1, static_cast<int>(status));
    BindLimit(st, 2, limit);
    BindU64(st, 3, offset);

    return StepAll<model::QueueItemRecord>(db, st, ReadItem);
}

std::optional<model::QueueItemRecord>
SqliteRepository::NextPending(Transaction& t, uint64_t now_ms) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::SELECT_NEXT_PENDING);

    BindI32(st, 1, static_cast<int>(trackq::v1::ITEM_STATUS_PENDING));
    BindU64(st, 2, now_ms);

    auto rows = StepAll<model::QueueItemRecord>(db, st, ReadItem);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

model::QueueStats SqliteRepository::CountByStatus(Transaction& t) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::COUNT_BY_STATUS);

    model::QueueStats stats;
    int               rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        const auto status = static_cast<trackq::v1::ItemStatus>(ColI32(st, 0));
        const auto count  = ColU64(st, 1);
        stats.total += count;
        switch (status) {
            case trackq::v1::ITEM_STATUS_PENDING:
                stats.pending = count;
                break;
            case trackq::v1::ITEM_STATUS_DOWNLOADING:
                stats.downloading = count;
                break;
            case trackq::v1::ITEM_STATUS_PAUSED:
                stats.paused = count;
                break;
            case trackq::v1::ITEM_STATUS_COMPLETED:
                stats.completed = count;
                break;
            case trackq::v1::ITEM_STATUS_FAILED:
                stats.failed = count;
                break;
            default:
                break;
        }
    }
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));

    return stats;
}

uint64_t SqliteRepository::DeleteCompleted(Transaction& t) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::DELETE_COMPLETED);

    BindI32(st, 1, static_cast<int>(trackq::v1::ITEM_STATUS_COMPLETED));

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));

    return static_cast<uint64_t>(sqlite3_changes(db));
}

uint64_t SqliteRepository::DeleteAllItems(Transaction& t) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::DELETE_ALL_ITEMS);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));

    return static_cast<uint64_t>(sqlite3_changes(db));
}

// ------------------------------------------------------------------
// Child tracks
// ------------------------------------------------------------------

Result SqliteRepository::UpsertChild(Transaction& t, const model::ChildTrackRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::UPSERT_CHILD_TRACK, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.parent_id);
    BindText(st, 2, r.track_id);
    BindI32(st, 3, static_cast<int>(r.position));
    BindText(st, 4, r.title);
    BindText(st, 5, r.artist);
    BindI32(st, 6, static_cast<int>(r.status));
    BindText(st, 7, r.error_message);
    BindI32(st, 8, static_cast<int>(r.attempts));
    BindText(st, 9, r.file_path);
    BindU64(st, 10, r.file_size_bytes);
    BindU64(st, 11, r.updated_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

std::vector<model::ChildTrackRecord>
SqliteRepository::GetChildren(Transaction& t, const std::string& parent_id) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::SELECT_CHILD_TRACKS);

    BindText(st, 1, parent_id);

    return StepAll<model::ChildTrackRecord>(db, st, ReadChild);
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

Result SqliteRepository::InsertHistory(Transaction& t, model::HistoryRecord& r) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_HISTORY, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.track_id);
    BindText(st, 2, r.title);
    BindText(st, 3, r.artist);
    BindText(st, 4, r.album);
    BindText(st, 5, r.file_path);
    BindU64(st, 6, r.file_size_bytes);
    BindText(st, 7, r.quality);
    BindU64(st, 8, r.downloaded_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE)
        r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));

    return Translate(db, rc);
}

std::vector<model::HistoryRecord>
SqliteRepository::ListHistory(Transaction& t, uint64_t offset, uint64_t limit) {
    auto* db = TX(t).Handle();
    auto* st = PrepareOrThrow(db, sql::LIST_HISTORY);

    BindLimit(st, 1, limit);
    BindU64(st, 2, offset);

    return StepAll<model::HistoryRecord>(db, st, ReadHistory);
}

} // namespace trackq::db::sqlite
