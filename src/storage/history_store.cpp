#include "mediaferry/storage/history_store.hpp"
#include "mediaferry/core/logger.hpp"
#include <sqlite3.h>

namespace mediaferry::storage {

namespace {

std::string column_text(sqlite3_stmt* stmt, int column) {
    auto text = sqlite3_column_text(stmt, column);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

transfer::TransferStatus status_from_int(int value) {
    if (value < static_cast<int>(transfer::TransferStatus::QUEUED) ||
        value > static_cast<int>(transfer::TransferStatus::CANCELLED)) {
        return transfer::TransferStatus::FAILED;
    }
    return static_cast<transfer::TransferStatus>(value);
}

transfer::MediaKind kind_from_int(int value) {
    if (value < static_cast<int>(transfer::MediaKind::AUDIO) ||
        value > static_cast<int>(transfer::MediaKind::STICKER)) {
        return transfer::MediaKind::DOCUMENT;
    }
    return static_cast<transfer::MediaKind>(value);
}

constexpr const char* SELECT_COLUMNS = R"(
    SELECT batch_id, session_ref, channel_ref, item_id, media_kind, destination_path,
           bytes_transferred, expected_size, status, error, digest, finished_at
    FROM transfers
)";

}

HistoryStore::HistoryStore(const std::filesystem::path& db_path)
    : db_path_(db_path), db_(nullptr) {
}

HistoryStore::~HistoryStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

bool HistoryStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (db_) {
        return true;
    }
    
    auto parent = db_path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }
    
    int result = sqlite3_open(db_path_.string().c_str(), &db_);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot open history database {}: {}", db_path_.string(),
                  db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    return create_tables();
}

bool HistoryStore::create_tables() {
    const char* create_transfers_table = R"(
        CREATE TABLE IF NOT EXISTS transfers (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            batch_id TEXT NOT NULL,
            session_ref TEXT NOT NULL,
            channel_ref TEXT NOT NULL,
            item_id INTEGER NOT NULL,
            media_kind INTEGER NOT NULL,
            destination_path TEXT NOT NULL,
            bytes_transferred INTEGER NOT NULL,
            expected_size INTEGER NOT NULL,
            status INTEGER NOT NULL,
            error TEXT,
            digest TEXT,
            finished_at INTEGER NOT NULL
        );
    )";
    
    const char* create_indexes = R"(
        CREATE INDEX IF NOT EXISTS idx_transfers_item ON transfers(channel_ref, item_id);
        CREATE INDEX IF NOT EXISTS idx_transfers_batch ON transfers(batch_id);
        CREATE INDEX IF NOT EXISTS idx_transfers_finished_at ON transfers(finished_at);
    )";
    
    char* error_msg = nullptr;
    
    int result = sqlite3_exec(db_, create_transfers_table, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot create history table: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    
    result = sqlite3_exec(db_, create_indexes, nullptr, nullptr, &error_msg);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot create history indexes: {}", error_msg ? error_msg : "unknown");
        sqlite3_free(error_msg);
        return false;
    }
    
    return true;
}

bool HistoryStore::record(const TransferRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!db_) {
        return false;
    }
    
    const char* insert_sql = R"(
        INSERT INTO transfers
        (batch_id, session_ref, channel_ref, item_id, media_kind, destination_path,
         bytes_transferred, expected_size, status, error, digest, finished_at)
        VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
    )";
    
    sqlite3_stmt* stmt;
    int result = sqlite3_prepare_v2(db_, insert_sql, -1, &stmt, nullptr);
    if (result != SQLITE_OK) {
        LOG_ERROR("Cannot prepare history insert: {}", sqlite3_errmsg(db_));
        return false;
    }
    
    auto finished = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.finished_at.time_since_epoch()).count();
    
    sqlite3_bind_text(stmt, 1, record.batch_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, record.session_ref.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 3, record.channel_ref.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 4, record.item_id);
    sqlite3_bind_int(stmt, 5, static_cast<int>(record.media_kind));
    sqlite3_bind_text(stmt, 6, record.destination_path.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(record.bytes_transferred));
    sqlite3_bind_int64(stmt, 8, record.expected_size);
    sqlite3_bind_int(stmt, 9, static_cast<int>(record.status));
    sqlite3_bind_text(stmt, 10, record.error.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 11, record.digest.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 12, finished);
    
    result = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (result != SQLITE_DONE) {
        LOG_ERROR("History insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    
    return true;
}

std::optional<TransferRecord> HistoryStore::find(const std::string& channel_ref, int64_t item_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto records = query(std::string(SELECT_COLUMNS) +
                         " WHERE channel_ref = ?1 AND item_id = ?2 ORDER BY id DESC LIMIT 1;",
                         channel_ref, item_id);
    if (records.empty()) {
        return std::nullopt;
    }
    return records.front();
}

std::vector<TransferRecord> HistoryStore::list_recent(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    return query(std::string(SELECT_COLUMNS) + " WHERE ?1 IS NOT NULL ORDER BY id DESC LIMIT ?2;",
                 "", static_cast<int64_t>(limit));
}

std::vector<TransferRecord> HistoryStore::list_batch(const std::string& batch_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    return query(std::string(SELECT_COLUMNS) + " WHERE batch_id = ?1 AND ?2 IS NOT NULL ORDER BY id ASC;",
                 batch_id, 0);
}

size_t HistoryStore::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (!db_) {
        return 0;
    }
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM transfers;", -1, &stmt, nullptr) != SQLITE_OK) {
        return 0;
    }
    
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    
    return count;
}

std::vector<TransferRecord> HistoryStore::query(const std::string& sql,
                                                const std::string& text_param,
                                                int64_t int_param) {
    std::vector<TransferRecord> records;
    if (!db_) {
        return records;
    }
    
    sqlite3_stmt* stmt;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        LOG_ERROR("Cannot prepare history query: {}", sqlite3_errmsg(db_));
        return records;
    }
    
    sqlite3_bind_text(stmt, 1, text_param.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt, 2, int_param);
    
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        TransferRecord record;
        record.batch_id = column_text(stmt, 0);
        record.session_ref = column_text(stmt, 1);
        record.channel_ref = column_text(stmt, 2);
        record.item_id = sqlite3_column_int64(stmt, 3);
        record.media_kind = kind_from_int(sqlite3_column_int(stmt, 4));
        record.destination_path = column_text(stmt, 5);
        record.bytes_transferred = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
        record.expected_size = sqlite3_column_int64(stmt, 7);
        record.status = status_from_int(sqlite3_column_int(stmt, 8));
        record.error = column_text(stmt, 9);
        record.digest = column_text(stmt, 10);
        record.finished_at = std::chrono::system_clock::time_point(
            std::chrono::milliseconds(sqlite3_column_int64(stmt, 11)));
        records.push_back(std::move(record));
    }
    
    sqlite3_finalize(stmt);
    return records;
}

} // namespace mediaferry::storage
