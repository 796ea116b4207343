/**
 * SqliteClipRepository 实现
 *
 * 使用 SQLite 持久化剪贴板历史。位置列记录快照中的顺序，
 * 加载时按位置升序、时间戳降序返回。
 */

#include "sqlite_clip_repository.h"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace cliphist {

namespace {

void bindOptionalText(sqlite3_stmt* stmt, int index, const std::optional<std::string>& value) {
    if (value) {
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, index);
    }
}

std::optional<std::string> columnOptionalText(sqlite3_stmt* stmt, int column) {
    if (sqlite3_column_type(stmt, column) == SQLITE_NULL) {
        return std::nullopt;
    }
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return std::string(text ? text : "");
}

} // namespace

SqliteClipRepository::~SqliteClipRepository() {
    shutdown();
}

// ========== 初始化和关闭 ==========

bool SqliteClipRepository::initialize(const std::string& dbPath) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (initialized_) {
        if (dbPath_ == dbPath) {
            return true;
        }
        finalizeStatements();
        closeDatabase();
        initialized_ = false;
    }

    dbPath_ = dbPath;

    // 确保目录存在
    try {
        fs::path dbDir = fs::path(dbPath).parent_path();
        if (!dbDir.empty()) {
            fs::create_directories(dbDir);
        }
    } catch (const std::exception& e) {
        lastError_ = std::string("创建目录失败: ") + e.what();
        std::cerr << "SqliteClipRepository: " << lastError_ << std::endl;
        return false;
    }

    if (!openDatabase()) {
        return false;
    }

    if (!createTables()) {
        closeDatabase();
        return false;
    }

    if (!prepareStatements()) {
        finalizeStatements();
        closeDatabase();
        return false;
    }

    initialized_ = true;
    return true;
}

void SqliteClipRepository::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
        return;
    }

    finalizeStatements();
    closeDatabase();
    initialized_ = false;
}

bool SqliteClipRepository::isInitialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

std::string SqliteClipRepository::getDatabasePath() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dbPath_;
}

// ========== 数据库操作 ==========

bool SqliteClipRepository::openDatabase() {
    int rc = sqlite3_open(dbPath_.c_str(), &db_);
    if (rc != SQLITE_OK) {
        setErrorLocked("打开数据库失败");
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // 启用 WAL 模式提高性能
    char* errMsg = nullptr;
    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::cerr << "SqliteClipRepository: 设置 WAL 模式失败: " << errMsg << std::endl;
        sqlite3_free(errMsg);
        // 不是致命错误，继续
    }

    return true;
}

void SqliteClipRepository::closeDatabase() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteClipRepository::createTables() {
    const char* createTableSQL = R"(
        CREATE TABLE IF NOT EXISTS clip_items (
            id TEXT PRIMARY KEY,
            content TEXT NOT NULL,
            content_hash TEXT NOT NULL,
            timestamp INTEGER NOT NULL,
            is_pinned INTEGER NOT NULL DEFAULT 0,
            kind TEXT NOT NULL DEFAULT 'text',
            source_app TEXT,
            window_title TEXT,
            bundle_identifier TEXT,
            process_id INTEGER,
            is_from_editor INTEGER NOT NULL DEFAULT 0,
            position INTEGER NOT NULL DEFAULT 0
        );

        CREATE INDEX IF NOT EXISTS idx_clip_items_position
            ON clip_items(position ASC, timestamp DESC);
    )";

    return execLocked(createTableSQL);
}

bool SqliteClipRepository::prepareStatements() {
    struct StatementDef {
        sqlite3_stmt** stmt;
        const char* sql;
        const char* name;
    };

    const StatementDef defs[] = {
        { &stmtUpsert_, R"(
            INSERT INTO clip_items (id, content, content_hash, timestamp, is_pinned, kind,
                                    source_app, window_title, bundle_identifier, process_id,
                                    is_from_editor, position)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
            ON CONFLICT(id) DO UPDATE SET
                content = excluded.content,
                content_hash = excluded.content_hash,
                timestamp = excluded.timestamp,
                is_pinned = excluded.is_pinned,
                kind = excluded.kind,
                source_app = excluded.source_app,
                window_title = excluded.window_title,
                bundle_identifier = excluded.bundle_identifier,
                process_id = excluded.process_id,
                is_from_editor = excluded.is_from_editor,
                position = excluded.position
        )", "UPSERT" },
        { &stmtLoadAll_, R"(
            SELECT id, content, content_hash, timestamp, is_pinned, kind,
                   source_app, window_title, bundle_identifier, process_id, is_from_editor
            FROM clip_items
            ORDER BY position ASC, timestamp DESC
        )", "LOAD ALL" },
        { &stmtDelete_, "DELETE FROM clip_items WHERE id = ?", "DELETE" },
        { &stmtClearAll_, "DELETE FROM clip_items", "CLEAR ALL" },
        { &stmtClearUnpinned_, "DELETE FROM clip_items WHERE is_pinned = 0", "CLEAR UNPINNED" },
        { &stmtCount_, "SELECT COUNT(*) FROM clip_items", "COUNT" },
    };

    for (const auto& def : defs) {
        int rc = sqlite3_prepare_v2(db_, def.sql, -1, def.stmt, nullptr);
        if (rc != SQLITE_OK) {
            setErrorLocked(std::string("准备 ") + def.name + " 语句失败");
            return false;
        }
    }

    return true;
}

void SqliteClipRepository::finalizeStatements() {
    if (stmtUpsert_) { sqlite3_finalize(stmtUpsert_); stmtUpsert_ = nullptr; }
    if (stmtLoadAll_) { sqlite3_finalize(stmtLoadAll_); stmtLoadAll_ = nullptr; }
    if (stmtDelete_) { sqlite3_finalize(stmtDelete_); stmtDelete_ = nullptr; }
    if (stmtClearAll_) { sqlite3_finalize(stmtClearAll_); stmtClearAll_ = nullptr; }
    if (stmtClearUnpinned_) { sqlite3_finalize(stmtClearUnpinned_); stmtClearUnpinned_ = nullptr; }
    if (stmtCount_) { sqlite3_finalize(stmtCount_); stmtCount_ = nullptr; }
}

bool SqliteClipRepository::execLocked(const char* sql) {
    char* errMsg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        lastError_ = errMsg ? errMsg : sqlite3_errmsg(db_);
        std::cerr << "SqliteClipRepository: 执行 SQL 失败: " << lastError_ << std::endl;
        sqlite3_free(errMsg);
        return false;
    }
    return true;
}

void SqliteClipRepository::setErrorLocked(const std::string& context) {
    lastError_ = context + ": " + (db_ ? sqlite3_errmsg(db_) : "数据库未打开");
    std::cerr << "SqliteClipRepository: " << lastError_ << std::endl;
}

ClipItem SqliteClipRepository::rowToItem(sqlite3_stmt* stmt) const {
    ClipItem item;

    const char* id = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    item.id = id ? id : "";

    const char* content = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
    if (content) {
        item.content.assign(content, static_cast<size_t>(sqlite3_column_bytes(stmt, 1)));
    }

    const char* hash = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 2));
    item.contentHash = hash ? hash : "";

    item.timestamp = sqlite3_column_int64(stmt, 3);
    item.isPinned = sqlite3_column_int(stmt, 4) != 0;

    const char* kind = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 5));
    item.kind = stringToClipItemKind(kind ? kind : "text");

    item.sourceApp = columnOptionalText(stmt, 6);
    item.windowTitle = columnOptionalText(stmt, 7);
    item.bundleIdentifier = columnOptionalText(stmt, 8);
    if (sqlite3_column_type(stmt, 9) != SQLITE_NULL) {
        item.processId = sqlite3_column_int64(stmt, 9);
    }
    item.isFromEditor = sqlite3_column_int(stmt, 10) != 0;

    return item;
}

// ========== IClipRepository 接口实现 ==========

bool SqliteClipRepository::save(const std::vector<ClipItem>& items) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        lastError_ = "数据库未初始化";
        return false;
    }
    if (items.empty()) {
        return true;
    }

    if (!execLocked("BEGIN TRANSACTION;")) {
        return false;
    }

    int position = 0;
    for (const auto& item : items) {
        std::string kind = clipItemKindToString(item.kind);

        sqlite3_reset(stmtUpsert_);
        sqlite3_clear_bindings(stmtUpsert_);
        sqlite3_bind_text(stmtUpsert_, 1, item.id.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(stmtUpsert_, 2, item.content.data(),
                          static_cast<int>(item.content.size()), SQLITE_TRANSIENT);
        sqlite3_bind_text(stmtUpsert_, 3, item.contentHash.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_int64(stmtUpsert_, 4, item.timestamp);
        sqlite3_bind_int(stmtUpsert_, 5, item.isPinned ? 1 : 0);
        sqlite3_bind_text(stmtUpsert_, 6, kind.c_str(), -1, SQLITE_TRANSIENT);
        bindOptionalText(stmtUpsert_, 7, item.sourceApp);
        bindOptionalText(stmtUpsert_, 8, item.windowTitle);
        bindOptionalText(stmtUpsert_, 9, item.bundleIdentifier);
        if (item.processId) {
            sqlite3_bind_int64(stmtUpsert_, 10, *item.processId);
        } else {
            sqlite3_bind_null(stmtUpsert_, 10);
        }
        sqlite3_bind_int(stmtUpsert_, 11, item.isFromEditor ? 1 : 0);
        sqlite3_bind_int(stmtUpsert_, 12, position++);

        int rc = sqlite3_step(stmtUpsert_);
        if (rc != SQLITE_DONE) {
            setErrorLocked("保存条目失败");
            sqlite3_reset(stmtUpsert_);
            sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
            return false;
        }
    }
    sqlite3_reset(stmtUpsert_);

    if (!execLocked("COMMIT;")) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        return false;
    }
    return true;
}

std::optional<std::vector<ClipItem>> SqliteClipRepository::loadAll() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        lastError_ = "数据库未初始化";
        return std::nullopt;
    }

    std::vector<ClipItem> items;
    sqlite3_reset(stmtLoadAll_);

    int rc;
    while ((rc = sqlite3_step(stmtLoadAll_)) == SQLITE_ROW) {
        items.push_back(rowToItem(stmtLoadAll_));
    }
    sqlite3_reset(stmtLoadAll_);

    if (rc != SQLITE_DONE) {
        setErrorLocked("加载条目失败");
        return std::nullopt;
    }
    return items;
}

bool SqliteClipRepository::remove(const ClipItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        lastError_ = "数据库未初始化";
        return false;
    }

    sqlite3_reset(stmtDelete_);
    sqlite3_bind_text(stmtDelete_, 1, item.id.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmtDelete_);
    sqlite3_reset(stmtDelete_);
    if (rc != SQLITE_DONE) {
        setErrorLocked("删除条目失败");
        return false;
    }
    return true;
}

bool SqliteClipRepository::clear(bool keepPinned) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        lastError_ = "数据库未初始化";
        return false;
    }

    sqlite3_stmt* stmt = keepPinned ? stmtClearUnpinned_ : stmtClearAll_;
    sqlite3_reset(stmt);

    int rc = sqlite3_step(stmt);
    sqlite3_reset(stmt);
    if (rc != SQLITE_DONE) {
        setErrorLocked("清空失败");
        return false;
    }
    return true;
}

std::string SqliteClipRepository::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

int64_t SqliteClipRepository::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!initialized_) {
        return -1;
    }

    sqlite3_reset(stmtCount_);
    int64_t result = -1;
    if (sqlite3_step(stmtCount_) == SQLITE_ROW) {
        result = sqlite3_column_int64(stmtCount_, 0);
    }
    sqlite3_reset(stmtCount_);
    return result;
}

} // namespace cliphist
