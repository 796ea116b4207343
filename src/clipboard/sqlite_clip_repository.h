/**
 * SqliteClipRepository - 基于 SQLite 的剪贴板历史存储库
 *
 * 实现 IClipRepository，将 ClipItem 持久化到 clip_items 表。
 *
 * 功能：
 * - WAL 模式，预编译语句
 * - 快照保存在单个事务内完成（插入或更新，记录顺序）
 * - 按顺序加载全部条目
 * - 删除单条 / 清空（可保留置顶）
 *
 * 线程安全：所有公共方法由内部互斥锁保护。
 */

#ifndef CLIPHIST_CLIPBOARD_SQLITE_CLIP_REPOSITORY_H
#define CLIPHIST_CLIPBOARD_SQLITE_CLIP_REPOSITORY_H

#include "clip_repository.h"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// 前向声明 SQLite
struct sqlite3;
struct sqlite3_stmt;

namespace cliphist {

class SqliteClipRepository : public IClipRepository {
public:
    SqliteClipRepository() = default;
    ~SqliteClipRepository() override;

    // 禁止拷贝
    SqliteClipRepository(const SqliteClipRepository&) = delete;
    SqliteClipRepository& operator=(const SqliteClipRepository&) = delete;

    /**
     * 打开数据库
     *
     * 自动创建所在目录和表结构。
     *
     * @param dbPath 数据库文件路径
     * @return 是否成功
     */
    bool initialize(const std::string& dbPath);

    /**
     * 关闭数据库
     */
    void shutdown();

    bool isInitialized() const;
    std::string getDatabasePath() const;

    // ========== IClipRepository 接口实现 ==========

    bool save(const std::vector<ClipItem>& items) override;
    std::optional<std::vector<ClipItem>> loadAll() override;
    bool remove(const ClipItem& item) override;
    bool clear(bool keepPinned) override;
    std::string lastError() const override;

    /**
     * 获取存储的条目数
     *
     * @return 条目数，失败返回 -1
     */
    int64_t count();

private:
    bool openDatabase();
    void closeDatabase();
    bool createTables();
    bool prepareStatements();
    void finalizeStatements();

    bool execLocked(const char* sql);
    void setErrorLocked(const std::string& context);
    ClipItem rowToItem(sqlite3_stmt* stmt) const;

    mutable std::mutex mutex_;
    bool initialized_ = false;
    std::string dbPath_;
    std::string lastError_;
    sqlite3* db_ = nullptr;

    // 预编译语句
    sqlite3_stmt* stmtUpsert_ = nullptr;
    sqlite3_stmt* stmtLoadAll_ = nullptr;
    sqlite3_stmt* stmtDelete_ = nullptr;
    sqlite3_stmt* stmtClearAll_ = nullptr;
    sqlite3_stmt* stmtClearUnpinned_ = nullptr;
    sqlite3_stmt* stmtCount_ = nullptr;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_SQLITE_CLIP_REPOSITORY_H
