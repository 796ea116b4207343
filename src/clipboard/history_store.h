/**
 * HistoryStore - 剪贴板历史记录集合
 *
 * 权威的有序历史集合（最近使用的在前），负责：
 * - 内容去重（同一内容只保留一条，按字节精确比较）
 * - 置顶感知的淘汰策略
 * - 置顶数量上限
 * - 搜索与过滤
 *
 * 所有操作在同一把锁内完成（去重检查、插入、淘汰为原子操作），
 * 均为纯内存同步操作，不做任何 I/O。变更回调在释放锁之后调用。
 */

#ifndef CLIPHIST_CLIPBOARD_HISTORY_STORE_H
#define CLIPHIST_CLIPBOARD_HISTORY_STORE_H

#include "clip_item.h"
#include "dedup_index.h"

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cliphist {

/**
 * record / recopy 的结果
 */
struct RecordResult {
    ClipItem item;                  // 存储后的条目（可能沿用已有条目的 id 和置顶状态）
    bool isNew = false;             // 是否新插入（false 表示去重更新）
    bool changed = false;           // 历史是否发生变化
    std::vector<ClipItem> evicted;  // 因超出上限被淘汰的条目
};

class HistoryStore {
public:
    using ChangeCallback = std::function<void()>;

    static constexpr int DEFAULT_MAX_HISTORY_ITEMS = 300;
    static constexpr int DEFAULT_MAX_PINNED_ITEMS = 20;

    explicit HistoryStore(int maxHistoryItems = DEFAULT_MAX_HISTORY_ITEMS,
                          int maxPinnedItems = DEFAULT_MAX_PINNED_ITEMS,
                          size_t dedupCapacity = DeduplicationIndex::DEFAULT_CAPACITY);

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    // ========== 写入 ==========

    /**
     * 记录一次捕获
     *
     * 已存在相同内容：原地更新元数据、时间戳和来源信息（保留 id 和置顶状态），
     * 并移到最前；否则作为新条目插入最前。随后执行淘汰策略。
     *
     * 若指纹最近出现过且当前首条就是该内容，则不做任何修改。
     *
     * @param item 捕获的条目
     * @return 记录结果
     */
    RecordResult record(const ClipItem& item);

    /**
     * 重新复制历史条目
     *
     * 保留条目自身的元数据，更新时间戳并移到最前。已存在相同内容时
     * 沿用其 id 和置顶状态；条目已被淘汰时重新插入。
     *
     * @param item 要重新复制的条目
     * @return 记录结果
     */
    RecordResult recopy(const ClipItem& item);

    /**
     * 切换置顶状态
     *
     * 置顶数量已达上限时拒绝置顶（不做任何修改）；取消置顶总是成功。
     *
     * @param id 条目 ID
     * @return 成功时返回新的置顶状态；被拒绝或条目不存在时返回 false
     */
    bool togglePin(const std::string& id);

    /**
     * 删除条目
     *
     * 条目不存在时为空操作。
     *
     * @param id 条目 ID
     * @return 被删除的条目
     */
    std::optional<ClipItem> remove(const std::string& id);

    /**
     * 清空历史
     *
     * @param keepPinned 是否保留置顶条目
     * @return 被删除的条目
     */
    std::vector<ClipItem> clear(bool keepPinned);

    /**
     * 用加载的数据替换全部历史
     *
     * 按内容去重（保留先出现的），执行淘汰策略后重建去重索引。
     *
     * @param items 按最近使用降序排列的条目
     * @return 被丢弃的条目（重复或超出上限）
     */
    std::vector<ClipItem> replaceAll(std::vector<ClipItem> items);

    /**
     * 删除超过保留天数的非置顶条目
     *
     * @param maxAgeDays 最大保留天数（0 表示不限制）
     * @param nowMs 当前时间（Unix 毫秒）
     * @return 被删除的条目
     */
    std::vector<ClipItem> purgeExpired(int maxAgeDays, int64_t nowMs);

    // ========== 读取 ==========

    std::vector<ClipItem> items() const;
    size_t count() const;
    int pinnedCount() const;
    std::optional<ClipItem> find(const std::string& id) const;
    std::optional<ClipItem> findByContent(const std::string& content) const;
    std::optional<ClipItem> front() const;

    /**
     * 搜索
     *
     * 对内容做不区分大小写的子串匹配，保持历史顺序。空查询返回全部。
     */
    std::vector<ClipItem> search(const std::string& query) const;

    std::vector<ClipItem> filterByKind(ClipItemKind kind) const;

    // ========== 配置 ==========

    /**
     * 设置历史上限并立即执行淘汰
     *
     * @param maxItems 上限（小于 1 时按 1 处理）
     * @return 被淘汰的条目
     */
    std::vector<ClipItem> setMaxHistoryItems(int maxItems);

    void setMaxPinnedItems(int maxPinned);
    void setDedupCapacity(size_t capacity);

    int maxHistoryItems() const;
    int maxPinnedItems() const;

    /**
     * 设置变更回调
     *
     * 每次历史发生变化后调用（不持有锁）。
     */
    void setChangeCallback(ChangeCallback callback);

private:
    std::vector<ClipItem> applyEvictionLocked();
    std::vector<ClipItem>::iterator findByContentLocked(const std::string& content);
    int pinnedCountLocked() const;
    void notifyChanged();

    mutable std::mutex mutex_;
    std::vector<ClipItem> items_;       // 最近使用的在前
    DeduplicationIndex dedupIndex_;
    int maxHistoryItems_;
    int maxPinnedItems_;
    ChangeCallback changeCallback_;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_HISTORY_STORE_H
