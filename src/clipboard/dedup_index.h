/**
 * DeduplicationIndex - 近期内容指纹索引
 *
 * 以 O(1) 回答"最近是否见过这段内容"，容量有限，按先进先出淘汰最旧的指纹。
 * 容量与历史记录上限无关，用于限制热路径上去重检查的开销。
 *
 * 注意：索引不是"是否已存在于历史"的权威来源。旧条目可能已被挤出索引
 * 但仍留在历史中，HistoryStore 始终会做完整内容比对。
 *
 * 非线程安全，由 HistoryStore 在其锁内使用。
 */

#ifndef CLIPHIST_CLIPBOARD_DEDUP_INDEX_H
#define CLIPHIST_CLIPBOARD_DEDUP_INDEX_H

#include <cstddef>
#include <list>
#include <string>
#include <unordered_map>

namespace cliphist {

class DeduplicationIndex {
public:
    static constexpr size_t DEFAULT_CAPACITY = 50;

    explicit DeduplicationIndex(size_t capacity = DEFAULT_CAPACITY);

    /**
     * 检查并记录指纹
     *
     * 新指纹追加到最新位置；已存在的指纹保持原位置（先进先出，命中不刷新）。
     *
     * @param fingerprint 内容指纹
     * @return 指纹此前是否已存在
     */
    bool checkAndRecord(const std::string& fingerprint);

    bool contains(const std::string& fingerprint) const;

    /**
     * 移除指纹
     */
    void forget(const std::string& fingerprint);

    void clear();

    /**
     * 设置容量
     *
     * 缩小容量时立即淘汰最旧的指纹。
     *
     * @param capacity 新容量（最小为 1）
     */
    void setCapacity(size_t capacity);

    size_t capacity() const { return capacity_; }
    size_t size() const { return order_.size(); }

private:
    void evictOverflow();

    size_t capacity_;
    std::list<std::string> order_;  // 头部最旧，尾部最新
    std::unordered_map<std::string, std::list<std::string>::iterator> positions_;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_DEDUP_INDEX_H
