#include "history_store.h"

#include <QDebug>
#include <QString>

#include <algorithm>
#include <iterator>
#include <unordered_set>

namespace cliphist {

namespace {

const std::string& fingerprintOf(const ClipItem& item, std::string& scratch) {
    if (!item.contentHash.empty()) {
        return item.contentHash;
    }
    scratch = computeContentHash(item.content);
    return scratch;
}

} // namespace

HistoryStore::HistoryStore(int maxHistoryItems, int maxPinnedItems, size_t dedupCapacity)
    : dedupIndex_(dedupCapacity)
    , maxHistoryItems_(std::max(1, maxHistoryItems))
    , maxPinnedItems_(std::max(1, maxPinnedItems))
{
}

// ========== 写入 ==========

RecordResult HistoryStore::record(const ClipItem& item) {
    RecordResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string scratch;
        const std::string& fingerprint = fingerprintOf(item, scratch);
        dedupIndex_.checkAndRecord(fingerprint);

        // 已有相同内容时原地更新元数据（保留 id 与置顶状态）并移到最前
        auto it = findByContentLocked(item.content);
        if (it != items_.end()) {
            ClipItem updated = item;
            updated.id = it->id;
            updated.isPinned = it->isPinned;
            updated.contentHash = fingerprint;
            items_.erase(it);
            items_.insert(items_.begin(), updated);
            result.isNew = false;
        } else {
            ClipItem inserted = item;
            if (inserted.id.empty()) {
                inserted.id = generateClipItemId();
            }
            inserted.contentHash = fingerprint;
            items_.insert(items_.begin(), inserted);
            result.isNew = true;
        }

        result.item = items_.front();
        result.changed = true;
        result.evicted = applyEvictionLocked();
    }

    notifyChanged();
    return result;
}

RecordResult HistoryStore::recopy(const ClipItem& item) {
    RecordResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::string scratch;
        const std::string& fingerprint = fingerprintOf(item, scratch);
        dedupIndex_.checkAndRecord(fingerprint);

        ClipItem moved = item;
        moved.contentHash = fingerprint;
        moved.timestamp = currentTimestampMs();

        auto it = findByContentLocked(item.content);
        if (it != items_.end()) {
            moved.id = it->id;
            moved.isPinned = it->isPinned;
            items_.erase(it);
            result.isNew = false;
        } else {
            // 已被淘汰：作为新条目重新插入
            if (moved.id.empty()) {
                moved.id = generateClipItemId();
            }
            result.isNew = true;
        }

        items_.insert(items_.begin(), moved);
        result.item = moved;
        result.changed = true;
        result.evicted = applyEvictionLocked();
    }

    notifyChanged();
    return result;
}

bool HistoryStore::togglePin(const std::string& id) {
    bool newState = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = std::find_if(items_.begin(), items_.end(),
                               [&id](const ClipItem& item) { return item.id == id; });
        if (it == items_.end()) {
            return false;
        }

        if (!it->isPinned && pinnedCountLocked() >= maxPinnedItems_) {
            qDebug() << "HistoryStore: PinLimitExceeded, 置顶数量已达上限" << maxPinnedItems_;
            return false;
        }

        it->isPinned = !it->isPinned;
        newState = it->isPinned;
    }

    notifyChanged();
    return newState;
}

std::optional<ClipItem> HistoryStore::remove(const std::string& id) {
    std::optional<ClipItem> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = std::find_if(items_.begin(), items_.end(),
                               [&id](const ClipItem& item) { return item.id == id; });
        if (it == items_.end()) {
            return std::nullopt;
        }

        removed = *it;
        dedupIndex_.forget(it->contentHash);
        items_.erase(it);
    }

    notifyChanged();
    return removed;
}

std::vector<ClipItem> HistoryStore::clear(bool keepPinned) {
    std::vector<ClipItem> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<ClipItem> kept;
        for (auto& item : items_) {
            if (keepPinned && item.isPinned) {
                kept.push_back(std::move(item));
            } else {
                dedupIndex_.forget(item.contentHash);
                removed.push_back(std::move(item));
            }
        }
        items_ = std::move(kept);
    }

    if (!removed.empty()) {
        notifyChanged();
    }
    return removed;
}

std::vector<ClipItem> HistoryStore::replaceAll(std::vector<ClipItem> items) {
    std::vector<ClipItem> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        items_.clear();
        dedupIndex_.clear();

        std::unordered_set<std::string> seen;
        for (auto& item : items) {
            if (item.contentHash.empty()) {
                item.contentHash = computeContentHash(item.content);
            }
            if (!seen.insert(item.content).second) {
                dropped.push_back(std::move(item));
                continue;
            }
            items_.push_back(std::move(item));
        }

        std::vector<ClipItem> evicted = applyEvictionLocked();
        dropped.insert(dropped.end(), evicted.begin(), evicted.end());

        // 从最旧到最新重建去重索引
        for (auto it = items_.rbegin(); it != items_.rend(); ++it) {
            dedupIndex_.checkAndRecord(it->contentHash);
        }

        if (!dropped.empty()) {
            qDebug() << "HistoryStore: 加载时丢弃" << dropped.size() << "条记录";
        }
    }

    notifyChanged();
    return dropped;
}

std::vector<ClipItem> HistoryStore::purgeExpired(int maxAgeDays, int64_t nowMs) {
    std::vector<ClipItem> removed;
    if (maxAgeDays <= 0) {
        return removed;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);

        int64_t cutoff = nowMs - static_cast<int64_t>(maxAgeDays) * 24 * 60 * 60 * 1000;
        std::vector<ClipItem> kept;
        for (auto& item : items_) {
            if (!item.isPinned && item.timestamp < cutoff) {
                dedupIndex_.forget(item.contentHash);
                removed.push_back(std::move(item));
            } else {
                kept.push_back(std::move(item));
            }
        }
        items_ = std::move(kept);
    }

    if (!removed.empty()) {
        qDebug() << "HistoryStore: 清理过期记录" << removed.size() << "条";
        notifyChanged();
    }
    return removed;
}

// ========== 读取 ==========

std::vector<ClipItem> HistoryStore::items() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_;
}

size_t HistoryStore::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

int HistoryStore::pinnedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pinnedCountLocked();
}

std::optional<ClipItem> HistoryStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : items_) {
        if (item.id == id) {
            return item;
        }
    }
    return std::nullopt;
}

std::optional<ClipItem> HistoryStore::findByContent(const std::string& content) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& item : items_) {
        if (item.content == content) {
            return item;
        }
    }
    return std::nullopt;
}

std::optional<ClipItem> HistoryStore::front() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
        return std::nullopt;
    }
    return items_.front();
}

std::vector<ClipItem> HistoryStore::search(const std::string& query) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (query.empty()) {
        return items_;
    }

    QString needle = QString::fromStdString(query);
    std::vector<ClipItem> matches;
    for (const auto& item : items_) {
        if (QString::fromStdString(item.content).contains(needle, Qt::CaseInsensitive)) {
            matches.push_back(item);
        }
    }
    return matches;
}

std::vector<ClipItem> HistoryStore::filterByKind(ClipItemKind kind) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClipItem> matches;
    for (const auto& item : items_) {
        if (item.kind == kind) {
            matches.push_back(item);
        }
    }
    return matches;
}

// ========== 配置 ==========

std::vector<ClipItem> HistoryStore::setMaxHistoryItems(int maxItems) {
    if (maxItems < 1) {
        qWarning() << "HistoryStore: 无效的历史上限" << maxItems << ", 使用 1";
        maxItems = 1;
    }

    std::vector<ClipItem> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        maxHistoryItems_ = maxItems;
        evicted = applyEvictionLocked();
    }

    if (!evicted.empty()) {
        notifyChanged();
    }
    return evicted;
}

void HistoryStore::setMaxPinnedItems(int maxPinned) {
    if (maxPinned < 1) {
        qWarning() << "HistoryStore: 无效的置顶上限" << maxPinned << ", 使用 1";
        maxPinned = 1;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    maxPinnedItems_ = maxPinned;
}

void HistoryStore::setDedupCapacity(size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    dedupIndex_.setCapacity(capacity);
}

int HistoryStore::maxHistoryItems() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxHistoryItems_;
}

int HistoryStore::maxPinnedItems() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxPinnedItems_;
}

void HistoryStore::setChangeCallback(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    changeCallback_ = std::move(callback);
}

// ========== 私有方法 ==========

std::vector<ClipItem> HistoryStore::applyEvictionLocked() {
    std::vector<ClipItem> evicted;

    while (items_.size() > static_cast<size_t>(maxHistoryItems_)) {
        // 优先淘汰最久未使用的非置顶条目
        auto victim = items_.end();
        for (auto it = items_.end(); it != items_.begin();) {
            --it;
            if (!it->isPinned) {
                victim = it;
                break;
            }
        }
        // 只剩置顶条目时淘汰最久未使用的置顶条目
        if (victim == items_.end()) {
            victim = std::prev(items_.end());
        }

        dedupIndex_.forget(victim->contentHash);
        evicted.push_back(std::move(*victim));
        items_.erase(victim);
    }

    return evicted;
}

std::vector<ClipItem>::iterator HistoryStore::findByContentLocked(const std::string& content) {
    return std::find_if(items_.begin(), items_.end(),
                        [&content](const ClipItem& item) { return item.content == content; });
}

int HistoryStore::pinnedCountLocked() const {
    return static_cast<int>(std::count_if(items_.begin(), items_.end(),
                                          [](const ClipItem& item) { return item.isPinned; }));
}

void HistoryStore::notifyChanged() {
    ChangeCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = changeCallback_;
    }
    if (callback) {
        callback();
    }
}

} // namespace cliphist
