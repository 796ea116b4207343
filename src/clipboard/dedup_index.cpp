#include "dedup_index.h"

#include <algorithm>
#include <iterator>

namespace cliphist {

DeduplicationIndex::DeduplicationIndex(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity))
{
}

bool DeduplicationIndex::checkAndRecord(const std::string& fingerprint) {
    // 命中不改变顺序：按首次记录的先后淘汰
    if (positions_.find(fingerprint) != positions_.end()) {
        return true;
    }

    order_.push_back(fingerprint);
    positions_[fingerprint] = std::prev(order_.end());
    evictOverflow();
    return false;
}

bool DeduplicationIndex::contains(const std::string& fingerprint) const {
    return positions_.find(fingerprint) != positions_.end();
}

void DeduplicationIndex::forget(const std::string& fingerprint) {
    auto it = positions_.find(fingerprint);
    if (it == positions_.end()) {
        return;
    }
    order_.erase(it->second);
    positions_.erase(it);
}

void DeduplicationIndex::clear() {
    order_.clear();
    positions_.clear();
}

void DeduplicationIndex::setCapacity(size_t capacity) {
    capacity_ = std::max<size_t>(1, capacity);
    evictOverflow();
}

void DeduplicationIndex::evictOverflow() {
    while (order_.size() > capacity_) {
        positions_.erase(order_.front());
        order_.pop_front();
    }
}

} // namespace cliphist
