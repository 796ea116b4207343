#include "paste_queue_controller.h"

#include <QDebug>

#include <algorithm>
#include <unordered_set>

namespace cliphist {

std::string pasteModeToString(PasteMode mode) {
    switch (mode) {
        case PasteMode::Clipboard: return "clipboard";
        case PasteMode::QueueOnce: return "queue_once";
        case PasteMode::QueueRepeat: return "queue_repeat";
        default: return "clipboard";
    }
}

PasteQueueController::PasteQueueController(HistoryStore& store, IPasteCommandMonitor* pasteMonitor)
    : store_(store)
    , pasteMonitor_(pasteMonitor)
{
}

PasteQueueController::~PasteQueueController() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (monitoring_ && pasteMonitor_) {
        pasteMonitor_->stop();
        monitoring_ = false;
    }
}

// ========== 处理函数 ==========

void PasteQueueController::setRecopyHandler(ItemHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    recopyHandler_ = std::move(handler);
}

void PasteQueueController::setClearClipboardHandler(ActionHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    clearClipboardHandler_ = std::move(handler);
}

void PasteQueueController::setAutoClearHandlers(ActionHandler pause, ActionHandler resume) {
    std::lock_guard<std::mutex> lock(mutex_);
    pauseAutoClear_ = std::move(pause);
    resumeAutoClear_ = std::move(resume);
}

void PasteQueueController::setModeChangedCallback(ModeChangedCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    modeChangedCallback_ = std::move(callback);
}

// ========== 队列模式 ==========

void PasteQueueController::toggleQueueMode() {
    PasteMode before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = mode_;

        if (!queueModeEnabled_) {
            queueModeEnabled_ = true;
            if (pauseAutoClear_) {
                deferLocked(pauseAutoClear_);
            }
            qDebug() << "PasteQueueController: 队列模式已开启";
        } else {
            resetLocked();
            qDebug() << "PasteQueueController: 队列模式已关闭";
        }
    }
    runDeferred(before);
}

void PasteQueueController::toggleQueueRepetition() {
    PasteMode before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = mode_;

        repetitionEnabled_ = !repetitionEnabled_;
        if (mode_ != PasteMode::Clipboard) {
            mode_ = repetitionEnabled_ ? PasteMode::QueueRepeat : PasteMode::QueueOnce;
        }
    }
    runDeferred(before);
}

bool PasteQueueController::isQueueModeEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queueModeEnabled_;
}

bool PasteQueueController::isRepetitionEnabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return repetitionEnabled_;
}

PasteMode PasteQueueController::mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mode_;
}

// ========== 选择 ==========

void PasteQueueController::queueSelection(const std::vector<ClipItem>& items,
                                          const std::optional<ClipItem>& anchor) {
    PasteMode before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = mode_;

        if (!selectionAllowedLocked()) {
            return;
        }

        std::optional<std::string> previousHead;
        if (!queue_.empty()) {
            previousHead = queue_.front();
        }

        for (const auto& item : items) {
            if (std::find(queue_.begin(), queue_.end(), item.id) != queue_.end()) {
                continue;
            }
            if (!store_.find(item.id)) {
                continue;
            }
            queue_.push_back(item.id);
        }

        if (anchor) {
            anchorId_ = anchor->id;
        }

        afterQueueChangedLocked(previousHead);
    }
    runDeferred(before);
}

void PasteQueueController::handleSelection(const ClipItem& item, Qt::KeyboardModifiers modifiers) {
    PasteMode before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = mode_;

        if (!selectionAllowedLocked()) {
            return;
        }

        if (modifiers & Qt::ShiftModifier) {
            std::vector<ClipItem> order = displayOrderLocked();
            auto indexOf = [&order](const std::string& id) {
                return std::find_if(order.begin(), order.end(),
                                    [&id](const ClipItem& candidate) { return candidate.id == id; });
            };

            auto current = indexOf(item.id);
            if (current == order.end()) {
                return;
            }

            auto anchor = anchorId_ ? indexOf(*anchorId_) : order.end();
            if (anchor == order.end()) {
                // 没有锚点：当前条目成为锚点，预览只包含它自己
                anchorId_ = item.id;
                preview_ = { item.id };
                return;
            }

            std::vector<ClipItem> range = makeShiftSelectionRange(
                order,
                static_cast<size_t>(anchor - order.begin()),
                static_cast<size_t>(current - order.begin()));
            preview_.clear();
            for (const auto& selected : range) {
                preview_.push_back(selected.id);
            }
        } else {
            if (!preview_.empty()) {
                commitPreviewLocked();
            }
            toggleSingleLocked(item);
        }
    }
    runDeferred(before);
}

void PasteQueueController::handleModifierRelease() {
    PasteMode before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = mode_;

        if (preview_.empty()) {
            return;
        }
        commitPreviewLocked();
    }
    runDeferred(before);
}

void PasteQueueController::handleModifiersChanged(Qt::KeyboardModifiers modifiers) {
    if (!(modifiers & Qt::ShiftModifier)) {
        handleModifierRelease();
    }
}

// ========== 粘贴 ==========

void PasteQueueController::advanceOnPasteSignal() {
    PasteMode before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = mode_;

        if (queue_.empty() || mode_ == PasteMode::Clipboard) {
            return;
        }

        if (mode_ == PasteMode::QueueOnce) {
            queue_.erase(queue_.begin());
            if (queue_.empty()) {
                resetLocked();
                if (clearClipboardHandler_) {
                    deferLocked(clearClipboardHandler_);
                }
                qDebug() << "PasteQueueController: 队列已用完";
            } else {
                recopyHeadLocked();
            }
        } else {
            std::rotate(queue_.begin(), queue_.begin() + 1, queue_.end());
            recopyHeadLocked();
        }
    }
    runDeferred(before);
}

void PasteQueueController::resetPasteQueue() {
    PasteMode before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = mode_;
        resetLocked();
    }
    runDeferred(before);
}

void PasteQueueController::onExternalCopy() {
    resetPasteQueue();
}

void PasteQueueController::onManualSelection() {
    resetPasteQueue();
}

void PasteQueueController::syncWithHistory() {
    PasteMode before;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        before = mode_;

        std::unordered_set<std::string> present;
        for (const auto& item : store_.items()) {
            present.insert(item.id);
        }
        auto missing = [&present](const std::string& id) { return present.count(id) == 0; };

        std::optional<std::string> previousHead;
        if (!queue_.empty()) {
            previousHead = queue_.front();
        }

        size_t queuedBefore = queue_.size();
        queue_.erase(std::remove_if(queue_.begin(), queue_.end(), missing), queue_.end());
        preview_.erase(std::remove_if(preview_.begin(), preview_.end(), missing), preview_.end());
        if (anchorId_ && missing(*anchorId_)) {
            anchorId_.reset();
        }

        if (queue_.size() != queuedBefore) {
            afterQueueChangedLocked(previousHead);
        }
    }
    runDeferred(before);
}

// ========== 查询 ==========

std::optional<int> PasteQueueController::queueBadge(const ClipItem& item) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find(queue_.begin(), queue_.end(), item.id);
    if (it == queue_.end()) {
        return std::nullopt;
    }
    return static_cast<int>(it - queue_.begin()) + 1;
}

std::optional<int> PasteQueueController::previewBadge(const ClipItem& item) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> projected = projectedQueueLocked();
    auto it = std::find(projected.begin(), projected.end(), item.id);
    if (it == projected.end()) {
        return std::nullopt;
    }
    return static_cast<int>(it - projected.begin()) + 1;
}

std::vector<std::string> PasteQueueController::queuedIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_;
}

std::vector<std::string> PasteQueueController::previewItems() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return preview_;
}

bool PasteQueueController::hasPendingPreview() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !preview_.empty();
}

std::optional<std::string> PasteQueueController::anchorId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return anchorId_;
}

std::vector<ClipItem> PasteQueueController::displayOrder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return displayOrderLocked();
}

std::vector<ClipItem> PasteQueueController::makeShiftSelectionRange(const std::vector<ClipItem>& baseline,
                                                                    size_t anchorIndex,
                                                                    size_t currentIndex) {
    std::vector<ClipItem> range;
    if (baseline.empty()) {
        return range;
    }

    anchorIndex = std::min(anchorIndex, baseline.size() - 1);
    currentIndex = std::min(currentIndex, baseline.size() - 1);

    if (anchorIndex <= currentIndex) {
        for (size_t i = anchorIndex; i <= currentIndex; ++i) {
            range.push_back(baseline[i]);
        }
    } else {
        for (size_t i = anchorIndex + 1; i-- > currentIndex;) {
            range.push_back(baseline[i]);
        }
    }
    return range;
}

// ========== 私有方法 ==========

bool PasteQueueController::selectionAllowedLocked() const {
    if (!queueModeEnabled_) {
        return false;
    }
    if (!pasteMonitor_ || !pasteMonitor_->hasPermission()) {
        qDebug() << "PasteQueueController: CapabilityUnavailable, 无法监听粘贴命令";
        return false;
    }
    return true;
}

std::vector<ClipItem> PasteQueueController::displayOrderLocked() const {
    std::vector<ClipItem> history = store_.items();
    std::vector<ClipItem> order;
    order.reserve(history.size());

    for (const auto& id : queue_) {
        auto it = std::find_if(history.begin(), history.end(),
                               [&id](const ClipItem& item) { return item.id == id; });
        if (it != history.end()) {
            order.push_back(*it);
        }
    }

    std::unordered_set<std::string> queued(queue_.begin(), queue_.end());
    for (const auto& item : history) {
        if (queued.count(item.id) == 0) {
            order.push_back(item);
        }
    }
    return order;
}

std::vector<std::string> PasteQueueController::projectedQueueLocked() const {
    std::vector<std::string> projected = queue_;
    for (const auto& id : preview_) {
        auto it = std::find(projected.begin(), projected.end(), id);
        if (it != projected.end()) {
            projected.erase(it);
        } else {
            projected.push_back(id);
        }
    }
    return projected;
}

void PasteQueueController::toggleSingleLocked(const ClipItem& item) {
    std::optional<std::string> previousHead;
    if (!queue_.empty()) {
        previousHead = queue_.front();
    }

    auto it = std::find(queue_.begin(), queue_.end(), item.id);
    if (it != queue_.end()) {
        queue_.erase(it);
    } else {
        if (!store_.find(item.id)) {
            return;
        }
        queue_.push_back(item.id);
    }
    anchorId_ = item.id;

    afterQueueChangedLocked(previousHead);
}

void PasteQueueController::commitPreviewLocked() {
    std::optional<std::string> previousHead;
    if (!queue_.empty()) {
        previousHead = queue_.front();
    }

    queue_ = projectedQueueLocked();
    preview_.clear();

    afterQueueChangedLocked(previousHead);
}

void PasteQueueController::afterQueueChangedLocked(const std::optional<std::string>& previousHead) {
    if (queue_.empty()) {
        if (mode_ != PasteMode::Clipboard || monitoring_) {
            deactivateLocked();
        }
        return;
    }

    if (mode_ == PasteMode::Clipboard) {
        if (!activateLocked()) {
            queue_.clear();
            preview_.clear();
            return;
        }
        recopyHeadLocked();
        return;
    }

    if (!previousHead || *previousHead != queue_.front()) {
        recopyHeadLocked();
    }
}

bool PasteQueueController::activateLocked() {
    if (!pasteMonitor_ || !pasteMonitor_->hasPermission()) {
        qDebug() << "PasteQueueController: CapabilityUnavailable, 无法监听粘贴命令";
        return false;
    }

    if (!monitoring_) {
        if (!pasteMonitor_->start([this]() { advanceOnPasteSignal(); })) {
            qDebug() << "PasteQueueController: CapabilityUnavailable, 启动粘贴监听失败";
            return false;
        }
        monitoring_ = true;
    }

    mode_ = repetitionEnabled_ ? PasteMode::QueueRepeat : PasteMode::QueueOnce;
    return true;
}

void PasteQueueController::deactivateLocked() {
    mode_ = PasteMode::Clipboard;
    if (monitoring_ && pasteMonitor_) {
        pasteMonitor_->stop();
    }
    monitoring_ = false;
}

void PasteQueueController::resetLocked() {
    bool wasEnabled = queueModeEnabled_;

    queue_.clear();
    preview_.clear();
    anchorId_.reset();
    deactivateLocked();
    queueModeEnabled_ = false;

    if (wasEnabled && resumeAutoClear_) {
        deferLocked(resumeAutoClear_);
    }
}

void PasteQueueController::recopyHeadLocked() {
    while (!queue_.empty()) {
        std::optional<ClipItem> head = store_.find(queue_.front());
        if (head) {
            if (recopyHandler_) {
                ItemHandler handler = recopyHandler_;
                ClipItem item = *head;
                deferLocked([handler, item]() { handler(item); });
            }
            return;
        }
        // 队首已不在历史中
        queue_.erase(queue_.begin());
    }
    deactivateLocked();
}

void PasteQueueController::deferLocked(ActionHandler action) {
    deferred_.push_back(std::move(action));
}

void PasteQueueController::runDeferred(PasteMode before) {
    std::vector<ActionHandler> actions;
    PasteMode after;
    ModeChangedCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        actions.swap(deferred_);
        after = mode_;
        callback = modeChangedCallback_;
    }

    for (const auto& action : actions) {
        action();
    }
    if (after != before && callback) {
        callback(after);
    }
}

} // namespace cliphist
