/**
 * ClipboardManager 实现
 *
 * 连接监听、历史集合、持久化、粘贴队列和自动清空。
 */

#include "clipboard_manager.h"

#include <QDebug>

namespace cliphist {

ClipboardManager::ClipboardManager(std::unique_ptr<IClipboardResource> resource,
                                   std::unique_ptr<IClipRepository> repository,
                                   std::unique_ptr<IAppInfoResolver> resolver,
                                   std::unique_ptr<IPasteCommandMonitor> pasteMonitor,
                                   QObject* parent)
    : QObject(parent)
    , resource_(std::move(resource))
    , repository_(std::move(repository))
    , resolver_(std::move(resolver))
    , pasteMonitor_(std::move(pasteMonitor))
{
    qRegisterMetaType<cliphist::PasteMode>("cliphist::PasteMode");
    qRegisterMetaType<cliphist::ClipboardErrorCode>("cliphist::ClipboardErrorCode");

    ClipboardConfig defaults;
    store_ = std::make_unique<HistoryStore>(defaults.maxHistoryItems,
                                            defaults.maxPinnedItems,
                                            static_cast<size_t>(defaults.dedupIndexSize));
    monitor_ = std::make_unique<ClipboardMonitor>(*resource_, resolver_.get());
    gateway_ = std::make_unique<PersistenceGateway>(*repository_, defaults.saveDebounceMs);
    pasteQueue_ = std::make_unique<PasteQueueController>(*store_, pasteMonitor_.get());
    autoClear_ = std::make_unique<AutoClearController>(*monitor_);
}

ClipboardManager::~ClipboardManager() {
    shutdown();
}

// ========== 初始化和关闭 ==========

bool ClipboardManager::initialize(const ClipboardConfig& config,
                                  const AutoClearConfig& autoClearConfig) {
    if (initialized_) {
        return true;
    }

    enabled_ = config.enabled;
    maxAgeDays_ = config.maxAgeDays;
    store_->setMaxHistoryItems(config.maxHistoryItems);
    store_->setMaxPinnedItems(config.maxPinnedItems);
    store_->setDedupCapacity(static_cast<size_t>(config.dedupIndexSize));
    monitor_->setPollIntervalBounds(config.minPollIntervalMs, config.maxPollIntervalMs);
    gateway_->setDebounceMs(config.saveDebounceMs);

    // 加载历史：先按当前上限淘汰，再对外可见
    auto loaded = gateway_->loadAll();
    if (loaded) {
        auto dropped = store_->replaceAll(std::move(*loaded));
        removeFromRepository(dropped);
        if (!dropped.empty()) {
            qDebug() << "ClipboardManager: 加载时淘汰" << dropped.size() << "条记录";
        }
    } else {
        qWarning() << "ClipboardManager: 加载历史失败，以空历史运行";
        emit errorOccurred(ClipboardErrorCode::PersistenceFailure,
                           QString::fromStdString(repository_->lastError()));
    }

    store_->setChangeCallback([this]() { onHistoryChanged(); });

    if (maxAgeDays_ > 0) {
        removeFromRepository(store_->purgeExpired(maxAgeDays_, currentTimestampMs()));
    }

    monitor_->setCaptureCallback([this](const CapturedClip& clip) {
        onClipboardCaptured(clip);
    });

    // 粘贴队列的处理函数在控制器释放锁后调用
    pasteQueue_->setRecopyHandler([this](const ClipItem& item) {
        recopyInternal(item);
    });
    pasteQueue_->setClearClipboardHandler([this]() {
        monitor_->clearClipboard();
    });
    pasteQueue_->setAutoClearHandlers(
        [this]() { autoClear_->pause(); },
        [this]() { autoClear_->resume(); });
    pasteQueue_->setModeChangedCallback([this](PasteMode mode) {
        emit pasteModeChanged(mode);
    });

    connect(autoClear_.get(), &AutoClearController::clipboardCleared,
            this, &ClipboardManager::clipboardAutoCleared);

    autoClear_->setIntervalMinutes(autoClearConfig.intervalMinutes);
    autoClear_->setEnabled(autoClearConfig.enabled);

    initialized_ = true;

    qDebug() << "ClipboardManager: 初始化成功";
    qDebug() << "  历史条数:" << store_->count();
    qDebug() << "  最大条数:" << store_->maxHistoryItems();
    qDebug() << "  粘贴队列:" << (pasteMonitor_ ? "可用" : "不可用");

    return true;
}

void ClipboardManager::shutdown() {
    if (!initialized_) {
        return;
    }

    stopMonitoring();
    autoClear_->setEnabled(false);
    pasteQueue_->resetPasteQueue();

    PersistenceResult result = gateway_->flushPendingSaves();
    if (!result.success) {
        qWarning() << "ClipboardManager: 关闭时有" << result.failedOperations
                   << "个持久化操作失败:" << QString::fromStdString(result.errorMessage);
    }
    gateway_->shutdown();

    store_->setChangeCallback(nullptr);
    monitor_->setCaptureCallback(nullptr);
    initialized_ = false;

    qDebug() << "ClipboardManager: 已关闭";
}

// ========== 监听控制 ==========

bool ClipboardManager::startMonitoring() {
    if (!initialized_) {
        qWarning() << "ClipboardManager: 未初始化，无法启动监听";
        return false;
    }

    if (!enabled_) {
        qDebug() << "ClipboardManager: 功能已禁用，不启动监听";
        return false;
    }

    if (monitor_->isRunning()) {
        return true;
    }

    monitor_->start();
    qDebug() << "ClipboardManager: 监听已启动";
    emit monitoringStateChanged(true);
    return true;
}

void ClipboardManager::stopMonitoring() {
    if (!monitor_->isRunning()) {
        return;
    }

    monitor_->stop();
    qDebug() << "ClipboardManager: 监听已停止";
    emit monitoringStateChanged(false);
}

bool ClipboardManager::isMonitoring() const {
    return monitor_->isRunning();
}

// ========== 历史记录管理 ==========

std::vector<ClipItem> ClipboardManager::history() const {
    return store_->items();
}

std::vector<ClipItem> ClipboardManager::search(const std::string& query) const {
    return store_->search(query);
}

std::vector<ClipItem> ClipboardManager::filterByKind(ClipItemKind kind) const {
    return store_->filterByKind(kind);
}

std::optional<ClipItem> ClipboardManager::findItem(const std::string& id) const {
    return store_->find(id);
}

size_t ClipboardManager::itemCount() const {
    return store_->count();
}

bool ClipboardManager::copyFromEditor(const std::string& text) {
    if (isBlankText(text)) {
        qDebug() << "ClipboardManager: 文本为空或仅包含空白，忽略";
        return false;
    }

    pasteQueue_->onManualSelection();

    if (!monitor_->writeInternal(text, true)) {
        qWarning() << "ClipboardManager: 写入剪贴板失败";
        return false;
    }

    ClipItem item = ClipItem::create(text);
    item.isFromEditor = true;
    RecordResult result = store_->record(item);
    removeFromRepository(result.evicted);
    if (!result.evicted.empty()) {
        pasteQueue_->syncWithHistory();
    }
    return true;
}

bool ClipboardManager::recopyItem(const std::string& id) {
    auto item = store_->find(id);
    if (!item) {
        qWarning() << "ClipboardManager: 记录不存在:" << QString::fromStdString(id);
        return false;
    }

    pasteQueue_->onManualSelection();

    RecordResult result = recopyInternal(*item);
    if (!result.evicted.empty()) {
        pasteQueue_->syncWithHistory();
    }

    qDebug() << "ClipboardManager: 重新复制成功，记录 ID:" << QString::fromStdString(id);
    return true;
}

bool ClipboardManager::togglePin(const std::string& id) {
    auto item = store_->find(id);
    if (!item) {
        return false;
    }

    bool pinned = store_->togglePin(id);
    if (!item->isPinned && !pinned) {
        emit errorOccurred(ClipboardErrorCode::PinLimitExceeded,
                           QStringLiteral("置顶数量已达上限 %1").arg(store_->maxPinnedItems()));
    }
    return pinned;
}

bool ClipboardManager::deleteItem(const std::string& id) {
    auto removed = store_->remove(id);
    if (!removed) {
        return false;
    }

    gateway_->remove(*removed);
    pasteQueue_->syncWithHistory();
    qDebug() << "ClipboardManager: 删除记录成功:" << QString::fromStdString(id);
    return true;
}

void ClipboardManager::clearHistory(bool keepPinned) {
    auto removed = store_->clear(keepPinned);
    gateway_->clear(keepPinned);
    pasteQueue_->syncWithHistory();
    qDebug() << "ClipboardManager: 历史记录已清空，删除" << removed.size() << "条记录";
}

void ClipboardManager::performCleanup() {
    if (maxAgeDays_ <= 0) {
        return;
    }

    qDebug() << "ClipboardManager: 执行清理，maxAgeDays=" << maxAgeDays_;

    auto removed = store_->purgeExpired(maxAgeDays_, currentTimestampMs());
    if (removed.empty()) {
        return;
    }

    removeFromRepository(removed);
    pasteQueue_->syncWithHistory();
    qDebug() << "ClipboardManager: 清理完成，删除" << removed.size() << "条记录";
}

PersistenceResult ClipboardManager::flushPendingSaves() {
    PersistenceResult result = gateway_->flushPendingSaves();
    if (!result.success) {
        emit errorOccurred(result.error, QString::fromStdString(result.errorMessage));
    }
    return result;
}

// ========== 配置 ==========

void ClipboardManager::applyConfig(const ClipboardConfig& config) {
    maxAgeDays_ = config.maxAgeDays;

    auto evicted = store_->setMaxHistoryItems(config.maxHistoryItems);
    store_->setMaxPinnedItems(config.maxPinnedItems);
    store_->setDedupCapacity(static_cast<size_t>(config.dedupIndexSize));
    monitor_->setPollIntervalBounds(config.minPollIntervalMs, config.maxPollIntervalMs);
    gateway_->setDebounceMs(config.saveDebounceMs);

    if (!evicted.empty()) {
        removeFromRepository(evicted);
        pasteQueue_->syncWithHistory();
    }

    performCleanup();
    setEnabled(config.enabled);
}

void ClipboardManager::applyAutoClearConfig(const AutoClearConfig& config) {
    autoClear_->setIntervalMinutes(config.intervalMinutes);
    autoClear_->setEnabled(config.enabled);
}

void ClipboardManager::setEnabled(bool enabled) {
    if (enabled_ == enabled) {
        return;
    }

    enabled_ = enabled;
    if (enabled) {
        startMonitoring();
    } else {
        stopMonitoring();
    }
    qDebug() << "ClipboardManager: 功能" << (enabled ? "已启用" : "已禁用");
}

// ========== 内部回调 ==========

void ClipboardManager::onClipboardCaptured(const CapturedClip& clip) {
    if (!enabled_) {
        return;
    }

    ClipItem item = ClipItem::create(clip.text);
    item.sourceApp = clip.appInfo.appName;
    item.windowTitle = clip.appInfo.windowTitle;
    item.bundleIdentifier = clip.appInfo.bundleIdentifier;
    item.processId = clip.appInfo.processId;
    item.isFromEditor = clip.isFromEditor;

    RecordResult result = store_->record(item);
    removeFromRepository(result.evicted);

    // 外部复制结束粘贴队列
    pasteQueue_->onExternalCopy();

    if (result.changed) {
        emit itemCaptured(QString::fromStdString(result.item.id));
    }
}

RecordResult ClipboardManager::recopyInternal(const ClipItem& item) {
    if (!monitor_->writeInternal(item.content, item.isFromEditor)) {
        qWarning() << "ClipboardManager: 写入剪贴板失败";
    }

    RecordResult result = store_->recopy(item);
    removeFromRepository(result.evicted);
    return result;
}

void ClipboardManager::removeFromRepository(const std::vector<ClipItem>& items) {
    for (const auto& item : items) {
        gateway_->remove(item);
    }
}

void ClipboardManager::onHistoryChanged() {
    gateway_->scheduleSave(store_->items());
    emit historyChanged();
}

} // namespace cliphist
