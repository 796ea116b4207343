/**
 * ClipboardManager - 剪贴板历史管理器
 *
 * 组合并连接剪贴板历史引擎的各个组件：
 * - ClipboardMonitor：检测外部复制，唯一的剪贴板写入者
 * - HistoryStore：去重、置顶、淘汰、搜索
 * - PersistenceGateway：防抖写入存储库
 * - PasteQueueController：按顺序粘贴
 * - AutoClearController：定时清空剪贴板
 *
 * 外部依赖（系统剪贴板、存储库、应用信息解析器、粘贴命令监听器）通过构造函数注入，
 * 由管理器持有。组件级通知使用回调，对外通知使用 Qt 信号。
 *
 * 信号可能在监听线程上发射，跨线程连接时请使用排队连接。
 */

#ifndef CLIPHIST_CLIPBOARD_CLIPBOARD_MANAGER_H
#define CLIPHIST_CLIPBOARD_CLIPBOARD_MANAGER_H

#include <QMetaType>
#include <QObject>
#include <QString>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "auto_clear_controller.h"
#include "clip_item.h"
#include "clip_repository.h"
#include "clipboard_errors.h"
#include "clipboard_monitor.h"
#include "clipboard_resource.h"
#include "history_store.h"
#include "paste_command_monitor.h"
#include "paste_queue_controller.h"
#include "persistence_gateway.h"
#include "../core/config_manager.h"

namespace cliphist {

class ClipboardManager : public QObject {
    Q_OBJECT

public:
    /**
     * 构造函数
     *
     * @param resource 系统剪贴板
     * @param repository 历史存储库
     * @param resolver 应用信息解析器，可为空
     * @param pasteMonitor 粘贴命令监听器，可为空（粘贴队列不可用）
     * @param parent Qt 父对象
     */
    ClipboardManager(std::unique_ptr<IClipboardResource> resource,
                     std::unique_ptr<IClipRepository> repository,
                     std::unique_ptr<IAppInfoResolver> resolver = nullptr,
                     std::unique_ptr<IPasteCommandMonitor> pasteMonitor = nullptr,
                     QObject* parent = nullptr);

    /**
     * 析构函数
     *
     * 先停止监听并写完待处理的持久化操作，再释放存储库。
     */
    ~ClipboardManager() override;

    // 禁止拷贝和移动
    ClipboardManager(const ClipboardManager&) = delete;
    ClipboardManager& operator=(const ClipboardManager&) = delete;

    /**
     * 初始化
     *
     * 应用配置，从存储库加载历史（按当前上限淘汰后再对外可见），
     * 并连接各组件。
     *
     * @param config 剪贴板配置
     * @param autoClearConfig 自动清空配置
     * @return 是否成功（加载失败时仍以空历史运行，返回 true）
     */
    bool initialize(const ClipboardConfig& config = ClipboardConfig(),
                    const AutoClearConfig& autoClearConfig = AutoClearConfig());

    /**
     * 关闭
     *
     * 停止监听和自动清空，重置粘贴队列，写完待处理的持久化操作。
     */
    void shutdown();

    bool isInitialized() const { return initialized_; }

    // ========== 监听控制 ==========

    bool startMonitoring();
    void stopMonitoring();
    bool isMonitoring() const;

    // ========== 历史记录管理 ==========

    std::vector<ClipItem> history() const;
    std::vector<ClipItem> search(const std::string& query) const;
    std::vector<ClipItem> filterByKind(ClipItemKind kind) const;
    std::optional<ClipItem> findItem(const std::string& id) const;

    /**
     * 从内置编辑器复制
     *
     * 写入剪贴板（不会被再次捕获）并记录到历史。
     *
     * @param text 文本内容
     * @return 是否成功（空白文本返回 false）
     */
    bool copyFromEditor(const std::string& text);

    /**
     * 手动选择历史条目（重新复制）
     *
     * 重置粘贴队列，把条目放回剪贴板并移到最前。
     *
     * @param id 条目 ID
     * @return 是否成功
     */
    bool recopyItem(const std::string& id);

    /**
     * 切换置顶
     *
     * @param id 条目 ID
     * @return 新的置顶状态；被拒绝时返回 false 并发射 errorOccurred
     */
    bool togglePin(const std::string& id);

    /**
     * 删除条目
     *
     * @return 条目是否存在
     */
    bool deleteItem(const std::string& id);

    /**
     * 清空历史
     *
     * @param keepPinned 是否保留置顶条目
     */
    void clearHistory(bool keepPinned = true);

    size_t itemCount() const;

    /**
     * 清理过期记录（按保留天数）
     */
    void performCleanup();

    /**
     * 等待持久化完成
     */
    PersistenceResult flushPendingSaves();

    // ========== 配置 ==========

    /**
     * 应用剪贴板配置（运行时生效）
     */
    void applyConfig(const ClipboardConfig& config);

    /**
     * 应用自动清空配置
     */
    void applyAutoClearConfig(const AutoClearConfig& config);

    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    // ========== 组件访问 ==========

    PasteQueueController& pasteQueue() { return *pasteQueue_; }
    AutoClearController& autoClear() { return *autoClear_; }
    ClipboardMonitor& monitor() { return *monitor_; }
    HistoryStore& store() { return *store_; }

signals:
    /**
     * 历史记录变化
     */
    void historyChanged();

    /**
     * 捕获到外部复制（新增或更新）
     */
    void itemCaptured(const QString& itemId);

    /**
     * 监听状态变化
     */
    void monitoringStateChanged(bool running);

    /**
     * 粘贴模式变化
     */
    void pasteModeChanged(cliphist::PasteMode mode);

    /**
     * 剪贴板被自动清空
     */
    void clipboardAutoCleared();

    /**
     * 可恢复错误
     */
    void errorOccurred(cliphist::ClipboardErrorCode code, const QString& message);

private:
    void onClipboardCaptured(const CapturedClip& clip);
    RecordResult recopyInternal(const ClipItem& item);
    void removeFromRepository(const std::vector<ClipItem>& items);
    void onHistoryChanged();

    bool initialized_ = false;
    std::atomic<bool> enabled_{true};
    int maxAgeDays_ = 0;

    // 外部依赖
    std::unique_ptr<IClipboardResource> resource_;
    std::unique_ptr<IClipRepository> repository_;
    std::unique_ptr<IAppInfoResolver> resolver_;
    std::unique_ptr<IPasteCommandMonitor> pasteMonitor_;

    // 组件（按依赖顺序构造，逆序析构）
    std::unique_ptr<HistoryStore> store_;
    std::unique_ptr<ClipboardMonitor> monitor_;
    std::unique_ptr<PersistenceGateway> gateway_;
    std::unique_ptr<PasteQueueController> pasteQueue_;
    std::unique_ptr<AutoClearController> autoClear_;
};

} // namespace cliphist

Q_DECLARE_METATYPE(cliphist::PasteMode)
Q_DECLARE_METATYPE(cliphist::ClipboardErrorCode)

#endif // CLIPHIST_CLIPBOARD_CLIPBOARD_MANAGER_H
