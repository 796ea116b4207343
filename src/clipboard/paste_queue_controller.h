/**
 * PasteQueueController - 粘贴队列控制器
 *
 * 管理"按顺序粘贴多条历史"的状态机：
 * - Clipboard：普通模式，剪贴板内容即最近复制的内容
 * - QueueOnce：每次粘贴后弹出队首，并把新的队首放到剪贴板
 * - QueueRepeat：每次粘贴后把队首移到队尾，循环粘贴
 *
 * 选择方式：
 * - 普通点击：切换单条（不在队列中则加入，否则移出），并设为锚点
 * - Shift 点击：按显示顺序计算锚点到当前条目的连续范围，作为预览；
 *   松开 Shift 时提交预览（已在队列中的移出，其余按范围顺序追加）
 *
 * 显示顺序 = 队列中的条目（队列顺序）+ 其余历史（历史顺序）。
 *
 * 锁顺序：本控制器的锁先于 HistoryStore 的锁。
 * 重新复制、清空剪贴板、自动清空暂停 / 恢复等处理函数在锁内只登记，
 * 释放锁后按登记顺序执行，处理函数及其触发的历史变化通知中
 * 可以再查询本控制器（例如 queueBadge）。
 */

#ifndef CLIPHIST_CLIPBOARD_PASTE_QUEUE_CONTROLLER_H
#define CLIPHIST_CLIPBOARD_PASTE_QUEUE_CONTROLLER_H

#include "clip_item.h"
#include "history_store.h"
#include "paste_command_monitor.h"

#include <Qt>

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace cliphist {

/**
 * 粘贴模式
 */
enum class PasteMode {
    Clipboard = 0,      // 普通剪贴板
    QueueOnce = 1,      // 队列，粘贴一次后移除
    QueueRepeat = 2     // 队列，循环粘贴
};

std::string pasteModeToString(PasteMode mode);

class PasteQueueController {
public:
    using ItemHandler = std::function<void(const ClipItem&)>;
    using ActionHandler = std::function<void()>;
    using ModeChangedCallback = std::function<void(PasteMode)>;

    /**
     * 构造函数
     *
     * @param store 历史集合
     * @param pasteMonitor 粘贴命令监听器，可为空（表示不具备该能力）
     */
    PasteQueueController(HistoryStore& store, IPasteCommandMonitor* pasteMonitor);
    ~PasteQueueController();

    PasteQueueController(const PasteQueueController&) = delete;
    PasteQueueController& operator=(const PasteQueueController&) = delete;

    // ========== 处理函数 ==========

    /**
     * 设置重新复制处理函数（队首变化时调用）
     */
    void setRecopyHandler(ItemHandler handler);

    /**
     * 设置清空剪贴板处理函数（单次队列用完时调用）
     */
    void setClearClipboardHandler(ActionHandler handler);

    /**
     * 设置自动清空的暂停 / 恢复处理函数
     */
    void setAutoClearHandlers(ActionHandler pause, ActionHandler resume);

    /**
     * 设置模式变化回调（不持有锁时调用）
     */
    void setModeChangedCallback(ModeChangedCallback callback);

    // ========== 队列模式 ==========

    /**
     * 开启 / 关闭队列选择
     *
     * 开启时暂停自动清空；关闭时重置队列。
     */
    void toggleQueueMode();

    /**
     * 在单次 / 循环之间切换
     *
     * 队列活动时立即切换模式，否则作为下次激活时的模式。
     */
    void toggleQueueRepetition();

    bool isQueueModeEnabled() const;
    bool isRepetitionEnabled() const;
    PasteMode mode() const;

    // ========== 选择 ==========

    /**
     * 把多条条目加入队列
     *
     * 已在队列中的条目被忽略，其余按给定顺序追加。
     *
     * @param items 要加入的条目
     * @param anchor 新的锚点
     */
    void queueSelection(const std::vector<ClipItem>& items,
                        const std::optional<ClipItem>& anchor = std::nullopt);

    /**
     * 处理一次点击
     *
     * @param item 被点击的条目
     * @param modifiers 点击时按住的修饰键
     */
    void handleSelection(const ClipItem& item, Qt::KeyboardModifiers modifiers);

    /**
     * 提交 Shift 选择预览
     */
    void handleModifierRelease();

    /**
     * 修饰键状态变化（不再按住 Shift 时提交预览）
     */
    void handleModifiersChanged(Qt::KeyboardModifiers modifiers);

    // ========== 粘贴 ==========

    /**
     * 粘贴命令发生后推进队列
     */
    void advanceOnPasteSignal();

    /**
     * 重置：清空队列和预览，回到普通模式，停止粘贴监听，恢复自动清空
     */
    void resetPasteQueue();

    /**
     * 外部复制发生（重置队列）
     */
    void onExternalCopy();

    /**
     * 用户手动选择了一条历史（重置队列）
     */
    void onManualSelection();

    /**
     * 移除已不在历史中的队列 / 预览 / 锚点
     */
    void syncWithHistory();

    // ========== 查询 ==========

    /**
     * 条目在已提交队列中的位置（从 1 开始）
     */
    std::optional<int> queueBadge(const ClipItem& item) const;

    /**
     * 提交当前预览后条目在队列中的位置（从 1 开始）
     *
     * 没有预览时与 queueBadge 相同。
     */
    std::optional<int> previewBadge(const ClipItem& item) const;

    std::vector<std::string> queuedIds() const;
    std::vector<std::string> previewItems() const;
    bool hasPendingPreview() const;
    std::optional<std::string> anchorId() const;

    /**
     * 显示顺序：队列中的条目在前，其余历史在后
     */
    std::vector<ClipItem> displayOrder() const;

    /**
     * 计算 Shift 选择范围
     *
     * 从锚点到当前位置（包含两端），锚点在前。
     *
     * @param baseline 显示顺序
     * @param anchorIndex 锚点下标
     * @param currentIndex 当前下标
     * @return 范围内的条目
     */
    static std::vector<ClipItem> makeShiftSelectionRange(const std::vector<ClipItem>& baseline,
                                                         size_t anchorIndex,
                                                         size_t currentIndex);

private:
    bool selectionAllowedLocked() const;
    std::vector<ClipItem> displayOrderLocked() const;
    std::vector<std::string> projectedQueueLocked() const;
    void toggleSingleLocked(const ClipItem& item);
    void commitPreviewLocked();

    /**
     * 队列内容变化后更新模式、监听和剪贴板
     *
     * @param previousHead 变化前的队首
     */
    void afterQueueChangedLocked(const std::optional<std::string>& previousHead);
    bool activateLocked();
    void deactivateLocked();
    void resetLocked();
    void recopyHeadLocked();
    void deferLocked(ActionHandler action);

    /**
     * 释放锁后执行登记的处理函数，并在模式变化时通知
     *
     * @param before 操作前的模式
     */
    void runDeferred(PasteMode before);

    HistoryStore& store_;
    IPasteCommandMonitor* pasteMonitor_;

    mutable std::mutex mutex_;
    std::vector<std::string> queue_;
    std::vector<std::string> preview_;
    std::optional<std::string> anchorId_;
    PasteMode mode_ = PasteMode::Clipboard;
    bool queueModeEnabled_ = false;
    bool repetitionEnabled_ = false;
    bool monitoring_ = false;

    ItemHandler recopyHandler_;
    ActionHandler clearClipboardHandler_;
    ActionHandler pauseAutoClear_;
    ActionHandler resumeAutoClear_;
    ModeChangedCallback modeChangedCallback_;
    std::vector<ActionHandler> deferred_;   // 等待释放锁后执行
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_PASTE_QUEUE_CONTROLLER_H
