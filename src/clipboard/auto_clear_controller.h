/**
 * AutoClearController - 剪贴板自动清空
 *
 * 定时清空系统剪贴板中的文本内容（非文本内容不受影响），从不修改历史记录。
 * 每次到期后在启用状态下重新计时。粘贴队列活动期间暂停。
 *
 * 定时器只在所属线程上操作，其他线程的调用通过 QMetaObject::invokeMethod 排队执行。
 */

#ifndef CLIPHIST_CLIPBOARD_AUTO_CLEAR_CONTROLLER_H
#define CLIPHIST_CLIPBOARD_AUTO_CLEAR_CONTROLLER_H

#include <QObject>
#include <QTimer>

namespace cliphist {

class ClipboardMonitor;

class AutoClearController : public QObject {
    Q_OBJECT

public:
    static constexpr int DEFAULT_INTERVAL_MINUTES = 10;
    static constexpr int MIN_INTERVAL_MINUTES = 1;
    static constexpr int MAX_INTERVAL_MINUTES = 1440;

    /**
     * 构造函数
     *
     * @param monitor 剪贴板监听器（清空操作通过它执行）
     * @param parent Qt 父对象
     */
    explicit AutoClearController(ClipboardMonitor& monitor, QObject* parent = nullptr);
    ~AutoClearController() override;

    /**
     * 启用 / 禁用
     *
     * 启用时开始计时，禁用时停止计时。
     */
    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    /**
     * 设置清空间隔（分钟）
     *
     * 限制在 [1, 1440]，正在计时时重新开始计时。
     */
    void setIntervalMinutes(int minutes);
    int intervalMinutes() const;

    /**
     * 设置清空间隔（毫秒）
     */
    void setIntervalMs(int intervalMs);
    int intervalMs() const { return intervalMs_; }

    /**
     * 暂停计时（粘贴队列活动期间）
     */
    void pause();

    /**
     * 恢复计时
     */
    void resume();

    bool isPaused() const { return paused_; }

    /**
     * 距离下次清空的剩余时间
     *
     * @return 剩余毫秒数，未在计时时返回 -1
     */
    int remainingMs() const;

    /**
     * 立即执行一次清空
     *
     * @return 剪贴板为文本并已清空时返回 true
     */
    bool performAutoClear();

signals:
    /**
     * 剪贴板已被自动清空
     */
    void clipboardCleared();

private slots:
    void onTimeout();

private:
    void restartTimer();
    bool onOwnerThread() const;

    ClipboardMonitor& monitor_;
    QTimer timer_;
    bool enabled_ = false;
    bool paused_ = false;
    int intervalMs_ = DEFAULT_INTERVAL_MINUTES * 60 * 1000;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_AUTO_CLEAR_CONTROLLER_H
