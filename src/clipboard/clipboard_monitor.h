/**
 * ClipboardMonitor - 剪贴板监听器
 *
 * 通过轮询 IClipboardResource 的变化计数检测剪贴板变化，
 * 并作为系统剪贴板的唯一写入者。
 *
 * 实现细节：
 * - 独立轮询线程，自适应间隔：无变化时按 1.1 倍逐步放慢（上限 maxInterval），
 *   检测到变化时恢复为 minInterval
 * - 内部复制 / 编辑器复制两个标志由下一次轮询消费且只消费一次
 * - 持有剪贴板访问锁：轮询与内部写入互斥，本进程的写入不会被误认为外部变化
 * - 应用信息解析器抛出的异常降级为空元数据，监听器本身从不抛出异常
 */

#ifndef CLIPHIST_CLIPBOARD_CLIPBOARD_MONITOR_H
#define CLIPHIST_CLIPBOARD_CLIPBOARD_MONITOR_H

#include "clipboard_resource.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace cliphist {

/**
 * 一次外部剪贴板变化的捕获结果
 */
struct CapturedClip {
    std::string text;           // 文本内容（非空白）
    AppInfo appInfo;            // 来源应用信息
    bool isFromEditor = false;  // 是否来自内置编辑器
};

/**
 * 捕获回调类型
 *
 * 在轮询线程上调用，调用时不持有任何监听器内部锁。
 */
using CaptureCallback = std::function<void(const CapturedClip&)>;

class ClipboardMonitor {
public:
    static constexpr int DEFAULT_MIN_POLL_INTERVAL_MS = 500;
    static constexpr int DEFAULT_MAX_POLL_INTERVAL_MS = 1000;
    static constexpr double DAMPING_FACTOR = 1.1;

    /**
     * 构造函数
     *
     * @param resource 系统剪贴板（生命周期需长于监听器）
     * @param resolver 应用信息解析器，可为空
     */
    explicit ClipboardMonitor(IClipboardResource& resource,
                              IAppInfoResolver* resolver = nullptr);

    /**
     * 析构函数
     *
     * 停止轮询线程。
     */
    ~ClipboardMonitor();

    ClipboardMonitor(const ClipboardMonitor&) = delete;
    ClipboardMonitor& operator=(const ClipboardMonitor&) = delete;

    // ========== 生命周期 ==========

    /**
     * 启动监听
     *
     * 幂等：已在运行时直接返回。启动时以当前变化计数为基准，
     * 启动前已有的剪贴板内容不会被捕获。
     */
    void start();

    /**
     * 停止监听
     *
     * 幂等。正在进行的轮询会完成，但不会再安排下一次轮询。
     * 可以在捕获回调中调用：轮询线程随后自行退出，
     * 并由下一次 start() 或析构函数 join。
     */
    void stop();

    bool isRunning() const;

    void setCaptureCallback(CaptureCallback callback);

    /**
     * 执行一次轮询
     *
     * @return 是否投递了一次捕获
     */
    bool pollOnce();

    // ========== 剪贴板写入（唯一入口） ==========

    /**
     * 以内部复制的方式写入剪贴板
     *
     * 标志设置与写入在同一把访问锁内完成，下一次轮询会跳过这次变化。
     *
     * @param text 文本内容
     * @param fromEditor 是否来自内置编辑器
     * @return 是否写入成功
     */
    bool writeInternal(const std::string& text, bool fromEditor = false);

    /**
     * 清空剪贴板（标记为内部操作）
     */
    void clearClipboard();

    /**
     * 剪贴板当前为文本时清空
     *
     * @return 是否执行了清空
     */
    bool clearIfText();

    // ========== 抑制标志 ==========

    void markInternalCopy(bool fromEditor = false);
    void setInternalCopy(bool value);
    void setFromEditor(bool value);

    // ========== 轮询间隔 ==========

    int currentInterval() const;
    int minInterval() const;
    int maxInterval() const;

    /**
     * 设置轮询间隔范围
     *
     * 最小值限制在 [100, 5000] 毫秒，最大值不小于最小值。
     * 当前间隔会被重置为最小值。
     */
    void setPollIntervalBounds(int minMs, int maxMs);

private:
    void runLoop(uint64_t generation);
    void joinRetiredWorkers();
    AppInfo resolveAppInfo();

    IClipboardResource& resource_;
    IAppInfoResolver* resolver_;

    // 剪贴板访问锁：轮询读取与内部写入互斥
    std::mutex accessMutex_;
    int64_t lastChangeCount_ = 0;
    bool internalCopy_ = false;
    bool fromEditor_ = false;

    // 生命周期状态
    mutable std::mutex stateMutex_;
    std::condition_variable wakeup_;
    std::thread worker_;
    std::vector<std::thread> retiredWorkers_;   // 在捕获回调中停止的线程
    uint64_t generation_ = 0;
    bool running_ = false;
    CaptureCallback callback_;

    std::atomic<int> minIntervalMs_{DEFAULT_MIN_POLL_INTERVAL_MS};
    std::atomic<int> maxIntervalMs_{DEFAULT_MAX_POLL_INTERVAL_MS};
    std::atomic<int> currentIntervalMs_{DEFAULT_MIN_POLL_INTERVAL_MS};

    static constexpr int MIN_POLL_INTERVAL_MS = 100;
    static constexpr int MAX_POLL_INTERVAL_MS = 5000;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_CLIPBOARD_MONITOR_H
