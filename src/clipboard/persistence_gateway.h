/**
 * PersistenceGateway - 持久化网关
 *
 * 在后台线程上把历史变更写入 IClipRepository：
 * - 保存快照带防抖：一段时间内的多次变更合并为一次写入
 * - 删除和清空按提交顺序执行，排在它们前面的保存会先写入
 * - 写入失败记录日志，并在下一个防抖周期重试（新快照会取代失败的快照）
 *
 * 内存中的历史从不受持久化结果影响。停止监听不会停止网关，
 * shutdown() 先写完所有待处理操作再退出线程。
 */

#ifndef CLIPHIST_CLIPBOARD_PERSISTENCE_GATEWAY_H
#define CLIPHIST_CLIPBOARD_PERSISTENCE_GATEWAY_H

#include "clip_item.h"
#include "clip_repository.h"
#include "clipboard_errors.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace cliphist {

class PersistenceGateway {
public:
    static constexpr int DEFAULT_SAVE_DEBOUNCE_MS = 500;
    static constexpr int MAX_SAVE_RETRIES = 3;

    /**
     * 构造函数
     *
     * 立即启动后台线程。
     *
     * @param repository 存储库（生命周期需长于网关）
     * @param debounceMs 保存防抖时间（毫秒）
     */
    explicit PersistenceGateway(IClipRepository& repository,
                                int debounceMs = DEFAULT_SAVE_DEBOUNCE_MS);

    ~PersistenceGateway();

    PersistenceGateway(const PersistenceGateway&) = delete;
    PersistenceGateway& operator=(const PersistenceGateway&) = delete;

    // ========== 写入 ==========

    /**
     * 安排保存快照
     *
     * 若队尾已有待保存快照则直接替换并重新计时。
     *
     * @param snapshot 当前完整历史
     */
    void scheduleSave(std::vector<ClipItem> snapshot);

    /**
     * 删除条目（按提交顺序执行）
     */
    void remove(const ClipItem& item);

    /**
     * 清空存储（按提交顺序执行）
     */
    void clear(bool keepPinned);

    /**
     * 等待所有已提交的操作完成
     *
     * 待处理的保存不再等待防抖，立即写入。
     *
     * @return 自上次 flush 以来的失败汇总
     */
    PersistenceResult flushPendingSaves();

    // ========== 读取 ==========

    /**
     * 加载全部条目（启动时调用）
     *
     * @return 条目列表，失败返回 std::nullopt
     */
    std::optional<std::vector<ClipItem>> loadAll();

    // ========== 生命周期 ==========

    /**
     * 写完所有待处理操作并停止后台线程
     *
     * 幂等。之后提交的操作会被丢弃。
     */
    void shutdown();

    bool isRunning() const;

    void setDebounceMs(int debounceMs);
    int debounceMs() const;

    /**
     * 队列中尚未执行的操作数
     */
    size_t pendingOperations() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Operation {
        enum class Type { Save, Remove, Clear };

        Type type = Type::Save;
        std::vector<ClipItem> snapshot;   // Save
        ClipItem item;                    // Remove
        bool keepPinned = false;          // Clear
        Clock::time_point deadline;       // Save 的防抖截止时间
        uint64_t sequence = 0;
        int attempts = 0;
    };

    void workerLoop();
    bool execute(const Operation& op, std::string& error);
    void enqueueLocked(Operation op);

    IClipRepository& repository_;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable progress_;
    std::deque<Operation> queue_;
    std::thread worker_;

    int debounceMs_;
    bool running_ = false;
    bool stopping_ = false;
    int flushWaiters_ = 0;

    uint64_t submitted_ = 0;    // 最近一次提交的序号
    uint64_t completed_ = 0;    // 最近一次完成（成功或失败）的序号
    int failuresSinceFlush_ = 0;
    std::string lastErrorMessage_;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_PERSISTENCE_GATEWAY_H
