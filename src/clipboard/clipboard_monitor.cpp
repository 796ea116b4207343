#include "clipboard_monitor.h"
#include "clip_item.h"

#include <QDebug>

#include <algorithm>
#include <chrono>
#include <exception>

namespace cliphist {

ClipboardMonitor::ClipboardMonitor(IClipboardResource& resource, IAppInfoResolver* resolver)
    : resource_(resource)
    , resolver_(resolver)
{
    try {
        lastChangeCount_ = resource_.changeCount();
    } catch (const std::exception& e) {
        qWarning() << "ClipboardMonitor: 读取变化计数失败:" << e.what();
    }
}

ClipboardMonitor::~ClipboardMonitor() {
    stop();
    joinRetiredWorkers();

    std::lock_guard<std::mutex> lock(stateMutex_);
    for (auto& worker : retiredWorkers_) {
        // 只剩当前线程：在自身的捕获回调中被销毁，无法等待自己
        qWarning() << "ClipboardMonitor: 在捕获回调中销毁监听器";
        worker.detach();
    }
}

// ========== 生命周期 ==========

void ClipboardMonitor::start() {
    joinRetiredWorkers();

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (running_) {
        return;
    }

    {
        std::lock_guard<std::mutex> accessLock(accessMutex_);
        try {
            lastChangeCount_ = resource_.changeCount();
        } catch (const std::exception& e) {
            qWarning() << "ClipboardMonitor: 读取变化计数失败:" << e.what();
        }
        internalCopy_ = false;
        fromEditor_ = false;
    }

    // 上一个线程已在 stop() 中被 join，或在 retiredWorkers_ 中等待回收
    running_ = true;
    uint64_t generation = ++generation_;
    currentIntervalMs_ = minIntervalMs_.load();
    worker_ = std::thread(&ClipboardMonitor::runLoop, this, generation);

    qDebug() << "ClipboardMonitor: 开始监听, 间隔" << currentIntervalMs_.load() << "ms";
}

void ClipboardMonitor::stop() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        ++generation_;
        worker = std::move(worker_);
    }
    wakeup_.notify_all();

    if (worker.joinable()) {
        if (worker.get_id() == std::this_thread::get_id()) {
            // 在捕获回调中停止：当前轮询结束后线程自行退出，由 start() 或析构函数回收
            std::lock_guard<std::mutex> lock(stateMutex_);
            retiredWorkers_.push_back(std::move(worker));
        } else {
            worker.join();
        }
    }

    qDebug() << "ClipboardMonitor: 停止监听";
}

bool ClipboardMonitor::isRunning() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return running_;
}

void ClipboardMonitor::setCaptureCallback(CaptureCallback callback) {
    std::lock_guard<std::mutex> lock(stateMutex_);
    callback_ = std::move(callback);
}

bool ClipboardMonitor::pollOnce() {
    std::optional<std::string> text;
    bool fromEditor = false;

    {
        std::lock_guard<std::mutex> lock(accessMutex_);

        bool internal = internalCopy_;
        fromEditor = fromEditor_;
        internalCopy_ = false;
        fromEditor_ = false;

        int64_t count = 0;
        try {
            count = resource_.changeCount();
        } catch (const std::exception& e) {
            qWarning() << "ClipboardMonitor: 读取变化计数失败:" << e.what();
            return false;
        }

        if (count == lastChangeCount_) {
            int next = static_cast<int>(currentIntervalMs_.load() * DAMPING_FACTOR);
            currentIntervalMs_ = std::min(next, maxIntervalMs_.load());
            return false;
        }

        currentIntervalMs_ = minIntervalMs_.load();

        if (internal) {
            lastChangeCount_ = count;
            return false;
        }

        try {
            text = resource_.readText();
        } catch (const std::exception& e) {
            // 不更新基准计数，下一次轮询重新读取
            qWarning() << "ClipboardMonitor: 读取剪贴板失败:" << e.what();
            return false;
        }
        lastChangeCount_ = count;
    }

    if (!text || isBlankText(*text)) {
        qDebug() << "ClipboardMonitor: MalformedClipboardPayload, 忽略非文本或空白内容";
        return false;
    }

    CapturedClip clip;
    clip.text = std::move(*text);
    clip.appInfo = resolveAppInfo();
    clip.isFromEditor = fromEditor;

    CaptureCallback callback;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        callback = callback_;
    }
    if (callback) {
        callback(clip);
    }
    return true;
}

// ========== 剪贴板写入 ==========

bool ClipboardMonitor::writeInternal(const std::string& text, bool fromEditor) {
    std::lock_guard<std::mutex> lock(accessMutex_);

    internalCopy_ = true;
    fromEditor_ = fromEditor;

    bool success = false;
    try {
        success = resource_.writeText(text);
    } catch (const std::exception& e) {
        qWarning() << "ClipboardMonitor: 写入剪贴板失败:" << e.what();
    }

    if (!success) {
        internalCopy_ = false;
        fromEditor_ = false;
        qWarning() << "ClipboardMonitor: 写入剪贴板失败";
    }
    return success;
}

void ClipboardMonitor::clearClipboard() {
    std::lock_guard<std::mutex> lock(accessMutex_);
    internalCopy_ = true;
    try {
        resource_.clear();
    } catch (const std::exception& e) {
        internalCopy_ = false;
        qWarning() << "ClipboardMonitor: 清空剪贴板失败:" << e.what();
    }
}

bool ClipboardMonitor::clearIfText() {
    std::lock_guard<std::mutex> lock(accessMutex_);
    try {
        if (!resource_.readText()) {
            return false;
        }
        internalCopy_ = true;
        resource_.clear();
        return true;
    } catch (const std::exception& e) {
        internalCopy_ = false;
        qWarning() << "ClipboardMonitor: 清空剪贴板失败:" << e.what();
        return false;
    }
}

// ========== 抑制标志 ==========

void ClipboardMonitor::markInternalCopy(bool fromEditor) {
    std::lock_guard<std::mutex> lock(accessMutex_);
    internalCopy_ = true;
    fromEditor_ = fromEditor;
}

void ClipboardMonitor::setInternalCopy(bool value) {
    std::lock_guard<std::mutex> lock(accessMutex_);
    internalCopy_ = value;
}

void ClipboardMonitor::setFromEditor(bool value) {
    std::lock_guard<std::mutex> lock(accessMutex_);
    fromEditor_ = value;
}

// ========== 轮询间隔 ==========

int ClipboardMonitor::currentInterval() const {
    return currentIntervalMs_.load();
}

int ClipboardMonitor::minInterval() const {
    return minIntervalMs_.load();
}

int ClipboardMonitor::maxInterval() const {
    return maxIntervalMs_.load();
}

void ClipboardMonitor::setPollIntervalBounds(int minMs, int maxMs) {
    int clampedMin = std::max(MIN_POLL_INTERVAL_MS, std::min(minMs, MAX_POLL_INTERVAL_MS));
    int clampedMax = std::max(clampedMin, maxMs);
    if (clampedMin != minMs || clampedMax != maxMs) {
        qWarning() << "ClipboardMonitor: 轮询间隔" << minMs << "-" << maxMs
                   << "无效, 使用" << clampedMin << "-" << clampedMax;
    }

    minIntervalMs_ = clampedMin;
    maxIntervalMs_ = clampedMax;
    currentIntervalMs_ = clampedMin;
}

// ========== 私有方法 ==========

void ClipboardMonitor::runLoop(uint64_t generation) {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(stateMutex_);
            wakeup_.wait_for(lock, std::chrono::milliseconds(currentIntervalMs_.load()),
                             [this, generation] { return generation_ != generation; });
            if (generation_ != generation) {
                return;
            }
        }
        pollOnce();
    }
}

void ClipboardMonitor::joinRetiredWorkers() {
    std::vector<std::thread> retired;
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        auto it = retiredWorkers_.begin();
        while (it != retiredWorkers_.end()) {
            if (it->get_id() == std::this_thread::get_id()) {
                ++it;
                continue;
            }
            retired.push_back(std::move(*it));
            it = retiredWorkers_.erase(it);
        }
    }
    for (auto& worker : retired) {
        worker.join();
    }
}

AppInfo ClipboardMonitor::resolveAppInfo() {
    if (!resolver_) {
        return AppInfo();
    }
    try {
        return resolver_->resolve();
    } catch (const std::exception& e) {
        qWarning() << "ClipboardMonitor: 解析来源应用失败:" << e.what();
        return AppInfo();
    }
}

} // namespace cliphist
