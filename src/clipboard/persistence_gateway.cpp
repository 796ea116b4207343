#include "persistence_gateway.h"

#include <QDebug>

#include <algorithm>
#include <exception>

namespace cliphist {

PersistenceGateway::PersistenceGateway(IClipRepository& repository, int debounceMs)
    : repository_(repository)
    , debounceMs_(std::max(0, debounceMs))
{
    running_ = true;
    worker_ = std::thread(&PersistenceGateway::workerLoop, this);
}

PersistenceGateway::~PersistenceGateway() {
    shutdown();
}

// ========== 写入 ==========

void PersistenceGateway::scheduleSave(std::vector<ClipItem> snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!running_ || stopping_) {
        qWarning() << "PersistenceGateway: 已停止, 丢弃保存请求";
        return;
    }

    Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(debounceMs_);

    // 队尾的待保存快照直接替换
    if (!queue_.empty() && queue_.back().type == Operation::Type::Save) {
        Operation& pending = queue_.back();
        pending.snapshot = std::move(snapshot);
        pending.deadline = deadline;
        pending.attempts = 0;
        pending.sequence = ++submitted_;
        workAvailable_.notify_all();
        return;
    }

    Operation op;
    op.type = Operation::Type::Save;
    op.snapshot = std::move(snapshot);
    op.deadline = deadline;
    enqueueLocked(std::move(op));
}

void PersistenceGateway::remove(const ClipItem& item) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!running_ || stopping_) {
        qWarning() << "PersistenceGateway: 已停止, 丢弃删除请求";
        return;
    }

    Operation op;
    op.type = Operation::Type::Remove;
    op.item = item;
    enqueueLocked(std::move(op));
}

void PersistenceGateway::clear(bool keepPinned) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!running_ || stopping_) {
        qWarning() << "PersistenceGateway: 已停止, 丢弃清空请求";
        return;
    }

    Operation op;
    op.type = Operation::Type::Clear;
    op.keepPinned = keepPinned;
    enqueueLocked(std::move(op));
}

PersistenceResult PersistenceGateway::flushPendingSaves() {
    std::unique_lock<std::mutex> lock(mutex_);

    uint64_t target = submitted_;
    ++flushWaiters_;
    workAvailable_.notify_all();

    progress_.wait(lock, [this, target] {
        return completed_ >= target || !running_;
    });
    --flushWaiters_;

    PersistenceResult result;
    if (failuresSinceFlush_ > 0) {
        result.success = false;
        result.error = ClipboardErrorCode::PersistenceFailure;
        result.failedOperations = failuresSinceFlush_;
        result.errorMessage = lastErrorMessage_;
    }
    failuresSinceFlush_ = 0;
    lastErrorMessage_.clear();
    return result;
}

// ========== 读取 ==========

std::optional<std::vector<ClipItem>> PersistenceGateway::loadAll() {
    try {
        auto items = repository_.loadAll();
        if (!items) {
            qWarning() << "PersistenceGateway: PersistenceFailure, 加载失败:"
                       << QString::fromStdString(repository_.lastError());
        }
        return items;
    } catch (const std::exception& e) {
        qWarning() << "PersistenceGateway: PersistenceFailure, 加载失败:" << e.what();
        return std::nullopt;
    }
}

// ========== 生命周期 ==========

void PersistenceGateway::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ || stopping_) {
            return;
        }
        stopping_ = true;
    }
    workAvailable_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    progress_.notify_all();
    qDebug() << "PersistenceGateway: 已停止";
}

bool PersistenceGateway::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_ && !stopping_;
}

void PersistenceGateway::setDebounceMs(int debounceMs) {
    if (debounceMs < 0) {
        qWarning() << "PersistenceGateway: 无效的防抖时间" << debounceMs << ", 使用 0";
        debounceMs = 0;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    debounceMs_ = debounceMs;
}

int PersistenceGateway::debounceMs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return debounceMs_;
}

size_t PersistenceGateway::pendingOperations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

// ========== 私有方法 ==========

void PersistenceGateway::enqueueLocked(Operation op) {
    op.sequence = ++submitted_;
    queue_.push_back(std::move(op));
    workAvailable_.notify_all();
}

void PersistenceGateway::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        if (queue_.empty()) {
            if (stopping_) {
                break;
            }
            workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            continue;
        }

        // 队列中只剩一个保存时等待防抖截止；后面排着删除/清空时立即写入
        const Operation& head = queue_.front();
        bool urgent = stopping_ || flushWaiters_ > 0 || queue_.size() > 1;
        if (head.type == Operation::Type::Save && !urgent && Clock::now() < head.deadline) {
            workAvailable_.wait_until(lock, head.deadline);
            continue;
        }

        Operation op = std::move(queue_.front());
        queue_.pop_front();

        lock.unlock();
        std::string error;
        bool success = execute(op, error);
        lock.lock();

        if (!success) {
            ++failuresSinceFlush_;
            lastErrorMessage_ = error;
            qWarning() << "PersistenceGateway: PersistenceFailure:" << QString::fromStdString(error);

            // 没有更新的快照时在下一个防抖周期重试
            bool newerSave = std::any_of(queue_.begin(), queue_.end(), [](const Operation& pending) {
                return pending.type == Operation::Type::Save;
            });
            if (op.type == Operation::Type::Save && !newerSave && !stopping_
                && op.attempts + 1 < MAX_SAVE_RETRIES) {
                Operation retry = std::move(op);
                retry.attempts += 1;
                retry.deadline = Clock::now() + std::chrono::milliseconds(debounceMs_);
                uint64_t sequence = retry.sequence;
                enqueueLocked(std::move(retry));
                completed_ = std::max(completed_, sequence);
                progress_.notify_all();
                continue;
            }
        }

        completed_ = std::max(completed_, op.sequence);
        progress_.notify_all();
    }
}

bool PersistenceGateway::execute(const Operation& op, std::string& error) {
    bool success = false;
    try {
        switch (op.type) {
            case Operation::Type::Save:
                success = repository_.save(op.snapshot);
                break;
            case Operation::Type::Remove:
                success = repository_.remove(op.item);
                break;
            case Operation::Type::Clear:
                success = repository_.clear(op.keepPinned);
                break;
        }
        if (!success) {
            error = repository_.lastError();
        }
    } catch (const std::exception& e) {
        success = false;
        error = e.what();
    }
    return success;
}

} // namespace cliphist
