#include "auto_clear_controller.h"
#include "clipboard_monitor.h"

#include <QDebug>
#include <QThread>

#include <algorithm>

namespace cliphist {

AutoClearController::AutoClearController(ClipboardMonitor& monitor, QObject* parent)
    : QObject(parent)
    , monitor_(monitor)
{
    timer_.setSingleShot(true);
    connect(&timer_, &QTimer::timeout, this, &AutoClearController::onTimeout);
}

AutoClearController::~AutoClearController() {
    timer_.stop();
}

void AutoClearController::setEnabled(bool enabled) {
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, enabled]() { setEnabled(enabled); },
                                  Qt::QueuedConnection);
        return;
    }

    if (enabled_ == enabled) {
        return;
    }
    enabled_ = enabled;
    qDebug() << "AutoClearController: 自动清空" << (enabled ? "启用" : "禁用");
    restartTimer();
}

void AutoClearController::setIntervalMinutes(int minutes) {
    int clamped = std::max(MIN_INTERVAL_MINUTES, std::min(minutes, MAX_INTERVAL_MINUTES));
    if (clamped != minutes) {
        qWarning() << "AutoClearController: 无效的清空间隔" << minutes << "分钟, 使用" << clamped;
    }
    setIntervalMs(clamped * 60 * 1000);
}

int AutoClearController::intervalMinutes() const {
    return intervalMs_ / (60 * 1000);
}

void AutoClearController::setIntervalMs(int intervalMs) {
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this, intervalMs]() { setIntervalMs(intervalMs); },
                                  Qt::QueuedConnection);
        return;
    }

    intervalMs_ = std::max(1, intervalMs);
    if (timer_.isActive()) {
        restartTimer();
    }
}

void AutoClearController::pause() {
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this]() { pause(); }, Qt::QueuedConnection);
        return;
    }

    paused_ = true;
    timer_.stop();
}

void AutoClearController::resume() {
    if (!onOwnerThread()) {
        QMetaObject::invokeMethod(this, [this]() { resume(); }, Qt::QueuedConnection);
        return;
    }

    if (!paused_) {
        return;
    }
    paused_ = false;
    restartTimer();
}

int AutoClearController::remainingMs() const {
    if (!timer_.isActive()) {
        return -1;
    }
    return timer_.remainingTime();
}

bool AutoClearController::performAutoClear() {
    if (!monitor_.clearIfText()) {
        qDebug() << "AutoClearController: 剪贴板不是文本, 跳过清空";
        return false;
    }

    qDebug() << "AutoClearController: 已清空剪贴板";
    emit clipboardCleared();
    return true;
}

void AutoClearController::onTimeout() {
    performAutoClear();
    restartTimer();
}

void AutoClearController::restartTimer() {
    timer_.stop();
    if (enabled_ && !paused_) {
        timer_.start(intervalMs_);
    }
}

bool AutoClearController::onOwnerThread() const {
    return QThread::currentThread() == thread();
}

} // namespace cliphist
