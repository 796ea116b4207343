#include "qt_clipboard_resource.h"

#include <QDebug>
#include <QGuiApplication>
#include <QMimeData>
#include <QThread>

namespace cliphist {

QtClipboardResource::QtClipboardResource(QClipboard::Mode mode, QObject* parent)
    : QObject(parent)
    , clipboard_(QGuiApplication::clipboard())
    , mode_(mode)
{
    if (!clipboard_) {
        qWarning() << "QtClipboardResource: 无法获取系统剪贴板";
        return;
    }

    if (mode_ == QClipboard::Selection && !clipboard_->supportsSelection()) {
        qWarning() << "QtClipboardResource: 当前平台不支持 Selection 剪贴板, 使用 Clipboard";
        mode_ = QClipboard::Clipboard;
    }

    cachedText_ = readFromClipboard();

    if (mode_ == QClipboard::Selection) {
        connect(clipboard_, &QClipboard::selectionChanged,
                this, &QtClipboardResource::onDataChanged);
    } else {
        connect(clipboard_, &QClipboard::dataChanged,
                this, &QtClipboardResource::onDataChanged);
    }
}

QtClipboardResource::~QtClipboardResource() = default;

// ========== IClipboardResource 接口实现 ==========

std::optional<std::string> QtClipboardResource::readText() {
    std::lock_guard<std::mutex> lock(mutex_);
    return cachedText_;
}

bool QtClipboardResource::writeText(const std::string& text) {
    if (!clipboard_) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cachedText_ = text;
        selfWritePending_ = true;
        selfWriteText_ = text;
        ++changeCount_;
    }

    applyOnGuiThread(text);
    return true;
}

int64_t QtClipboardResource::changeCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return changeCount_;
}

void QtClipboardResource::clear() {
    if (!clipboard_) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cachedText_.reset();
        selfWritePending_ = true;
        selfWriteText_.reset();
        ++changeCount_;
    }

    applyOnGuiThread(std::nullopt);
}

// ========== 私有方法 ==========

void QtClipboardResource::onDataChanged() {
    std::optional<std::string> current = readFromClipboard();

    std::lock_guard<std::mutex> lock(mutex_);
    cachedText_ = current;

    if (selfWritePending_ && selfWriteText_ == current) {
        // 自己的写入已经计数过
        selfWritePending_ = false;
        selfWriteText_.reset();
        return;
    }

    ++changeCount_;
}

std::optional<std::string> QtClipboardResource::readFromClipboard() const {
    if (!clipboard_) {
        return std::nullopt;
    }

    const QMimeData* mimeData = clipboard_->mimeData(mode_);
    if (!mimeData || !mimeData->hasText()) {
        return std::nullopt;
    }

    QString text = mimeData->text();
    if (text.isEmpty()) {
        return std::nullopt;
    }
    return text.toStdString();
}

void QtClipboardResource::applyOnGuiThread(const std::optional<std::string>& text) {
    auto apply = [this, text]() {
        if (text) {
            clipboard_->setText(QString::fromStdString(*text), mode_);
        } else {
            clipboard_->clear(mode_);
        }
    };

    if (QThread::currentThread() == thread()) {
        apply();
    } else {
        QMetaObject::invokeMethod(this, apply, Qt::QueuedConnection);
    }
}

} // namespace cliphist
