/**
 * QtClipboardResource - 基于 QClipboard 的系统剪贴板
 *
 * 实现 IClipboardResource，供 Linux 守护进程使用。
 *
 * 实现细节：
 * - QClipboard 只能在 GUI 线程访问。内容缓存在 dataChanged 时（GUI 线程）更新，
 *   其他线程读取缓存，写入和清空排队到 GUI 线程执行，从不阻塞调用方
 * - 变化计数在每次 dataChanged 时递增；本对象自己的写入在调用时同步递增一次，
 *   随后由这次写入触发的 dataChanged 不再重复计数
 */

#ifndef CLIPHIST_CLIPBOARD_PLATFORM_QT_CLIPBOARD_RESOURCE_H
#define CLIPHIST_CLIPBOARD_PLATFORM_QT_CLIPBOARD_RESOURCE_H

#include "../clipboard_resource.h"

#include <QClipboard>
#include <QObject>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace cliphist {

class QtClipboardResource : public QObject, public IClipboardResource {
    Q_OBJECT

public:
    /**
     * 构造函数
     *
     * 必须在 GUI 线程上创建。
     *
     * @param mode 剪贴板模式（Clipboard 或 Selection）
     * @param parent Qt 父对象
     */
    explicit QtClipboardResource(QClipboard::Mode mode = QClipboard::Clipboard,
                                 QObject* parent = nullptr);
    ~QtClipboardResource() override;

    // ========== IClipboardResource 接口实现 ==========

    std::optional<std::string> readText() override;
    bool writeText(const std::string& text) override;
    int64_t changeCount() override;
    void clear() override;

private slots:
    void onDataChanged();

private:
    std::optional<std::string> readFromClipboard() const;
    void applyOnGuiThread(const std::optional<std::string>& text);

    QClipboard* clipboard_;
    QClipboard::Mode mode_;

    std::mutex mutex_;
    std::optional<std::string> cachedText_;
    int64_t changeCount_ = 0;

    // 本对象发起、尚未收到 dataChanged 的写入
    bool selfWritePending_ = false;
    std::optional<std::string> selfWriteText_;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_PLATFORM_QT_CLIPBOARD_RESOURCE_H
