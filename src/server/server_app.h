#pragma once

#include <QObject>
#include <QString>
#include <QTimer>
#include <memory>

#include "../clipboard/clipboard_errors.h"
#include "../clipboard/paste_queue_controller.h"

namespace cliphist {

class ConfigManager;
class ClipboardManager;

/**
 * ServerApp - cliphistd 守护进程
 *
 * 加载配置，打开历史数据库，监听系统剪贴板。
 */
class ServerApp : public QObject {
    Q_OBJECT
public:
    explicit ServerApp(QObject* parent = nullptr);
    ~ServerApp() override;

    /**
     * 初始化
     *
     * @param dataDir 数据目录；为空时使用 QStandardPaths::AppDataLocation
     * @return 是否成功
     */
    bool initialize(const QString& dataDir = QString());
    void shutdown();

    ClipboardManager* clipboardManager() const { return m_clipboardManager.get(); }

private slots:
    void onHistoryChanged();
    void onPasteModeChanged(cliphist::PasteMode mode);
    void onErrorOccurred(cliphist::ClipboardErrorCode code, const QString& message);
    void onCleanupTimeout();

private:
    std::unique_ptr<ConfigManager> m_configManager;
    std::unique_ptr<ClipboardManager> m_clipboardManager;
    QTimer m_cleanupTimer;

    static constexpr int CLEANUP_INTERVAL_MS = 60 * 60 * 1000;
};

} // namespace cliphist
