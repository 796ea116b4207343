#include "server_app.h"
#include "../clipboard/clipboard_manager.h"
#include "../clipboard/sqlite_clip_repository.h"
#include "../clipboard/platform/qt_clipboard_resource.h"
#include "../core/config_manager.h"
#include <QClipboard>
#include <QDir>
#include <QStandardPaths>
#include <QDebug>

namespace cliphist {

ServerApp::ServerApp(QObject* parent)
    : QObject(parent) {
}

ServerApp::~ServerApp() {
    shutdown();
}

bool ServerApp::initialize(const QString& dataDir) {
    QString userDataDir = dataDir.isEmpty()
        ? QStandardPaths::writableLocation(QStandardPaths::AppDataLocation)
        : dataDir;
    if (!QDir().mkpath(userDataDir)) {
        qWarning() << "ServerApp: 无法创建数据目录" << userDataDir;
        return false;
    }

    m_configManager = std::make_unique<ConfigManager>();
    if (!m_configManager->initialize(userDataDir.toStdString())) {
        qWarning() << "ServerApp: 配置初始化失败";
        return false;
    }

    auto repository = std::make_unique<SqliteClipRepository>();
    if (!repository->initialize(m_configManager->getDatabasePath())) {
        qWarning() << "ServerApp: 打开数据库失败"
                   << QString::fromStdString(repository->lastError());
        return false;
    }

    auto resource = std::make_unique<QtClipboardResource>(QClipboard::Clipboard);

    // 没有可用的粘贴命令监听器，粘贴队列在此平台上不可用
    m_clipboardManager = std::make_unique<ClipboardManager>(
        std::move(resource), std::move(repository), nullptr, nullptr);

    connect(m_clipboardManager.get(), &ClipboardManager::historyChanged,
            this, &ServerApp::onHistoryChanged, Qt::QueuedConnection);
    connect(m_clipboardManager.get(), &ClipboardManager::pasteModeChanged,
            this, &ServerApp::onPasteModeChanged, Qt::QueuedConnection);
    connect(m_clipboardManager.get(), &ClipboardManager::errorOccurred,
            this, &ServerApp::onErrorOccurred, Qt::QueuedConnection);

    connect(m_configManager.get(), &ConfigManager::clipboardConfigChanged,
            m_clipboardManager.get(), &ClipboardManager::applyConfig);
    connect(m_configManager.get(), &ConfigManager::autoClearConfigChanged,
            m_clipboardManager.get(), &ClipboardManager::applyAutoClearConfig);

    if (!m_clipboardManager->initialize(m_configManager->getClipboardConfig(),
                                        m_configManager->getAutoClearConfig())) {
        return false;
    }
    m_clipboardManager->startMonitoring();

    connect(&m_cleanupTimer, &QTimer::timeout, this, &ServerApp::onCleanupTimeout);
    m_cleanupTimer.start(CLEANUP_INTERVAL_MS);

    qDebug() << "ServerApp: 已启动，数据目录" << userDataDir;
    return true;
}

void ServerApp::shutdown() {
    m_cleanupTimer.stop();
    if (m_clipboardManager) {
        m_clipboardManager->shutdown();
    }
    m_clipboardManager.reset();
    m_configManager.reset();
}

void ServerApp::onHistoryChanged() {
    if (m_clipboardManager) {
        qDebug() << "ServerApp: 历史条数" << m_clipboardManager->itemCount();
    }
}

void ServerApp::onPasteModeChanged(PasteMode mode) {
    qDebug() << "ServerApp: 粘贴模式" << QString::fromStdString(pasteModeToString(mode));
}

void ServerApp::onErrorOccurred(ClipboardErrorCode code, const QString& message) {
    qWarning() << "ServerApp:" << errorCodeName(code) << message;
}

void ServerApp::onCleanupTimeout() {
    if (m_clipboardManager) {
        m_clipboardManager->performCleanup();
    }
}

} // namespace cliphist
