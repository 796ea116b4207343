/**
 * ConfigManager - 配置管理器
 *
 * 负责读写 YAML 配置文件，提供配置访问接口，支持变更通知。
 * 由宿主程序创建并注入到需要配置的组件中。
 */

#ifndef CLIPHIST_CORE_CONFIG_MANAGER_H
#define CLIPHIST_CORE_CONFIG_MANAGER_H

#include <string>
#include <QObject>
#include <QString>

namespace cliphist {

/**
 * 剪贴板配置结构
 */
struct ClipboardConfig {
    bool enabled = true;            // 是否启用剪贴板监听
    int maxHistoryItems = 300;      // 最大历史条数（1-10000）
    int maxPinnedItems = 20;        // 最大置顶条数（1-1000）
    int dedupIndexSize = 50;        // 去重索引容量（1-1000）
    int minPollIntervalMs = 500;    // 最小轮询间隔（100-5000）
    int maxPollIntervalMs = 1000;   // 最大轮询间隔（不小于最小值）
    int saveDebounceMs = 500;       // 保存防抖（0-10000）
    int maxAgeDays = 0;             // 保留天数（0 表示不限制，否则 1-365）

    bool operator==(const ClipboardConfig& other) const;
    bool operator!=(const ClipboardConfig& other) const { return !(*this == other); }
};

/**
 * 持久化配置结构
 */
struct PersistenceConfig {
    std::string databaseFile = "clipboard.db";  // 相对路径基于配置目录
};

/**
 * 自动清空配置结构
 */
struct AutoClearConfig {
    bool enabled = false;       // 是否启用
    int intervalMinutes = 10;   // 清空间隔（1-1440 分钟）
};

/**
 * 应用配置结构（汇总所有配置）
 */
struct AppConfig {
    ClipboardConfig clipboard;
    PersistenceConfig persistence;
    AutoClearConfig autoClear;
};

/**
 * ConfigManager - 配置管理器类
 *
 * 职责：
 * 1. 读写 YAML 配置文件
 * 2. 提供类型安全的配置访问接口（写入时限制取值范围）
 * 3. 支持配置变更通知
 * 4. 配置持久化
 */
class ConfigManager : public QObject {
    Q_OBJECT

public:
    explicit ConfigManager(QObject* parent = nullptr);
    ~ConfigManager() override;

    // 禁止拷贝和移动
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * 初始化配置管理器
     *
     * 配置文件不存在或无法解析时写入默认配置。
     *
     * @param configDir 配置文件目录
     * @return 是否成功
     */
    bool initialize(const std::string& configDir);

    /**
     * 检查是否已初始化
     */
    bool isInitialized() const { return initialized_; }

    /**
     * 获取配置目录
     */
    std::string getConfigDir() const { return configDir_; }

    /**
     * 获取配置文件路径
     */
    std::string getConfigFilePath() const;

    /**
     * 获取数据库文件的完整路径
     *
     * 相对路径基于配置目录解析。
     */
    std::string getDatabasePath() const;

    // ========== 配置读取 ==========

    AppConfig getConfig() const;
    ClipboardConfig getClipboardConfig() const;
    PersistenceConfig getPersistenceConfig() const;
    AutoClearConfig getAutoClearConfig() const;

    // ========== 配置写入 ==========

    void setClipboardEnabled(bool enabled);
    void setMaxHistoryItems(int count);
    void setMaxPinnedItems(int count);
    void setDedupIndexSize(int size);

    /**
     * 设置轮询间隔范围
     *
     * 最小值限制在 [100, 5000]，最大值不小于最小值。
     */
    void setPollIntervals(int minMs, int maxMs);

    void setSaveDebounceMs(int ms);

    /**
     * 设置保留天数
     *
     * 0 表示不限制，其余值限制在 [1, 365]。
     */
    void setMaxAgeDays(int days);

    void setDatabaseFile(const std::string& file);
    void setAutoClearEnabled(bool enabled);
    void setAutoClearIntervalMinutes(int minutes);

    // ========== 通用配置访问 ==========

    /**
     * 获取字符串配置值
     *
     * @param key 配置键（支持点分隔的路径，如 "persistence.database_file"）
     * @param defaultValue 默认值
     * @return 配置值
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * 获取整数配置值
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * 获取布尔配置值
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    void setString(const std::string& key, const std::string& value);
    void setInt(const std::string& key, int value);
    void setBool(const std::string& key, bool value);

    // ========== 持久化 ==========

    /**
     * 保存配置到文件
     *
     * @return 是否成功
     */
    bool save();

    /**
     * 重新加载配置文件
     *
     * @return 是否成功
     */
    bool reload();

    /**
     * 重置为默认配置
     */
    void resetToDefaults();

signals:
    /**
     * 配置变更信号
     *
     * @param key 变更的配置键（"*" 表示全部）
     */
    void configChanged(const QString& key);

    /**
     * 剪贴板配置变更信号
     */
    void clipboardConfigChanged(const ClipboardConfig& config);

    /**
     * 自动清空配置变更信号
     */
    void autoClearConfigChanged(const AutoClearConfig& config);

    /**
     * 持久化配置变更信号
     */
    void persistenceConfigChanged(const PersistenceConfig& config);

private:
    bool loadConfig();
    bool saveConfig();
    void applyDefaults();
    void clampConfig();
    void notifyChange(const std::string& key);

    bool initialized_ = false;
    std::string configDir_;
    AppConfig config_;

    static constexpr const char* CONFIG_FILENAME = "config.yaml";
};

} // namespace cliphist

#endif // CLIPHIST_CORE_CONFIG_MANAGER_H
