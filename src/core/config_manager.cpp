/**
 * ConfigManager 实现
 */

#include "config_manager.h"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <fstream>
#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace cliphist {

namespace {

// 取值范围
constexpr int MAX_HISTORY_ITEMS_MIN = 1;
constexpr int MAX_HISTORY_ITEMS_MAX = 10000;
constexpr int MAX_PINNED_ITEMS_MIN = 1;
constexpr int MAX_PINNED_ITEMS_MAX = 1000;
constexpr int DEDUP_INDEX_SIZE_MIN = 1;
constexpr int DEDUP_INDEX_SIZE_MAX = 1000;
constexpr int POLL_INTERVAL_MIN = 100;
constexpr int POLL_INTERVAL_MAX = 5000;
constexpr int SAVE_DEBOUNCE_MIN = 0;
constexpr int SAVE_DEBOUNCE_MAX = 10000;
constexpr int MAX_AGE_DAYS_MAX = 365;
constexpr int AUTO_CLEAR_MINUTES_MIN = 1;
constexpr int AUTO_CLEAR_MINUTES_MAX = 1440;

int clampValue(int value, int low, int high, const char* key) {
    int clamped = std::max(low, std::min(value, high));
    if (clamped != value) {
        std::cerr << "ConfigManager: " << key << " = " << value
                  << " 超出范围 [" << low << ", " << high << "], 使用 " << clamped << std::endl;
    }
    return clamped;
}

int clampMaxAgeDays(int days) {
    if (days <= 0) {
        return 0;  // 不限制
    }
    return clampValue(days, 1, MAX_AGE_DAYS_MAX, "clipboard.max_age_days");
}

} // namespace

bool ClipboardConfig::operator==(const ClipboardConfig& other) const {
    return enabled == other.enabled &&
           maxHistoryItems == other.maxHistoryItems &&
           maxPinnedItems == other.maxPinnedItems &&
           dedupIndexSize == other.dedupIndexSize &&
           minPollIntervalMs == other.minPollIntervalMs &&
           maxPollIntervalMs == other.maxPollIntervalMs &&
           saveDebounceMs == other.saveDebounceMs &&
           maxAgeDays == other.maxAgeDays;
}

// ========== ConfigManager 实现 ==========

ConfigManager::ConfigManager(QObject* parent) : QObject(parent) {
    applyDefaults();
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::initialize(const std::string& configDir) {
    if (initialized_) {
        return true;  // 已初始化，幂等
    }

    configDir_ = configDir;

    // 确保配置目录存在
    try {
        fs::create_directories(configDir_);
    } catch (const std::exception& e) {
        std::cerr << "ConfigManager: 创建配置目录失败: " << e.what() << std::endl;
        return false;
    }

    // 加载配置文件
    if (!loadConfig()) {
        // 配置文件不存在或加载失败，使用默认配置并保存
        applyDefaults();
        saveConfig();
    }

    initialized_ = true;
    return true;
}

std::string ConfigManager::getConfigFilePath() const {
    return configDir_ + "/" + CONFIG_FILENAME;
}

std::string ConfigManager::getDatabasePath() const {
    fs::path file(config_.persistence.databaseFile);
    if (file.is_absolute()) {
        return file.string();
    }
    return (fs::path(configDir_) / file).string();
}

bool ConfigManager::loadConfig() {
    std::string configPath = getConfigFilePath();

    if (!fs::exists(configPath)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(configPath);
        AppConfig loaded;

        // 读取剪贴板配置
        if (root["clipboard"]) {
            auto clipboard = root["clipboard"];
            if (clipboard["enabled"]) {
                loaded.clipboard.enabled = clipboard["enabled"].as<bool>();
            }
            if (clipboard["max_history_items"]) {
                loaded.clipboard.maxHistoryItems = clipboard["max_history_items"].as<int>();
            }
            if (clipboard["max_pinned_items"]) {
                loaded.clipboard.maxPinnedItems = clipboard["max_pinned_items"].as<int>();
            }
            if (clipboard["dedup_index_size"]) {
                loaded.clipboard.dedupIndexSize = clipboard["dedup_index_size"].as<int>();
            }
            if (clipboard["min_poll_interval_ms"]) {
                loaded.clipboard.minPollIntervalMs = clipboard["min_poll_interval_ms"].as<int>();
            }
            if (clipboard["max_poll_interval_ms"]) {
                loaded.clipboard.maxPollIntervalMs = clipboard["max_poll_interval_ms"].as<int>();
            }
            if (clipboard["save_debounce_ms"]) {
                loaded.clipboard.saveDebounceMs = clipboard["save_debounce_ms"].as<int>();
            }
            if (clipboard["max_age_days"]) {
                loaded.clipboard.maxAgeDays = clipboard["max_age_days"].as<int>();
            }
        }

        // 读取持久化配置
        if (root["persistence"]) {
            auto persistence = root["persistence"];
            if (persistence["database_file"]) {
                loaded.persistence.databaseFile = persistence["database_file"].as<std::string>();
            }
        }

        // 读取自动清空配置
        if (root["auto_clear"]) {
            auto autoClear = root["auto_clear"];
            if (autoClear["enabled"]) {
                loaded.autoClear.enabled = autoClear["enabled"].as<bool>();
            }
            if (autoClear["interval_minutes"]) {
                loaded.autoClear.intervalMinutes = autoClear["interval_minutes"].as<int>();
            }
        }

        config_ = loaded;
        clampConfig();
        return true;
    } catch (const YAML::Exception& e) {
        std::cerr << "ConfigManager: YAML 解析错误: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        std::cerr << "ConfigManager: 加载配置失败: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::saveConfig() {
    std::string configPath = getConfigFilePath();

    try {
        YAML::Emitter out;
        out << YAML::BeginMap;

        // 写入剪贴板配置
        out << YAML::Key << "clipboard" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << config_.clipboard.enabled;
        out << YAML::Key << "max_history_items" << YAML::Value << config_.clipboard.maxHistoryItems;
        out << YAML::Key << "max_pinned_items" << YAML::Value << config_.clipboard.maxPinnedItems;
        out << YAML::Key << "dedup_index_size" << YAML::Value << config_.clipboard.dedupIndexSize;
        out << YAML::Key << "min_poll_interval_ms" << YAML::Value << config_.clipboard.minPollIntervalMs;
        out << YAML::Key << "max_poll_interval_ms" << YAML::Value << config_.clipboard.maxPollIntervalMs;
        out << YAML::Key << "save_debounce_ms" << YAML::Value << config_.clipboard.saveDebounceMs;
        out << YAML::Key << "max_age_days" << YAML::Value << config_.clipboard.maxAgeDays;
        out << YAML::EndMap;

        // 写入持久化配置
        out << YAML::Key << "persistence" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "database_file" << YAML::Value << config_.persistence.databaseFile;
        out << YAML::EndMap;

        // 写入自动清空配置
        out << YAML::Key << "auto_clear" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << config_.autoClear.enabled;
        out << YAML::Key << "interval_minutes" << YAML::Value << config_.autoClear.intervalMinutes;
        out << YAML::EndMap;

        out << YAML::EndMap;

        // 写入文件
        std::ofstream fout(configPath);
        if (!fout.is_open()) {
            std::cerr << "ConfigManager: 无法打开配置文件进行写入: " << configPath << std::endl;
            return false;
        }
        fout << "# cliphist 剪贴板历史配置文件\n\n";
        fout << out.c_str();
        fout.close();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "ConfigManager: 保存配置失败: " << e.what() << std::endl;
        return false;
    }
}

void ConfigManager::applyDefaults() {
    config_ = AppConfig{};  // 使用结构体默认值
}

void ConfigManager::clampConfig() {
    ClipboardConfig& clip = config_.clipboard;
    clip.maxHistoryItems = clampValue(clip.maxHistoryItems, MAX_HISTORY_ITEMS_MIN,
                                      MAX_HISTORY_ITEMS_MAX, "clipboard.max_history_items");
    clip.maxPinnedItems = clampValue(clip.maxPinnedItems, MAX_PINNED_ITEMS_MIN,
                                     MAX_PINNED_ITEMS_MAX, "clipboard.max_pinned_items");
    clip.dedupIndexSize = clampValue(clip.dedupIndexSize, DEDUP_INDEX_SIZE_MIN,
                                     DEDUP_INDEX_SIZE_MAX, "clipboard.dedup_index_size");
    clip.minPollIntervalMs = clampValue(clip.minPollIntervalMs, POLL_INTERVAL_MIN,
                                        POLL_INTERVAL_MAX, "clipboard.min_poll_interval_ms");
    if (clip.maxPollIntervalMs < clip.minPollIntervalMs) {
        std::cerr << "ConfigManager: clipboard.max_poll_interval_ms 小于最小值, 使用 "
                  << clip.minPollIntervalMs << std::endl;
        clip.maxPollIntervalMs = clip.minPollIntervalMs;
    }
    clip.saveDebounceMs = clampValue(clip.saveDebounceMs, SAVE_DEBOUNCE_MIN,
                                     SAVE_DEBOUNCE_MAX, "clipboard.save_debounce_ms");
    clip.maxAgeDays = clampMaxAgeDays(clip.maxAgeDays);

    if (config_.persistence.databaseFile.empty()) {
        config_.persistence.databaseFile = PersistenceConfig{}.databaseFile;
    }

    config_.autoClear.intervalMinutes = clampValue(config_.autoClear.intervalMinutes,
                                                   AUTO_CLEAR_MINUTES_MIN, AUTO_CLEAR_MINUTES_MAX,
                                                   "auto_clear.interval_minutes");
}

void ConfigManager::notifyChange(const std::string& key) {
    emit configChanged(QString::fromStdString(key));

    // 根据 key 发送特定信号
    bool all = key == "*";
    if (all || key.find("clipboard") == 0) {
        emit clipboardConfigChanged(config_.clipboard);
    }
    if (all || key.find("persistence") == 0) {
        emit persistenceConfigChanged(config_.persistence);
    }
    if (all || key.find("auto_clear") == 0) {
        emit autoClearConfigChanged(config_.autoClear);
    }
}

// ========== 配置读取 ==========

AppConfig ConfigManager::getConfig() const {
    return config_;
}

ClipboardConfig ConfigManager::getClipboardConfig() const {
    return config_.clipboard;
}

PersistenceConfig ConfigManager::getPersistenceConfig() const {
    return config_.persistence;
}

AutoClearConfig ConfigManager::getAutoClearConfig() const {
    return config_.autoClear;
}

// ========== 配置写入 ==========

void ConfigManager::setClipboardEnabled(bool enabled) {
    if (config_.clipboard.enabled != enabled) {
        config_.clipboard.enabled = enabled;
        notifyChange("clipboard.enabled");
    }
}

void ConfigManager::setMaxHistoryItems(int count) {
    count = clampValue(count, MAX_HISTORY_ITEMS_MIN, MAX_HISTORY_ITEMS_MAX,
                       "clipboard.max_history_items");

    if (config_.clipboard.maxHistoryItems != count) {
        config_.clipboard.maxHistoryItems = count;
        notifyChange("clipboard.max_history_items");
    }
}

void ConfigManager::setMaxPinnedItems(int count) {
    count = clampValue(count, MAX_PINNED_ITEMS_MIN, MAX_PINNED_ITEMS_MAX,
                       "clipboard.max_pinned_items");

    if (config_.clipboard.maxPinnedItems != count) {
        config_.clipboard.maxPinnedItems = count;
        notifyChange("clipboard.max_pinned_items");
    }
}

void ConfigManager::setDedupIndexSize(int size) {
    size = clampValue(size, DEDUP_INDEX_SIZE_MIN, DEDUP_INDEX_SIZE_MAX,
                      "clipboard.dedup_index_size");

    if (config_.clipboard.dedupIndexSize != size) {
        config_.clipboard.dedupIndexSize = size;
        notifyChange("clipboard.dedup_index_size");
    }
}

void ConfigManager::setPollIntervals(int minMs, int maxMs) {
    minMs = clampValue(minMs, POLL_INTERVAL_MIN, POLL_INTERVAL_MAX,
                       "clipboard.min_poll_interval_ms");
    maxMs = std::max(minMs, maxMs);

    if (config_.clipboard.minPollIntervalMs != minMs ||
        config_.clipboard.maxPollIntervalMs != maxMs) {
        config_.clipboard.minPollIntervalMs = minMs;
        config_.clipboard.maxPollIntervalMs = maxMs;
        notifyChange("clipboard.poll_interval");
    }
}

void ConfigManager::setSaveDebounceMs(int ms) {
    ms = clampValue(ms, SAVE_DEBOUNCE_MIN, SAVE_DEBOUNCE_MAX, "clipboard.save_debounce_ms");

    if (config_.clipboard.saveDebounceMs != ms) {
        config_.clipboard.saveDebounceMs = ms;
        notifyChange("clipboard.save_debounce_ms");
    }
}

void ConfigManager::setMaxAgeDays(int days) {
    days = clampMaxAgeDays(days);

    if (config_.clipboard.maxAgeDays != days) {
        config_.clipboard.maxAgeDays = days;
        notifyChange("clipboard.max_age_days");
    }
}

void ConfigManager::setDatabaseFile(const std::string& file) {
    if (file.empty()) {
        return;
    }
    if (config_.persistence.databaseFile != file) {
        config_.persistence.databaseFile = file;
        notifyChange("persistence.database_file");
    }
}

void ConfigManager::setAutoClearEnabled(bool enabled) {
    if (config_.autoClear.enabled != enabled) {
        config_.autoClear.enabled = enabled;
        notifyChange("auto_clear.enabled");
    }
}

void ConfigManager::setAutoClearIntervalMinutes(int minutes) {
    minutes = clampValue(minutes, AUTO_CLEAR_MINUTES_MIN, AUTO_CLEAR_MINUTES_MAX,
                         "auto_clear.interval_minutes");

    if (config_.autoClear.intervalMinutes != minutes) {
        config_.autoClear.intervalMinutes = minutes;
        notifyChange("auto_clear.interval_minutes");
    }
}

// ========== 通用配置访问 ==========

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    if (key == "persistence.database_file") {
        return config_.persistence.databaseFile;
    }
    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    if (key == "clipboard.max_history_items") {
        return config_.clipboard.maxHistoryItems;
    } else if (key == "clipboard.max_pinned_items") {
        return config_.clipboard.maxPinnedItems;
    } else if (key == "clipboard.dedup_index_size") {
        return config_.clipboard.dedupIndexSize;
    } else if (key == "clipboard.min_poll_interval_ms") {
        return config_.clipboard.minPollIntervalMs;
    } else if (key == "clipboard.max_poll_interval_ms") {
        return config_.clipboard.maxPollIntervalMs;
    } else if (key == "clipboard.save_debounce_ms") {
        return config_.clipboard.saveDebounceMs;
    } else if (key == "clipboard.max_age_days") {
        return config_.clipboard.maxAgeDays;
    } else if (key == "auto_clear.interval_minutes") {
        return config_.autoClear.intervalMinutes;
    }
    return defaultValue;
}

bool ConfigManager::getBool(const std::string& key, bool defaultValue) const {
    if (key == "clipboard.enabled") {
        return config_.clipboard.enabled;
    } else if (key == "auto_clear.enabled") {
        return config_.autoClear.enabled;
    }
    return defaultValue;
}

void ConfigManager::setString(const std::string& key, const std::string& value) {
    if (key == "persistence.database_file") {
        setDatabaseFile(value);
    }
}

void ConfigManager::setInt(const std::string& key, int value) {
    if (key == "clipboard.max_history_items") {
        setMaxHistoryItems(value);
    } else if (key == "clipboard.max_pinned_items") {
        setMaxPinnedItems(value);
    } else if (key == "clipboard.dedup_index_size") {
        setDedupIndexSize(value);
    } else if (key == "clipboard.min_poll_interval_ms") {
        setPollIntervals(value, config_.clipboard.maxPollIntervalMs);
    } else if (key == "clipboard.max_poll_interval_ms") {
        setPollIntervals(config_.clipboard.minPollIntervalMs, value);
    } else if (key == "clipboard.save_debounce_ms") {
        setSaveDebounceMs(value);
    } else if (key == "clipboard.max_age_days") {
        setMaxAgeDays(value);
    } else if (key == "auto_clear.interval_minutes") {
        setAutoClearIntervalMinutes(value);
    }
}

void ConfigManager::setBool(const std::string& key, bool value) {
    if (key == "clipboard.enabled") {
        setClipboardEnabled(value);
    } else if (key == "auto_clear.enabled") {
        setAutoClearEnabled(value);
    }
}

// ========== 持久化 ==========

bool ConfigManager::save() {
    return saveConfig();
}

bool ConfigManager::reload() {
    if (!loadConfig()) {
        return false;
    }
    // 通知所有配置已变更
    notifyChange("*");
    return true;
}

void ConfigManager::resetToDefaults() {
    applyDefaults();
    notifyChange("*");
}

} // namespace cliphist
