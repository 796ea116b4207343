/**
 * ConfigManager 单元测试
 *
 * 测试配置管理器的 YAML 读写、取值范围限制和变更通知功能。
 */

#include <iostream>
#include <filesystem>
#include <fstream>
#include <QCoreApplication>
#include <QSignalSpy>
#include "config_manager.h"

namespace fs = std::filesystem;

// 测试辅助宏
#define TEST_ASSERT(condition, message) \
    do { \
        if (!(condition)) { \
            std::cerr << "✗ 断言失败: " << message << std::endl; \
            std::cerr << "  位置: " << __FILE__ << ":" << __LINE__ << std::endl; \
            return false; \
        } \
    } while(0)

#define TEST_PASS(message) \
    std::cout << "✓ " << message << std::endl

class ConfigManagerTest {
public:
    ConfigManagerTest() {
        // 使用临时目录进行测试
        testConfigDir_ = fs::temp_directory_path().string() + "/cliphist_config_test";

        // 清理之前的测试数据
        fs::remove_all(testConfigDir_);
    }

    ~ConfigManagerTest() {
        fs::remove_all(testConfigDir_);
    }

    bool runAllTests() {
        std::cout << "=== ConfigManager 单元测试 ===" << std::endl;
        std::cout << "测试配置目录: " << testConfigDir_ << std::endl;
        std::cout << std::endl;

        bool allPassed = true;

        // 基础测试
        allPassed &= testInitialize();
        allPassed &= testDefaultConfig();
        allPassed &= testDatabasePath();

        // 配置写入测试
        allPassed &= testHistoryLimits();
        allPassed &= testPollIntervals();
        allPassed &= testMaxAgeDays();
        allPassed &= testAutoClearConfig();

        // 通用访问测试
        allPassed &= testGenericAccess();

        // 持久化测试
        allPassed &= testSaveAndReload();
        allPassed &= testLoadClampsInvalidValues();
        allPassed &= testInvalidFileFallsBackToDefaults();

        // 信号测试
        allPassed &= testSignals();

        std::cout << std::endl;
        if (allPassed) {
            std::cout << "=== 所有测试通过 ===" << std::endl;
        } else {
            std::cout << "=== 部分测试失败 ===" << std::endl;
        }

        return allPassed;
    }

private:
    std::string testConfigDir_;

    // ========== 基础测试 ==========

    bool testInitialize() {
        cliphist::ConfigManager config;

        bool result = config.initialize(testConfigDir_);
        TEST_ASSERT(result, "初始化应该成功");
        TEST_ASSERT(config.isInitialized(), "初始化后 isInitialized 应该返回 true");
        TEST_ASSERT(config.getConfigDir() == testConfigDir_, "配置目录应该正确");
        TEST_ASSERT(fs::exists(testConfigDir_), "配置目录应该已创建");
        TEST_ASSERT(fs::exists(config.getConfigFilePath()), "应该写入默认配置文件");

        // 重复初始化应该返回 true（幂等）
        result = config.initialize(testConfigDir_);
        TEST_ASSERT(result, "重复初始化应该返回 true");

        TEST_PASS("testInitialize: 初始化成功");
        return true;
    }

    bool testDefaultConfig() {
        cliphist::ConfigManager config;

        auto clip = config.getClipboardConfig();
        TEST_ASSERT(clip.enabled, "剪贴板默认应该启用");
        TEST_ASSERT(clip.maxHistoryItems == 300, "默认历史上限应该是 300");
        TEST_ASSERT(clip.maxPinnedItems == 20, "默认置顶上限应该是 20");
        TEST_ASSERT(clip.dedupIndexSize == 50, "默认去重索引容量应该是 50");
        TEST_ASSERT(clip.minPollIntervalMs == 500, "默认最小轮询间隔应该是 500");
        TEST_ASSERT(clip.maxPollIntervalMs == 1000, "默认最大轮询间隔应该是 1000");
        TEST_ASSERT(clip.saveDebounceMs == 500, "默认保存防抖应该是 500");
        TEST_ASSERT(clip.maxAgeDays == 0, "默认不限制保留天数");

        auto autoClear = config.getAutoClearConfig();
        TEST_ASSERT(!autoClear.enabled, "自动清空默认应该禁用");
        TEST_ASSERT(autoClear.intervalMinutes == 10, "默认清空间隔应该是 10 分钟");

        TEST_ASSERT(config.getPersistenceConfig().databaseFile == "clipboard.db", "默认数据库文件名");

        TEST_PASS("testDefaultConfig: 默认配置正确");
        return true;
    }

    bool testDatabasePath() {
        cliphist::ConfigManager config;
        config.initialize(testConfigDir_);

        std::string expected = (fs::path(testConfigDir_) / "clipboard.db").string();
        TEST_ASSERT(config.getDatabasePath() == expected, "相对路径应该基于配置目录");

        std::string absolute = (fs::temp_directory_path() / "cliphist_abs.db").string();
        config.setDatabaseFile(absolute);
        TEST_ASSERT(config.getDatabasePath() == absolute, "绝对路径应该原样返回");

        config.setDatabaseFile("");
        TEST_ASSERT(config.getPersistenceConfig().databaseFile == absolute, "空文件名应该被忽略");

        TEST_PASS("testDatabasePath: 数据库路径解析正常");
        return true;
    }

    // ========== 配置写入测试 ==========

    bool testHistoryLimits() {
        cliphist::ConfigManager config;

        config.setMaxHistoryItems(50);
        TEST_ASSERT(config.getClipboardConfig().maxHistoryItems == 50, "历史上限应该是 50");
        config.setMaxHistoryItems(0);
        TEST_ASSERT(config.getClipboardConfig().maxHistoryItems == 1, "历史上限应该被限制为 1");
        config.setMaxHistoryItems(20000);
        TEST_ASSERT(config.getClipboardConfig().maxHistoryItems == 10000, "历史上限应该被限制为 10000");

        config.setMaxPinnedItems(-5);
        TEST_ASSERT(config.getClipboardConfig().maxPinnedItems == 1, "置顶上限应该被限制为 1");
        config.setMaxPinnedItems(5);
        TEST_ASSERT(config.getClipboardConfig().maxPinnedItems == 5, "置顶上限应该是 5");

        config.setDedupIndexSize(0);
        TEST_ASSERT(config.getClipboardConfig().dedupIndexSize == 1, "去重索引容量应该被限制为 1");

        config.setSaveDebounceMs(-1);
        TEST_ASSERT(config.getClipboardConfig().saveDebounceMs == 0, "保存防抖应该被限制为 0");

        TEST_PASS("testHistoryLimits: 历史上限设置正常");
        return true;
    }

    bool testPollIntervals() {
        cliphist::ConfigManager config;

        config.setPollIntervals(200, 800);
        TEST_ASSERT(config.getClipboardConfig().minPollIntervalMs == 200, "最小轮询间隔应该是 200");
        TEST_ASSERT(config.getClipboardConfig().maxPollIntervalMs == 800, "最大轮询间隔应该是 800");

        config.setPollIntervals(10, 5);
        TEST_ASSERT(config.getClipboardConfig().minPollIntervalMs == 100, "最小轮询间隔应该被限制为 100");
        TEST_ASSERT(config.getClipboardConfig().maxPollIntervalMs == 100, "最大轮询间隔不应小于最小值");

        config.setPollIntervals(9000, 9000);
        TEST_ASSERT(config.getClipboardConfig().minPollIntervalMs == 5000, "最小轮询间隔应该被限制为 5000");
        TEST_ASSERT(config.getClipboardConfig().maxPollIntervalMs == 9000, "最大轮询间隔可以大于 5000");

        TEST_PASS("testPollIntervals: 轮询间隔设置正常");
        return true;
    }

    bool testMaxAgeDays() {
        cliphist::ConfigManager config;

        config.setMaxAgeDays(7);
        TEST_ASSERT(config.getClipboardConfig().maxAgeDays == 7, "保留天数应该是 7");
        config.setMaxAgeDays(500);
        TEST_ASSERT(config.getClipboardConfig().maxAgeDays == 365, "保留天数应该被限制为 365");
        config.setMaxAgeDays(0);
        TEST_ASSERT(config.getClipboardConfig().maxAgeDays == 0, "0 表示不限制");
        config.setMaxAgeDays(-3);
        TEST_ASSERT(config.getClipboardConfig().maxAgeDays == 0, "负数视为不限制");

        TEST_PASS("testMaxAgeDays: 保留天数设置正常");
        return true;
    }

    bool testAutoClearConfig() {
        cliphist::ConfigManager config;

        config.setAutoClearEnabled(true);
        TEST_ASSERT(config.getAutoClearConfig().enabled, "自动清空应该启用");

        config.setAutoClearIntervalMinutes(0);
        TEST_ASSERT(config.getAutoClearConfig().intervalMinutes == 1, "清空间隔应该被限制为 1");
        config.setAutoClearIntervalMinutes(5000);
        TEST_ASSERT(config.getAutoClearConfig().intervalMinutes == 1440, "清空间隔应该被限制为 1440");

        TEST_PASS("testAutoClearConfig: 自动清空配置正常");
        return true;
    }

    // ========== 通用访问测试 ==========

    bool testGenericAccess() {
        cliphist::ConfigManager config;

        TEST_ASSERT(config.getBool("clipboard.enabled") == true, "通过通用访问获取启用状态");
        TEST_ASSERT(config.getInt("clipboard.max_history_items") == 300, "通过通用访问获取历史上限");
        TEST_ASSERT(config.getString("persistence.database_file") == "clipboard.db", "通过通用访问获取数据库文件");
        TEST_ASSERT(config.getInt("unknown.key", 42) == 42, "未知键应该返回默认值");
        TEST_ASSERT(config.getString("unknown.key", "x") == "x", "未知键应该返回默认值");

        config.setBool("auto_clear.enabled", true);
        TEST_ASSERT(config.getAutoClearConfig().enabled, "通过通用访问设置自动清空");
        config.setInt("clipboard.max_pinned_items", 8);
        TEST_ASSERT(config.getClipboardConfig().maxPinnedItems == 8, "通过通用访问设置置顶上限");
        config.setInt("clipboard.min_poll_interval_ms", 300);
        TEST_ASSERT(config.getInt("clipboard.min_poll_interval_ms") == 300, "通过通用访问设置最小轮询间隔");
        config.setString("persistence.database_file", "history.db");
        TEST_ASSERT(config.getPersistenceConfig().databaseFile == "history.db", "通过通用访问设置数据库文件");

        TEST_PASS("testGenericAccess: 通用访问正常");
        return true;
    }

    // ========== 持久化测试 ==========

    bool testSaveAndReload() {
        cliphist::ConfigManager config;
        config.initialize(testConfigDir_);

        config.setClipboardEnabled(false);
        config.setMaxHistoryItems(120);
        config.setMaxAgeDays(30);
        config.setAutoClearEnabled(true);
        config.setAutoClearIntervalMinutes(15);

        TEST_ASSERT(config.save(), "保存配置应该成功");

        config.resetToDefaults();
        TEST_ASSERT(config.getClipboardConfig().enabled, "重置后剪贴板应该启用");
        TEST_ASSERT(config.getClipboardConfig().maxHistoryItems == 300, "重置后历史上限应该是 300");

        TEST_ASSERT(config.reload(), "重新加载配置应该成功");
        TEST_ASSERT(!config.getClipboardConfig().enabled, "重新加载后剪贴板应该禁用");
        TEST_ASSERT(config.getClipboardConfig().maxHistoryItems == 120, "重新加载后历史上限应该是 120");
        TEST_ASSERT(config.getClipboardConfig().maxAgeDays == 30, "重新加载后保留天数应该是 30");
        TEST_ASSERT(config.getAutoClearConfig().enabled, "重新加载后自动清空应该启用");
        TEST_ASSERT(config.getAutoClearConfig().intervalMinutes == 15, "重新加载后清空间隔应该是 15");

        // 新实例读取同一文件
        cliphist::ConfigManager other;
        other.initialize(testConfigDir_);
        TEST_ASSERT(other.getClipboardConfig().maxHistoryItems == 120, "新实例应该读取已保存的配置");

        config.resetToDefaults();
        config.save();

        TEST_PASS("testSaveAndReload: 保存和重新加载正常");
        return true;
    }

    bool testLoadClampsInvalidValues() {
        std::string dir = testConfigDir_ + "/clamp";
        fs::create_directories(dir);
        {
            std::ofstream out(dir + "/config.yaml");
            out << "clipboard:\n"
                << "  max_history_items: 0\n"
                << "  min_poll_interval_ms: 20\n"
                << "  max_poll_interval_ms: 10\n"
                << "  max_age_days: 9999\n"
                << "auto_clear:\n"
                << "  interval_minutes: -4\n";
        }

        cliphist::ConfigManager config;
        TEST_ASSERT(config.initialize(dir), "初始化应该成功");

        auto clip = config.getClipboardConfig();
        TEST_ASSERT(clip.maxHistoryItems == 1, "历史上限应该被限制为 1");
        TEST_ASSERT(clip.minPollIntervalMs == 100, "最小轮询间隔应该被限制为 100");
        TEST_ASSERT(clip.maxPollIntervalMs == 100, "最大轮询间隔不应小于最小值");
        TEST_ASSERT(clip.maxAgeDays == 365, "保留天数应该被限制为 365");
        TEST_ASSERT(clip.maxPinnedItems == 20, "缺失的键应该使用默认值");
        TEST_ASSERT(config.getAutoClearConfig().intervalMinutes == 1, "清空间隔应该被限制为 1");

        TEST_PASS("testLoadClampsInvalidValues: 加载时限制取值范围");
        return true;
    }

    bool testInvalidFileFallsBackToDefaults() {
        std::string dir = testConfigDir_ + "/broken";
        fs::create_directories(dir);
        {
            std::ofstream out(dir + "/config.yaml");
            out << "clipboard: [unterminated\n";
        }

        cliphist::ConfigManager config;
        TEST_ASSERT(config.initialize(dir), "无法解析的配置文件不应导致初始化失败");
        TEST_ASSERT(config.getClipboardConfig() == cliphist::ClipboardConfig(), "应该使用默认配置");

        TEST_PASS("testInvalidFileFallsBackToDefaults: 无效配置文件回退到默认值");
        return true;
    }

    // ========== 信号测试 ==========

    bool testSignals() {
        cliphist::ConfigManager config;

        QSignalSpy configChangedSpy(&config, &cliphist::ConfigManager::configChanged);
        QSignalSpy clipboardChangedSpy(&config, &cliphist::ConfigManager::clipboardConfigChanged);
        QSignalSpy autoClearChangedSpy(&config, &cliphist::ConfigManager::autoClearConfigChanged);
        QSignalSpy persistenceChangedSpy(&config, &cliphist::ConfigManager::persistenceConfigChanged);

        config.setMaxHistoryItems(42);
        TEST_ASSERT(configChangedSpy.count() == 1, "configChanged 信号应该被发送");
        TEST_ASSERT(configChangedSpy.at(0).at(0).toString() == "clipboard.max_history_items", "信号应该携带配置键");
        TEST_ASSERT(clipboardChangedSpy.count() == 1, "clipboardConfigChanged 信号应该被发送");
        TEST_ASSERT(autoClearChangedSpy.count() == 0, "不应发送 autoClearConfigChanged");

        // 相同的值不发送信号
        config.setMaxHistoryItems(42);
        TEST_ASSERT(configChangedSpy.count() == 1, "值未变化时不应发送信号");

        config.setAutoClearEnabled(true);
        TEST_ASSERT(autoClearChangedSpy.count() == 1, "autoClearConfigChanged 信号应该被发送");

        config.resetToDefaults();
        TEST_ASSERT(configChangedSpy.last().at(0).toString() == "*", "重置应该通知全部配置");
        TEST_ASSERT(clipboardChangedSpy.count() == 2, "重置应该发送 clipboardConfigChanged");
        TEST_ASSERT(persistenceChangedSpy.count() == 1, "重置应该发送 persistenceConfigChanged");

        TEST_PASS("testSignals: 信号发送正常");
        return true;
    }
};

int main(int argc, char* argv[]) {
    // 需要 QCoreApplication 来支持 Qt 信号
    QCoreApplication app(argc, argv);

    ConfigManagerTest test;
    return test.runAllTests() ? 0 : 1;
}
