/**
 * SqliteClipRepository 单元测试
 *
 * 测试 SQLite 存储库的初始化、快照保存、按顺序加载、删除和清空。
 */

#include <filesystem>
#include <QCoreApplication>
#include "sqlite_clip_repository.h"
#include "fake_clipboard.h"
#include "test_macros.h"

namespace fs = std::filesystem;

using namespace cliphist;
using cliphist::testing::makeItem;

class SqliteClipRepositoryTest {
public:
    SqliteClipRepositoryTest() {
        // 使用临时目录进行测试
        testDataDir_ = fs::temp_directory_path().string() + "/cliphist_repository_test";
        testDbPath_ = testDataDir_ + "/nested/clipboard.db";

        // 清理之前的测试数据
        fs::remove_all(testDataDir_);
    }

    ~SqliteClipRepositoryTest() {
        fs::remove_all(testDataDir_);
    }

    bool runAllTests() {
        std::cout << "=== SqliteClipRepository 单元测试 ===" << std::endl;
        std::cout << "测试数据目录: " << testDataDir_ << std::endl;
        std::cout << std::endl;

        bool allPassed = true;

        // 基础测试
        allPassed &= testNotInitialized();
        allPassed &= testInitialize();

        // 保存和加载测试
        allPassed &= testSaveAndLoad();
        allPassed &= testOptionalFields();
        allPassed &= testUpsertUpdatesInPlace();
        allPassed &= testSaveEmptyIsNoop();
        allPassed &= testPersistsAcrossReopen();

        // 删除和清空测试
        allPassed &= testRemove();
        allPassed &= testClearKeepPinned();
        allPassed &= testClearAll();

        std::cout << std::endl;
        std::cout << (allPassed ? "=== 所有测试通过 ===" : "=== 部分测试失败 ===") << std::endl;
        return allPassed;
    }

private:
    std::string testDataDir_;
    std::string testDbPath_;

    // ========== 基础测试 ==========

    bool testNotInitialized() {
        SqliteClipRepository repository;
        TEST_ASSERT(!repository.isInitialized(), "构造后未初始化");
        TEST_ASSERT(!repository.save({makeItem("A")}), "未初始化时保存失败");
        TEST_ASSERT(!repository.loadAll().has_value(), "未初始化时加载失败");
        TEST_ASSERT(!repository.remove(makeItem("A")), "未初始化时删除失败");
        TEST_ASSERT(!repository.clear(false), "未初始化时清空失败");
        TEST_ASSERT(repository.count() == -1, "未初始化时计数为 -1");
        TEST_ASSERT(!repository.lastError().empty(), "记录错误信息");

        TEST_PASS("testNotInitialized: 未初始化时所有操作失败");
        return true;
    }

    bool testInitialize() {
        SqliteClipRepository repository;
        TEST_ASSERT(repository.initialize(testDbPath_), "初始化应该成功");
        TEST_ASSERT(repository.isInitialized(), "已初始化");
        TEST_ASSERT(repository.getDatabasePath() == testDbPath_, "数据库路径正确");
        TEST_ASSERT(fs::exists(testDbPath_), "自动创建目录和数据库文件");
        TEST_ASSERT(repository.initialize(testDbPath_), "重复初始化应该成功");
        TEST_ASSERT(repository.count() == 0, "新数据库为空");

        repository.shutdown();
        TEST_ASSERT(!repository.isInitialized(), "关闭后未初始化");

        TEST_PASS("testInitialize: 初始化成功");
        return true;
    }

    // ========== 保存和加载测试 ==========

    bool testSaveAndLoad() {
        SqliteClipRepository repository;
        repository.initialize(testDbPath_);
        repository.clear(false);

        ClipItem c = makeItem("C", 3000);
        ClipItem b = makeItem("B", 2000);
        ClipItem a = makeItem("A", 1000);
        TEST_ASSERT(repository.save({c, b, a}), "保存应该成功");
        TEST_ASSERT(repository.count() == 3, "存储了三条");

        auto loaded = repository.loadAll();
        TEST_ASSERT(loaded.has_value(), "加载应该成功");
        TEST_ASSERT(loaded->size() == 3, "加载三条");
        TEST_ASSERT((*loaded)[0] == c, "第一条与保存的一致");
        TEST_ASSERT((*loaded)[1] == b, "第二条与保存的一致");
        TEST_ASSERT((*loaded)[2] == a, "第三条与保存的一致");

        // 新快照改变顺序
        TEST_ASSERT(repository.save({a, c, b}), "保存新顺序");
        loaded = repository.loadAll();
        TEST_ASSERT((*loaded)[0].id == a.id, "按快照顺序加载");
        TEST_ASSERT((*loaded)[2].id == b.id, "按快照顺序加载");

        TEST_PASS("testSaveAndLoad: 保存和加载保持顺序");
        return true;
    }

    bool testOptionalFields() {
        SqliteClipRepository repository;
        repository.initialize(testDbPath_);
        repository.clear(false);

        ClipItem full = makeItem("https://example.com/path");
        full.sourceApp = "Browser";
        full.windowTitle = "Example - 中文标题";
        full.bundleIdentifier = "com.example.browser";
        full.processId = 4321;
        full.isFromEditor = true;
        full.isPinned = true;

        ClipItem bare = makeItem("line one\nline two\0tail");
        bare.content = std::string("line one\nline two\0tail", 22);

        TEST_ASSERT(repository.save({full, bare}), "保存应该成功");

        auto loaded = repository.loadAll();
        TEST_ASSERT(loaded && loaded->size() == 2, "加载两条");

        const ClipItem& first = (*loaded)[0];
        TEST_ASSERT(first.kind == ClipItemKind::Url, "分类保持");
        TEST_ASSERT(first.sourceApp == std::optional<std::string>("Browser"), "来源应用保持");
        TEST_ASSERT(first.windowTitle == full.windowTitle, "窗口标题保持");
        TEST_ASSERT(first.bundleIdentifier == full.bundleIdentifier, "应用标识保持");
        TEST_ASSERT(first.processId == std::optional<int64_t>(4321), "进程 ID 保持");
        TEST_ASSERT(first.isFromEditor, "编辑器标志保持");
        TEST_ASSERT(first.isPinned, "置顶状态保持");

        const ClipItem& second = (*loaded)[1];
        TEST_ASSERT(second.content == bare.content, "包含空字符的内容完整保存");
        TEST_ASSERT(!second.sourceApp && !second.windowTitle, "缺失字段保持为空");
        TEST_ASSERT(!second.processId, "缺失进程 ID 保持为空");

        TEST_PASS("testOptionalFields: 可选字段正确保存");
        return true;
    }

    bool testUpsertUpdatesInPlace() {
        SqliteClipRepository repository;
        repository.initialize(testDbPath_);
        repository.clear(false);

        ClipItem item = makeItem("upsert", 1000);
        repository.save({item});

        item.isPinned = true;
        item.timestamp = 5000;
        TEST_ASSERT(repository.save({item}), "再次保存应该成功");
        TEST_ASSERT(repository.count() == 1, "同一 ID 不会重复插入");

        auto loaded = repository.loadAll();
        TEST_ASSERT((*loaded)[0].isPinned, "置顶状态已更新");
        TEST_ASSERT((*loaded)[0].timestamp == 5000, "时间戳已更新");

        // 快照之外的条目不会被删除
        ClipItem other = makeItem("other", 6000);
        repository.save({other});
        TEST_ASSERT(repository.count() == 2, "保存不删除快照外的条目");

        TEST_PASS("testUpsertUpdatesInPlace: 保存按 ID 更新");
        return true;
    }

    bool testSaveEmptyIsNoop() {
        SqliteClipRepository repository;
        repository.initialize(testDbPath_);
        repository.clear(false);

        repository.save({makeItem("keep")});
        TEST_ASSERT(repository.save({}), "保存空列表应该成功");
        TEST_ASSERT(repository.count() == 1, "保存空列表不清空存储");

        TEST_PASS("testSaveEmptyIsNoop: 空快照不修改存储");
        return true;
    }

    bool testPersistsAcrossReopen() {
        ClipItem item = makeItem("durable");
        {
            SqliteClipRepository repository;
            repository.initialize(testDbPath_);
            repository.clear(false);
            repository.save({item});
        }

        SqliteClipRepository reopened;
        TEST_ASSERT(reopened.initialize(testDbPath_), "重新打开应该成功");
        auto loaded = reopened.loadAll();
        TEST_ASSERT(loaded && loaded->size() == 1, "重新打开后数据仍在");
        TEST_ASSERT((*loaded)[0] == item, "数据一致");

        TEST_PASS("testPersistsAcrossReopen: 数据在重新打开后保留");
        return true;
    }

    // ========== 删除和清空测试 ==========

    bool testRemove() {
        SqliteClipRepository repository;
        repository.initialize(testDbPath_);
        repository.clear(false);

        ClipItem a = makeItem("A");
        ClipItem b = makeItem("B");
        repository.save({a, b});

        TEST_ASSERT(repository.remove(a), "删除应该成功");
        TEST_ASSERT(repository.count() == 1, "剩余一条");
        TEST_ASSERT((*repository.loadAll())[0].id == b.id, "剩余的是 B");
        TEST_ASSERT(repository.remove(a), "删除不存在的条目视为成功");

        TEST_PASS("testRemove: 删除条目");
        return true;
    }

    bool testClearKeepPinned() {
        SqliteClipRepository repository;
        repository.initialize(testDbPath_);
        repository.clear(false);

        ClipItem pinned = makeItem("pinned");
        pinned.isPinned = true;
        repository.save({makeItem("A"), pinned, makeItem("B")});

        TEST_ASSERT(repository.clear(true), "清空应该成功");
        auto loaded = repository.loadAll();
        TEST_ASSERT(loaded->size() == 1, "只保留置顶条目");
        TEST_ASSERT((*loaded)[0].id == pinned.id, "保留的是置顶条目");

        TEST_PASS("testClearKeepPinned: 清空时保留置顶");
        return true;
    }

    bool testClearAll() {
        SqliteClipRepository repository;
        repository.initialize(testDbPath_);

        ClipItem pinned = makeItem("pinned all");
        pinned.isPinned = true;
        repository.save({makeItem("A"), pinned});

        TEST_ASSERT(repository.clear(false), "清空应该成功");
        TEST_ASSERT(repository.count() == 0, "全部清空");

        TEST_PASS("testClearAll: 全部清空");
        return true;
    }
};

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    SqliteClipRepositoryTest test;
    return test.runAllTests() ? 0 : 1;
}
