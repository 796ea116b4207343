/**
 * AutoClearController 单元测试
 *
 * 测试定时清空文本剪贴板、非文本跳过、暂停恢复和间隔限制。
 */

#include <thread>
#include <QCoreApplication>
#include <QSignalSpy>
#include <QTest>
#include "auto_clear_controller.h"
#include "clipboard_monitor.h"
#include "history_store.h"
#include "fake_clipboard.h"
#include "test_macros.h"

using namespace cliphist;
using cliphist::testing::FakeClipboardResource;
using cliphist::testing::makeItem;

class AutoClearControllerTest {
public:
    bool runAllTests() {
        std::cout << "=== AutoClearController 单元测试 ===" << std::endl;

        bool allPassed = true;

        // 清空测试
        allPassed &= testTimeoutClearsText();
        allPassed &= testNonTextNotCleared();
        allPassed &= testRearmsAfterTimeout();
        allPassed &= testHistoryUntouched();

        // 计时测试
        allPassed &= testDisabledDoesNothing();
        allPassed &= testPauseResume();
        allPassed &= testIntervalClamped();
        allPassed &= testCrossThreadCalls();

        std::cout << std::endl;
        std::cout << (allPassed ? "=== 所有测试通过 ===" : "=== 部分测试失败 ===") << std::endl;
        return allPassed;
    }

private:
    // ========== 清空测试 ==========

    bool testTimeoutClearsText() {
        FakeClipboardResource clipboard;
        ClipboardMonitor monitor(clipboard);
        AutoClearController controller(monitor);
        QSignalSpy spy(&controller, &AutoClearController::clipboardCleared);

        clipboard.externalCopy("password");
        controller.setIntervalMs(50);
        controller.setEnabled(true);
        TEST_ASSERT(controller.isEnabled(), "已启用");
        TEST_ASSERT(controller.remainingMs() >= 0, "启用后开始计时");

        TEST_ASSERT(spy.wait(2000), "到期后发出清空信号");
        TEST_ASSERT(!clipboard.current(), "文本剪贴板被清空");
        TEST_ASSERT(!monitor.pollOnce(), "清空操作不被当作外部复制");

        TEST_PASS("testTimeoutClearsText: 到期清空文本");
        return true;
    }

    bool testNonTextNotCleared() {
        FakeClipboardResource clipboard;
        ClipboardMonitor monitor(clipboard);
        AutoClearController controller(monitor);
        QSignalSpy spy(&controller, &AutoClearController::clipboardCleared);

        clipboard.externalCopyNonText();
        TEST_ASSERT(!controller.performAutoClear(), "非文本内容不清空");
        TEST_ASSERT(clipboard.clears() == 0, "没有调用清空");
        TEST_ASSERT(spy.count() == 0, "没有发出信号");

        clipboard.externalCopy("text");
        TEST_ASSERT(controller.performAutoClear(), "文本内容被清空");
        TEST_ASSERT(spy.count() == 1, "发出一次信号");

        TEST_PASS("testNonTextNotCleared: 非文本内容不受影响");
        return true;
    }

    bool testRearmsAfterTimeout() {
        FakeClipboardResource clipboard;
        ClipboardMonitor monitor(clipboard);
        AutoClearController controller(monitor);
        QSignalSpy spy(&controller, &AutoClearController::clipboardCleared);

        controller.setIntervalMs(50);
        controller.setEnabled(true);

        clipboard.externalCopy("first");
        TEST_ASSERT(spy.wait(2000), "第一次清空");

        clipboard.externalCopy("second");
        TEST_ASSERT(spy.wait(2000), "到期后重新计时并再次清空");
        TEST_ASSERT(spy.count() == 2, "共清空两次");
        TEST_ASSERT(controller.remainingMs() >= 0, "仍在计时");

        TEST_PASS("testRearmsAfterTimeout: 到期后重新计时");
        return true;
    }

    bool testHistoryUntouched() {
        FakeClipboardResource clipboard;
        ClipboardMonitor monitor(clipboard);
        HistoryStore store;
        monitor.setCaptureCallback([&store](const CapturedClip& clip) {
            store.record(makeItem(clip.text));
        });
        AutoClearController controller(monitor);

        clipboard.externalCopy("secret");
        monitor.pollOnce();
        TEST_ASSERT(store.count() == 1, "历史中有一条");

        controller.performAutoClear();
        monitor.pollOnce();
        TEST_ASSERT(store.count() == 1, "清空剪贴板不影响历史");
        TEST_ASSERT(store.front()->content == "secret", "历史内容不变");

        TEST_PASS("testHistoryUntouched: 自动清空不修改历史");
        return true;
    }

    // ========== 计时测试 ==========

    bool testDisabledDoesNothing() {
        FakeClipboardResource clipboard;
        ClipboardMonitor monitor(clipboard);
        AutoClearController controller(monitor);
        QSignalSpy spy(&controller, &AutoClearController::clipboardCleared);

        clipboard.externalCopy("text");
        controller.setIntervalMs(30);
        TEST_ASSERT(controller.remainingMs() == -1, "未启用时不计时");

        QTest::qWait(150);
        TEST_ASSERT(spy.count() == 0, "未启用时不清空");
        TEST_ASSERT(clipboard.current().has_value(), "剪贴板内容保留");

        controller.setEnabled(true);
        controller.setEnabled(false);
        TEST_ASSERT(controller.remainingMs() == -1, "禁用后停止计时");

        TEST_PASS("testDisabledDoesNothing: 未启用时不清空");
        return true;
    }

    bool testPauseResume() {
        FakeClipboardResource clipboard;
        ClipboardMonitor monitor(clipboard);
        AutoClearController controller(monitor);
        QSignalSpy spy(&controller, &AutoClearController::clipboardCleared);

        clipboard.externalCopy("text");
        controller.setIntervalMs(50);
        controller.setEnabled(true);

        controller.pause();
        TEST_ASSERT(controller.isPaused(), "已暂停");
        TEST_ASSERT(controller.remainingMs() == -1, "暂停时不计时");

        QTest::qWait(150);
        TEST_ASSERT(spy.count() == 0, "暂停期间不清空");

        controller.resume();
        TEST_ASSERT(!controller.isPaused(), "已恢复");
        TEST_ASSERT(controller.remainingMs() >= 0, "恢复后重新计时");
        TEST_ASSERT(spy.wait(2000), "恢复后到期清空");

        TEST_PASS("testPauseResume: 暂停和恢复");
        return true;
    }

    bool testIntervalClamped() {
        FakeClipboardResource clipboard;
        ClipboardMonitor monitor(clipboard);
        AutoClearController controller(monitor);

        TEST_ASSERT(controller.intervalMinutes() == AutoClearController::DEFAULT_INTERVAL_MINUTES,
                    "默认间隔");

        controller.setIntervalMinutes(0);
        TEST_ASSERT(controller.intervalMinutes() == 1, "最小 1 分钟");

        controller.setIntervalMinutes(5000);
        TEST_ASSERT(controller.intervalMinutes() == 1440, "最大 1440 分钟");

        controller.setIntervalMinutes(30);
        TEST_ASSERT(controller.intervalMs() == 30 * 60 * 1000, "间隔换算为毫秒");

        controller.setEnabled(true);
        int remaining = controller.remainingMs();
        TEST_ASSERT(remaining > 29 * 60 * 1000 && remaining <= 30 * 60 * 1000, "按新间隔计时");

        TEST_PASS("testIntervalClamped: 间隔限制在有效范围");
        return true;
    }

    bool testCrossThreadCalls() {
        FakeClipboardResource clipboard;
        ClipboardMonitor monitor(clipboard);
        AutoClearController controller(monitor);
        controller.setIntervalMs(60000);
        controller.setEnabled(true);

        std::thread other([&controller]() { controller.pause(); });
        other.join();

        QTest::qWait(50);
        TEST_ASSERT(controller.isPaused(), "其他线程的调用在所属线程上执行");
        TEST_ASSERT(controller.remainingMs() == -1, "计时已停止");

        std::thread resumer([&controller]() { controller.resume(); });
        resumer.join();

        QTest::qWait(50);
        TEST_ASSERT(!controller.isPaused(), "其他线程恢复成功");
        TEST_ASSERT(controller.remainingMs() >= 0, "重新计时");

        TEST_PASS("testCrossThreadCalls: 跨线程调用排队执行");
        return true;
    }
};

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);

    AutoClearControllerTest test;
    return test.runAllTests() ? 0 : 1;
}
