/**
 * IPasteCommandMonitor - 粘贴命令监听接口
 *
 * 由外部（全局快捷键 / 辅助功能事件）实现，在用户执行粘贴命令时调用处理函数。
 * 粘贴队列只在队列非空时启动监听。
 */

#ifndef CLIPHIST_CLIPBOARD_PASTE_COMMAND_MONITOR_H
#define CLIPHIST_CLIPBOARD_PASTE_COMMAND_MONITOR_H

#include <functional>

namespace cliphist {

class IPasteCommandMonitor {
public:
    using PasteHandler = std::function<void()>;

    virtual ~IPasteCommandMonitor() = default;

    /**
     * 开始监听
     *
     * @param handler 每次粘贴命令发生时调用（可在任意线程）
     * @return 是否成功（无权限时返回 false）
     */
    virtual bool start(PasteHandler handler) = 0;

    /**
     * 停止监听
     *
     * 不能等待正在执行的处理函数返回。
     */
    virtual void stop() = 0;

    /**
     * 是否具备监听权限
     */
    virtual bool hasPermission() const = 0;

    virtual bool isMonitoring() const = 0;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_PASTE_COMMAND_MONITOR_H
