/**
 * 剪贴板外部资源接口
 *
 * 定义引擎依赖的两个外部能力：
 * - IClipboardResource：系统剪贴板（共享、可被外部修改）
 * - IAppInfoResolver：前台应用信息解析
 *
 * 平台实现（Qt、测试替身等）通过继承这些接口接入引擎。
 */

#ifndef CLIPHIST_CLIPBOARD_CLIPBOARD_RESOURCE_H
#define CLIPHIST_CLIPBOARD_CLIPBOARD_RESOURCE_H

#include <cstdint>
#include <optional>
#include <string>

namespace cliphist {

/**
 * IClipboardResource - 系统剪贴板接口
 *
 * 实现需保证 changeCount() 在每次内容变化（包括本进程写入）后递增。
 */
class IClipboardResource {
public:
    virtual ~IClipboardResource() = default;

    /**
     * 读取文本内容
     *
     * @return 文本内容；剪贴板为空、非文本或读取失败时返回 std::nullopt
     */
    virtual std::optional<std::string> readText() = 0;

    /**
     * 写入文本内容
     *
     * @param text 文本内容
     * @return 是否成功
     */
    virtual bool writeText(const std::string& text) = 0;

    /**
     * 获取变化计数
     *
     * 单调递增，用于检测剪贴板变化。
     */
    virtual int64_t changeCount() = 0;

    /**
     * 清空剪贴板
     */
    virtual void clear() = 0;
};

/**
 * 前台应用信息
 *
 * 所有字段都可能缺失。
 */
struct AppInfo {
    std::optional<std::string> appName;
    std::optional<std::string> windowTitle;
    std::optional<std::string> bundleIdentifier;
    std::optional<int64_t> processId;
};

/**
 * IAppInfoResolver - 前台应用信息解析接口
 */
class IAppInfoResolver {
public:
    virtual ~IAppInfoResolver() = default;

    /**
     * 解析当前前台应用
     *
     * 实现可以抛出异常，调用方会将其降级为空的 AppInfo。
     */
    virtual AppInfo resolve() = 0;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_CLIPBOARD_RESOURCE_H
