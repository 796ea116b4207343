/**
 * 剪贴板引擎错误码
 *
 * 核心层不向调用方抛出异常。外部失败（系统剪贴板、存储库）在组件边界处
 * 被捕获，转换为空操作、布尔返回值或结果结构体，并记录日志。
 */

#ifndef CLIPHIST_CLIPBOARD_CLIPBOARD_ERRORS_H
#define CLIPHIST_CLIPBOARD_CLIPBOARD_ERRORS_H

#include <string>

namespace cliphist {

/**
 * 可恢复错误类型
 */
enum class ClipboardErrorCode {
    None = 0,
    PersistenceFailure = 1,         // 存储库调用失败
    PinLimitExceeded = 2,           // 置顶数量已达上限
    CapabilityUnavailable = 3,      // 无法监听粘贴命令（缺少权限）
    MalformedClipboardPayload = 4   // 剪贴板内容非文本或无法读取
};

/**
 * 持久化结果
 */
struct PersistenceResult {
    bool success = true;                                    // 是否全部成功
    ClipboardErrorCode error = ClipboardErrorCode::None;    // 错误类型
    int failedOperations = 0;                               // 失败的操作数
    std::string errorMessage;                               // 最近一次错误信息
};

/**
 * 错误码名称（用于日志）
 */
const char* errorCodeName(ClipboardErrorCode code);

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_CLIPBOARD_ERRORS_H
