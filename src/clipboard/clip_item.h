/**
 * ClipItem - 剪贴板历史条目
 *
 * 一次剪贴板捕获的快照。除置顶状态与时间戳外，按约定视为不可变。
 * 来源信息（应用名、窗口标题等）由外部解析器提供，任何字段都可能缺失。
 */

#ifndef CLIPHIST_CLIPBOARD_CLIP_ITEM_H
#define CLIPHIST_CLIPBOARD_CLIP_ITEM_H

#include <string>
#include <optional>
#include <cstdint>

namespace cliphist {

/**
 * 内容分类
 *
 * 仅用于展示和过滤，不参与去重。
 */
enum class ClipItemKind {
    Text = 0,       // 普通文本
    Url = 1,        // 单行 URL
    FilePath = 2,   // 单行文件路径
    Internal = 3    // 保留：引擎自身生成的内容
};

/**
 * 剪贴板历史条目
 */
struct ClipItem {
    std::string id;                             // 唯一标识（UUID），创建后不变
    std::string content;                        // 文本内容
    std::string contentHash;                    // SHA-256 哈希（去重指纹）
    int64_t timestamp = 0;                      // 捕获或最近一次重新复制的时间（Unix 毫秒）
    bool isPinned = false;                      // 是否置顶
    ClipItemKind kind = ClipItemKind::Text;     // 内容分类
    std::optional<std::string> sourceApp;       // 来源应用名
    std::optional<std::string> windowTitle;     // 来源窗口标题
    std::optional<std::string> bundleIdentifier;// 来源应用标识
    std::optional<int64_t> processId;           // 来源进程 ID
    bool isFromEditor = false;                  // 是否来自内置编辑器

    /**
     * 创建新条目
     *
     * 分配新的 id，计算哈希与分类，时间戳取当前时间。
     *
     * @param content 文本内容
     * @return 新条目
     */
    static ClipItem create(const std::string& content);

    bool operator==(const ClipItem& other) const;
    bool operator!=(const ClipItem& other) const { return !(*this == other); }
};

/**
 * 生成新的条目 ID
 */
std::string generateClipItemId();

/**
 * 计算内容指纹（SHA-256 十六进制）
 */
std::string computeContentHash(const std::string& content);

/**
 * 根据文本内容推断分类
 */
ClipItemKind classifyContent(const std::string& content);

/**
 * 检查文本是否为空或仅包含空白字符
 */
bool isBlankText(const std::string& text);

/**
 * 当前时间戳（Unix 毫秒）
 */
int64_t currentTimestampMs();

/**
 * 分类转字符串
 */
std::string clipItemKindToString(ClipItemKind kind);

/**
 * 字符串转分类
 */
ClipItemKind stringToClipItemKind(const std::string& str);

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_CLIP_ITEM_H
