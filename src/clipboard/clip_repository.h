/**
 * IClipRepository - 剪贴板历史存储库接口
 *
 * 持久化层的抽象。引擎只依赖此接口，不关心具体存储格式。
 * 所有方法通过返回值报告失败，并通过 lastError() 提供错误信息，不抛出异常。
 */

#ifndef CLIPHIST_CLIPBOARD_CLIP_REPOSITORY_H
#define CLIPHIST_CLIPBOARD_CLIP_REPOSITORY_H

#include "clip_item.h"

#include <optional>
#include <string>
#include <vector>

namespace cliphist {

class IClipRepository {
public:
    virtual ~IClipRepository() = default;

    /**
     * 保存历史快照
     *
     * 按快照顺序写入（插入或更新），不删除快照之外的条目。
     * 空列表表示没有需要保存的内容，不会清空存储。
     *
     * @param items 按最近使用降序排列的条目
     * @return 是否成功
     */
    virtual bool save(const std::vector<ClipItem>& items) = 0;

    /**
     * 加载全部条目
     *
     * @return 按最近使用降序排列的条目，失败返回 std::nullopt
     */
    virtual std::optional<std::vector<ClipItem>> loadAll() = 0;

    /**
     * 删除条目
     *
     * 条目不存在视为成功。
     */
    virtual bool remove(const ClipItem& item) = 0;

    /**
     * 清空存储
     *
     * @param keepPinned 是否保留置顶条目
     */
    virtual bool clear(bool keepPinned) = 0;

    /**
     * 最近一次失败的错误信息
     */
    virtual std::string lastError() const = 0;
};

} // namespace cliphist

#endif // CLIPHIST_CLIPBOARD_CLIP_REPOSITORY_H
