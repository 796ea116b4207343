/**
 * ClipItem 实现
 */

#include "clip_item.h"

#include <QByteArray>
#include <QCryptographicHash>
#include <QUuid>
#include <chrono>
#include <cctype>

namespace cliphist {

ClipItem ClipItem::create(const std::string& content) {
    ClipItem item;
    item.id = generateClipItemId();
    item.content = content;
    item.contentHash = computeContentHash(content);
    item.timestamp = currentTimestampMs();
    item.kind = classifyContent(content);
    return item;
}

bool ClipItem::operator==(const ClipItem& other) const {
    return id == other.id
        && content == other.content
        && timestamp == other.timestamp
        && isPinned == other.isPinned
        && kind == other.kind
        && sourceApp == other.sourceApp
        && windowTitle == other.windowTitle
        && bundleIdentifier == other.bundleIdentifier
        && processId == other.processId
        && isFromEditor == other.isFromEditor;
}

std::string generateClipItemId() {
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

std::string computeContentHash(const std::string& content) {
    QByteArray data = QByteArray::fromStdString(content);
    return QCryptographicHash::hash(data, QCryptographicHash::Sha256).toHex().toStdString();
}

ClipItemKind classifyContent(const std::string& content) {
    // 去掉首尾空白后判断
    size_t begin = 0;
    size_t end = content.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(content[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(content[end - 1]))) {
        --end;
    }
    if (begin == end) {
        return ClipItemKind::Text;
    }

    std::string trimmed = content.substr(begin, end - begin);

    // 多行内容一律视为文本
    if (trimmed.find('\n') != std::string::npos) {
        return ClipItemKind::Text;
    }

    bool hasSpace = trimmed.find(' ') != std::string::npos;

    static const char* const schemes[] = {"http://", "https://", "ftp://"};
    for (const char* scheme : schemes) {
        if (!hasSpace && trimmed.rfind(scheme, 0) == 0 && trimmed.size() > std::char_traits<char>::length(scheme)) {
            return ClipItemKind::Url;
        }
    }

    if (trimmed.size() > 1 && (trimmed[0] == '/' || trimmed.rfind("~/", 0) == 0)) {
        return ClipItemKind::FilePath;
    }

    return ClipItemKind::Text;
}

bool isBlankText(const std::string& text) {
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

int64_t currentTimestampMs() {
    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    );
    return ms.count();
}

std::string clipItemKindToString(ClipItemKind kind) {
    switch (kind) {
        case ClipItemKind::Text: return "text";
        case ClipItemKind::Url: return "url";
        case ClipItemKind::FilePath: return "file";
        case ClipItemKind::Internal: return "internal";
        default: return "text";
    }
}

ClipItemKind stringToClipItemKind(const std::string& str) {
    if (str == "url") return ClipItemKind::Url;
    if (str == "file") return ClipItemKind::FilePath;
    if (str == "internal") return ClipItemKind::Internal;
    return ClipItemKind::Text;  // 默认文本
}

} // namespace cliphist
