// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "document.h"

#include <algorithm>
#include <iterator>
#include <limits>

#include <spdlog/spdlog.h>

#include "utils/helpers.h"
#include "utils/json_field.h"

namespace coedit {

namespace {
// 插入可以补齐空行的上限，超出的操作直接拒绝
constexpr static uint32_t kMaxLines = 1 << 20;
} // namespace

void from_json(const nlohmann::json &j, DocumentSnapshot &snapshot) {
  snapshot.id = j.at("id").get<std::string>();
  snapshot.title = j.value("title", std::string{});
  snapshot.content = j.at("content").get<std::vector<std::string>>();
  snapshot.language = j.value("language", std::string{});
  snapshot.created_at = get_unsigned_or<uint64_t>(j, "createdAt", 0);
  snapshot.last_modified = get_unsigned_or<uint64_t>(j, "lastModified", 0);
  snapshot.version = get_unsigned<uint64_t>(j, "version");
  snapshot.collaborators =
      j.value("collaborators", std::vector<std::string>{});
}

void to_json(nlohmann::json &j, const DocumentSnapshot &snapshot) {
  j["id"] = snapshot.id;
  j["title"] = snapshot.title;
  j["content"] = snapshot.content;
  j["language"] = snapshot.language;
  j["createdAt"] = snapshot.created_at;
  j["lastModified"] = snapshot.last_modified;
  j["version"] = snapshot.version;
  j["collaborators"] = snapshot.collaborators;
}

Document::Document(std::string id, std::string title, std::string language)
    : id_(std::move(id)), title_(std::move(title)),
      language_(std::move(language)) {
  created_at_ = get_realtime_millis();
  last_modified_ = created_at_;
}

bool Document::Apply(const Operation &op) {
  // 版本号只增不减，达到上限后不再接受任何操作
  if (version_ == std::numeric_limits<uint64_t>::max()) {
    spdlog::error("document {}: version exhausted, refuse operation {}", id_,
                  op.id);
    return false;
  }
  switch (op.type) {
  case OpType::INSERT: {
    if (op.position.line >= kMaxLines) {
      spdlog::warn("document {}: refuse insert {} at line {} (limit {})", id_,
                   op.id, op.position.line, kMaxLines);
      return false;
    }
    InsertContent(op.position, op.content);
    break;
  }
  case OpType::DELETE: {
    DeleteContent(op.position, op.Length());
    break;
  }
  case OpType::RETAIN:
  case OpType::CURSOR:
  case OpType::SELECTION: {
    // 不修改内容，但同样推进版本
    break;
  }
  default: {
    spdlog::warn("document {}: refuse to apply operation {} of unknown type",
                 id_, op.id);
    return false;
  }
  }
  ++version_;
  Touch();
  return true;
}

bool Document::SyncVersion(uint64_t version, std::vector<std::string> content) {
  if (version <= version_) {
    spdlog::debug("document {}: ignore version sync {} (local version {})",
                  id_, version, version_);
    return false;
  }
  if (content.empty())
    content.emplace_back();
  lines_ = std::move(content);
  version_ = version;
  Touch();
  return true;
}

std::string Document::Text() const {
  std::string text;
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i != 0)
      text.push_back('\n');
    text.append(lines_[i]);
  }
  return text;
}

void Document::SetTitle(std::string title) {
  title_ = std::move(title);
  Touch();
}

void Document::SetLanguage(std::string language) {
  language_ = std::move(language);
}

bool Document::AddCollaborator(const std::string &user_id) {
  return collaborators_.insert(user_id).second;
}

bool Document::RemoveCollaborator(const std::string &user_id) {
  return collaborators_.erase(user_id) > 0;
}

DocumentSnapshot Document::Snapshot() const {
  return {.id = id_,
          .title = title_,
          .content = lines_,
          .language = language_,
          .created_at = created_at_,
          .last_modified = last_modified_,
          .version = version_,
          .collaborators = {collaborators_.begin(), collaborators_.end()}};
}

void Document::InsertContent(const Position &position,
                             const std::string &content) {
  // 目标行不存在时补齐空行，插入永远不会失败
  while (position.line >= lines_.size()) {
    lines_.emplace_back();
  }
  std::string &line = lines_[position.line];
  size_t column = std::min<size_t>(position.column, line.length());
  if (content.find('\n') == std::string::npos) {
    line.insert(column, content);
    return;
  }
  // 插入内容包含换行符，将该行拆分为多行
  std::string merged = line.substr(0, column) + content + line.substr(column);
  std::vector<std::string> parts;
  size_t begin = 0;
  size_t end;
  while ((end = merged.find('\n', begin)) != std::string::npos) {
    parts.emplace_back(merged.substr(begin, end - begin));
    begin = end + 1;
  }
  parts.emplace_back(merged.substr(begin));
  lines_[position.line] = std::move(parts[0]);
  lines_.insert(lines_.begin() + position.line + 1,
                std::make_move_iterator(parts.begin() + 1),
                std::make_move_iterator(parts.end()));
}

void Document::DeleteContent(const Position &position, uint32_t length) {
  // 零长度删除(包括合并后退化的删除)不修改内容
  if (length == 0)
    return;
  if (position.line >= lines_.size()) {
    spdlog::debug("document {}: delete at line {} beyond {} lines ignored", id_,
                  position.line, lines_.size());
    return;
  }
  std::string &line = lines_[position.line];
  if (position.column > 0) {
    // 向前删除，删除光标之前的length个字符
    size_t column = std::min<size_t>(position.column, line.length());
    size_t count = std::min<size_t>(length, column);
    line.erase(column - count, count);
  } else if (position.line > 0) {
    // 行首删除即删除换行符，与上一行合并
    lines_[position.line - 1].append(line);
    lines_.erase(lines_.begin() + position.line);
  }
}

void Document::Touch() { last_modified_ = get_realtime_millis(); }

} // namespace coedit
