// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_DOCUMENT_DOCUMENT_H_
#define COEDIT_DOCUMENT_DOCUMENT_H_

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ot/operation.h"

namespace coedit {

// 文档快照，用于保存文档时发送
struct DocumentSnapshot {
  std::string id;
  std::string title;
  std::vector<std::string> content;
  std::string language;
  uint64_t created_at{0};
  uint64_t last_modified{0};
  uint64_t version{0};
  std::vector<std::string> collaborators;
};

void from_json(const nlohmann::json &j, DocumentSnapshot &snapshot);
void to_json(nlohmann::json &j, const DocumentSnapshot &snapshot);

// 本地文档副本，只能向前应用操作，不支持回滚
// 非线程安全，由所属会话的线程独占修改
class Document {
public:
  explicit Document(std::string id, std::string title = "Untitled Document",
                    std::string language = "javascript");
  ~Document() = default;

  // 应用一个操作，成功后版本号加一
  // 越界的位置会被就地修复(插入时扩展行，删除时忽略)，未知类型的操作被拒绝
  // 插入行号过大或版本号已达上限时拒绝，内容和版本号均不变
  bool Apply(const Operation &op);

  // 版本同步，只接受比本地更新的版本，整体替换内容和版本号
  bool SyncVersion(uint64_t version, std::vector<std::string> content);

  inline const std::string &id() const { return id_; }
  inline const std::string &title() const { return title_; }
  inline const std::string &language() const { return language_; }
  inline uint64_t version() const { return version_; }
  inline uint64_t created_at() const { return created_at_; }
  inline uint64_t last_modified() const { return last_modified_; }
  inline const std::vector<std::string> &content() const { return lines_; }
  inline const std::set<std::string> &collaborators() const {
    return collaborators_;
  }

  // 以换行符拼接所有行
  std::string Text() const;

  void SetTitle(std::string title);
  void SetLanguage(std::string language);

  bool AddCollaborator(const std::string &user_id);
  bool RemoveCollaborator(const std::string &user_id);

  DocumentSnapshot Snapshot() const;

private:
  void InsertContent(const Position &position, const std::string &content);
  void DeleteContent(const Position &position, uint32_t length);
  void Touch();

  std::string id_;
  std::string title_;
  std::string language_;
  // 至少有一行，空文档为一个空行
  std::vector<std::string> lines_{""};
  uint64_t version_{0};
  uint64_t created_at_;
  uint64_t last_modified_;
  std::set<std::string> collaborators_;
};

} // namespace coedit

#endif
