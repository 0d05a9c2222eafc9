// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_SESSION_MESSAGE_H_
#define COEDIT_SESSION_MESSAGE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "document/document.h"
#include "ot/operation.h"

namespace coedit {

struct Selection {
  Position start;
  Position end;

  bool operator==(const Selection &) const = default;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(Selection, start, end);
};

// 协作者信息
struct User {
  std::string id;
  std::string name;
  std::string avatar;
  Position cursor;
  Selection selection;
  std::string color;
  bool is_online{true};
  uint64_t last_activity{0};
};

void from_json(const nlohmann::json &j, User &user);
void to_json(nlohmann::json &j, const User &user);

struct UserJoin {
  User user;
};

struct UserLeave {
  std::string user_id;
};

struct DocumentChange {
  Operation op;
};

struct CursorChange {
  std::string user_id;
  Position cursor;
};

struct SelectionChange {
  std::string user_id;
  Selection selection;
};

// 服务端下发的权威快照
struct VersionSync {
  uint64_t version{0};
  std::vector<std::string> content;
};

struct FileSave {
  DocumentSnapshot document;
};

struct LanguageChange {
  std::string language;
};

// 服务端确认某个操作已被应用
struct OperationAck {
  std::string op_id;
  uint64_t version{0};
};

// 顺序与MessageType保持一致(跳过UNKNOWN)
using MessagePayload =
    std::variant<UserJoin, UserLeave, DocumentChange, CursorChange,
                 SelectionChange, VersionSync, FileSave, LanguageChange,
                 OperationAck>;

enum class MessageType : uint32_t {
  UNKNOWN,
  USER_JOIN,
  USER_LEAVE,
  DOCUMENT_CHANGE,
  CURSOR_CHANGE,
  SELECTION_CHANGE,
  VERSION_SYNC,
  FILE_SAVE,
  LANGUAGE_CHANGE,
  ACK
};
NLOHMANN_JSON_SERIALIZE_ENUM(MessageType,
                             {{MessageType::UNKNOWN, nullptr},
                              {MessageType::USER_JOIN, "user_join"},
                              {MessageType::USER_LEAVE, "user_leave"},
                              {MessageType::DOCUMENT_CHANGE, "document_change"},
                              {MessageType::CURSOR_CHANGE, "cursor_change"},
                              {MessageType::SELECTION_CHANGE,
                               "selection_change"},
                              {MessageType::VERSION_SYNC, "version_sync"},
                              {MessageType::FILE_SAVE, "file_save"},
                              {MessageType::LANGUAGE_CHANGE, "language_change"},
                              {MessageType::ACK, "ack"}});

struct Message {
  std::string user_id;
  uint64_t timestamp{0};
  MessagePayload payload;

  inline MessageType type() const {
    return static_cast<MessageType>(payload.index() + 1);
  }
};

// 解析失败、未知类型或者携带未知操作类型时返回std::nullopt，不会抛出异常
std::optional<Message> decode_message(const std::string &data);

std::string encode_message(const Message &msg);

} // namespace coedit

#endif
