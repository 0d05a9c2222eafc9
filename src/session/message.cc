// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "message.h"

#include <spdlog/spdlog.h>

#include "utils/json_field.h"

namespace coedit {

void from_json(const nlohmann::json &j, User &user) {
  user.id = j.at("id").get<std::string>();
  user.name = j.value("name", std::string{});
  user.avatar = j.value("avatar", std::string{});
  user.cursor = j.value("cursor", Position{});
  user.selection = j.value("selection", Selection{});
  user.color = j.value("color", std::string{});
  user.is_online = j.value("isOnline", true);
  user.last_activity = get_unsigned_or<uint64_t>(j, "lastActivity", 0);
}

void to_json(nlohmann::json &j, const User &user) {
  j["id"] = user.id;
  j["name"] = user.name;
  j["avatar"] = user.avatar;
  j["cursor"] = user.cursor;
  j["selection"] = user.selection;
  j["color"] = user.color;
  j["isOnline"] = user.is_online;
  j["lastActivity"] = user.last_activity;
}

namespace {

MessagePayload parse_payload(MessageType type, const nlohmann::json &j) {
  switch (type) {
  case MessageType::USER_JOIN:
    return UserJoin{.user = j.get<User>()};
  case MessageType::USER_LEAVE:
    return UserLeave{.user_id = j.at("userId").get<std::string>()};
  case MessageType::DOCUMENT_CHANGE:
    return DocumentChange{.op = j.get<Operation>()};
  case MessageType::CURSOR_CHANGE:
    return CursorChange{.user_id = j.at("userId").get<std::string>(),
                        .cursor = j.at("cursor").get<Position>()};
  case MessageType::SELECTION_CHANGE:
    return SelectionChange{.user_id = j.at("userId").get<std::string>(),
                           .selection = j.at("selection").get<Selection>()};
  case MessageType::VERSION_SYNC:
    return VersionSync{
        .version = get_unsigned<uint64_t>(j, "version"),
        .content = j.at("content").get<std::vector<std::string>>()};
  case MessageType::FILE_SAVE:
    return FileSave{.document = j.at("document").get<DocumentSnapshot>()};
  case MessageType::LANGUAGE_CHANGE:
    return LanguageChange{.language = j.at("language").get<std::string>()};
  case MessageType::ACK:
    return OperationAck{.op_id = j.at("id").get<std::string>(),
                        .version = get_unsigned_or<uint64_t>(j, "version", 0)};
  default:
    // 调用方已经过滤了未知类型
    return OperationAck{};
  }
}

struct payload_serializer {
  nlohmann::json operator()(const UserJoin &p) const { return p.user; }
  nlohmann::json operator()(const UserLeave &p) const {
    return {{"userId", p.user_id}};
  }
  nlohmann::json operator()(const DocumentChange &p) const { return p.op; }
  nlohmann::json operator()(const CursorChange &p) const {
    return {{"userId", p.user_id}, {"cursor", p.cursor}};
  }
  nlohmann::json operator()(const SelectionChange &p) const {
    return {{"userId", p.user_id}, {"selection", p.selection}};
  }
  nlohmann::json operator()(const VersionSync &p) const {
    return {{"version", p.version}, {"content", p.content}};
  }
  nlohmann::json operator()(const FileSave &p) const {
    return {{"document", p.document}};
  }
  nlohmann::json operator()(const LanguageChange &p) const {
    return {{"language", p.language}};
  }
  nlohmann::json operator()(const OperationAck &p) const {
    return {{"id", p.op_id}, {"version", p.version}};
  }
};

} // namespace

std::optional<Message> decode_message(const std::string &data) {
  try {
    nlohmann::json j = nlohmann::json::parse(data);
    MessageType type = j.at("type").get<MessageType>();
    if (type == MessageType::UNKNOWN) {
      spdlog::warn("drop message of unknown type: {}", j.at("type").dump());
      return std::nullopt;
    }
    Message msg{.user_id = j.value("userId", std::string{}),
                .timestamp = get_unsigned_or<uint64_t>(j, "timestamp", 0),
                .payload = parse_payload(type, j.at("payload"))};
    if (auto *change = std::get_if<DocumentChange>(&msg.payload)) {
      if (change->op.type == OpType::UNKNOWN) {
        spdlog::warn("drop operation {} of unknown type", change->op.id);
        return std::nullopt;
      }
    }
    return msg;
  } catch (const nlohmann::json::exception &e) {
    spdlog::error("malformed message dropped. error: {}", e.what());
    return std::nullopt;
  } catch (const std::out_of_range &e) {
    spdlog::error("message with out of range field dropped. error: {}",
                  e.what());
    return std::nullopt;
  }
}

std::string encode_message(const Message &msg) {
  nlohmann::json j;
  j["type"] = msg.type();
  j["payload"] = std::visit(payload_serializer{}, msg.payload);
  j["userId"] = msg.user_id;
  j["timestamp"] = msg.timestamp;
  return j.dump();
}

} // namespace coedit
