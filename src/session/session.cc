// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "session.h"

#include <spdlog/spdlog.h>

#include "utils/helpers.h"

namespace coedit {

Session::Session(SessionOptions options, Transport *transport)
    : options_(std::move(options)), transport_(transport),
      document_(options_.document_id, options_.title, options_.language),
      queue_(options_.expire_millis, options_.tick_millis) {
  document_.AddCollaborator(options_.user_id);
}

std::optional<Operation> Session::ApplyLocalInsert(Position position,
                                                   std::string content) {
  if (!position_is_encodable(position)) {
    spdlog::warn("user {}: column {} exceeds the encodable limit {}, insert "
                 "refused",
                 options_.user_id, position.column, kColumnStride - 1);
    return std::nullopt;
  }
  if (content.empty())
    return std::nullopt;
  uint64_t timestamp = NextTimestamp();
  return CommitLocal(Operation::Insert(
      generate_operation_id(options_.user_id, timestamp), position,
      std::move(content), options_.user_id, timestamp, document_.version()));
}

std::optional<Operation> Session::ApplyLocalDelete(Position position,
                                                   uint32_t length) {
  if (!position_is_encodable(position)) {
    spdlog::warn("user {}: column {} exceeds the encodable limit {}, delete "
                 "refused",
                 options_.user_id, position.column, kColumnStride - 1);
    return std::nullopt;
  }
  if (length == 0)
    return std::nullopt;
  uint64_t timestamp = NextTimestamp();
  return CommitLocal(Operation::Delete(
      generate_operation_id(options_.user_id, timestamp), position, length,
      options_.user_id, timestamp, document_.version()));
}

std::optional<Operation> Session::CommitLocal(Operation op) {
  if (!document_.Apply(op))
    return std::nullopt;
  queue_.Push(op);
  Broadcast(DocumentChange{.op = op});
  return op;
}

bool Session::ReceiveRemoteOperation(const Operation &op) {
  Operation transformed = queue_.Reconcile(op);
  spdlog::debug("user {}: apply remote operation {} from {} at ({}, {})",
                options_.user_id, transformed.id, transformed.user_id,
                transformed.position.line, transformed.position.column);
  return document_.Apply(transformed);
}

bool Session::ReceiveVersionSync(uint64_t version,
                                 std::vector<std::string> content) {
  if (!document_.SyncVersion(version, std::move(content)))
    return false;
  spdlog::info("user {}: document {} synchronized to version {}",
               options_.user_id, document_.id(), version);
  return true;
}

bool Session::HandleMessage(const std::string &data) {
  std::optional<Message> msg = decode_message(data);
  if (!msg)
    return false;
  Dispatch(*msg);
  return true;
}

void Session::Dispatch(const Message &msg) {
  std::visit(
      [this, &msg](const auto &payload) { OnMessage(msg.user_id, payload); },
      msg.payload);
}

void Session::UpdateCursor(Position cursor) {
  cursor_ = cursor;
  Broadcast(CursorChange{.user_id = options_.user_id, .cursor = cursor});
}

void Session::UpdateSelection(Selection selection) {
  selection_ = selection;
  Broadcast(
      SelectionChange{.user_id = options_.user_id, .selection = selection});
}

void Session::ChangeLanguage(std::string language) {
  document_.SetLanguage(language);
  Broadcast(LanguageChange{.language = std::move(language)});
}

void Session::SetTitle(std::string title) {
  document_.SetTitle(std::move(title));
}

bool Session::SaveDocument() {
  return Broadcast(FileSave{.document = document_.Snapshot()});
}

void Session::OnMessage(const std::string &sender, const UserJoin &payload) {
  if (payload.user.id == options_.user_id)
    return;
  spdlog::info("user {} joined document {} (announced by {})",
               payload.user.id, document_.id(), sender);
  users_[payload.user.id] = payload.user;
  document_.AddCollaborator(payload.user.id);
}

void Session::OnMessage(const std::string &sender, const UserLeave &payload) {
  if (users_.erase(payload.user_id) == 0) {
    spdlog::debug("leave message for unknown user {} from {}", payload.user_id,
                  sender);
  }
  document_.RemoveCollaborator(payload.user_id);
  spdlog::info("user {} left document {}", payload.user_id, document_.id());
}

void Session::OnMessage(const std::string &sender,
                        const DocumentChange &payload) {
  // 服务端回显的本地操作已经应用过
  if (payload.op.user_id == options_.user_id) {
    spdlog::debug("ignore echo of local operation {}", payload.op.id);
    return;
  }
  if (!ReceiveRemoteOperation(payload.op)) {
    spdlog::warn("remote operation {} from {} was not applied", payload.op.id,
                 sender);
  }
}

void Session::OnMessage(const std::string &sender,
                        const CursorChange &payload) {
  auto it = users_.find(payload.user_id);
  if (it == users_.end()) {
    spdlog::debug("cursor change for unknown user {} from {}",
                  payload.user_id, sender);
    return;
  }
  it->second.cursor = payload.cursor;
  it->second.last_activity = Now();
}

void Session::OnMessage(const std::string &sender,
                        const SelectionChange &payload) {
  auto it = users_.find(payload.user_id);
  if (it == users_.end()) {
    spdlog::debug("selection change for unknown user {} from {}",
                  payload.user_id, sender);
    return;
  }
  it->second.selection = payload.selection;
  it->second.last_activity = Now();
}

void Session::OnMessage(const std::string &sender, const VersionSync &payload) {
  if (!ReceiveVersionSync(payload.version, payload.content)) {
    spdlog::debug("stale version sync {} from {} ignored", payload.version,
                  sender);
  }
}

void Session::OnMessage(const std::string &sender, const FileSave &payload) {
  spdlog::info("document {} saved by {} at version {}", payload.document.id,
               sender, payload.document.version);
}

void Session::OnMessage(const std::string &sender,
                        const LanguageChange &payload) {
  spdlog::info("user {} changed language of document {} to {}", sender,
               document_.id(), payload.language);
  document_.SetLanguage(payload.language);
}

void Session::OnMessage(const std::string &sender,
                        const OperationAck &payload) {
  if (queue_.Acknowledge(payload.op_id)) {
    spdlog::debug("operation {} acknowledged by {} at version {}",
                  payload.op_id, sender, payload.version);
  }
}

bool Session::Broadcast(MessagePayload payload) {
  if (transport_ == nullptr) {
    spdlog::warn("user {}: no transport attached, message dropped",
                 options_.user_id);
    return false;
  }
  Message msg{.user_id = options_.user_id,
              .timestamp = Now(),
              .payload = std::move(payload)};
  if (!transport_->Send(encode_message(msg))) {
    spdlog::error("user {}: send message failed", options_.user_id);
    return false;
  }
  return true;
}

uint64_t Session::NextTimestamp() {
  uint64_t now = Now();
  if (now <= last_timestamp_)
    now = last_timestamp_ + 1;
  last_timestamp_ = now;
  return now;
}

uint64_t Session::Now() const {
  return options_.clock ? options_.clock() : get_realtime_millis();
}

} // namespace coedit
