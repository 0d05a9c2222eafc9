// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_SESSION_SESSION_H_
#define COEDIT_SESSION_SESSION_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "document/document.h"
#include "document/operation_queue.h"
#include "session/message.h"
#include "transport.h"

namespace coedit {

struct SessionOptions {
  std::string user_id;
  std::string document_id;
  std::string title{"Untitled Document"};
  std::string language{"javascript"};
  uint32_t expire_millis{kOperationExpireMillis};
  uint32_t tick_millis{kTickMillis};
  // 操作时间戳的来源，为空时使用墙上时钟
  std::function<uint64_t()> clock;
};

// 单个客户端的协作会话，持有本地文档副本和待确认操作队列
// 所有方法必须在同一个线程中调用
class Session {
public:
  Session(SessionOptions options, Transport *transport);
  ~Session() = default;

  Session(const Session &) = delete;
  Session &operator=(const Session &) = delete;

  // 本地编辑：生成操作、应用到本地文档、加入待确认队列并广播
  // 位置无法编码或者内容为空时不产生操作
  std::optional<Operation> ApplyLocalInsert(Position position,
                                            std::string content);
  std::optional<Operation> ApplyLocalDelete(Position position,
                                            uint32_t length = 1);

  // 远端操作先与待确认的本地操作变换，再应用到本地文档
  bool ReceiveRemoteOperation(const Operation &op);

  bool ReceiveVersionSync(uint64_t version, std::vector<std::string> content);

  // 处理一条来自传输层的消息，无法解析的消息被丢弃
  bool HandleMessage(const std::string &data);
  void Dispatch(const Message &msg);

  void UpdateCursor(Position cursor);
  void UpdateSelection(Selection selection);
  void ChangeLanguage(std::string language);
  void SetTitle(std::string title);
  // 将当前文档快照发送给服务端保存
  bool SaveDocument();

  // 驱动待确认队列的过期计时
  inline size_t Tick() { return queue_.Tick(); }
  inline size_t Update() { return queue_.Update(); }

  inline const std::string &user_id() const { return options_.user_id; }
  inline const Position &cursor() const { return cursor_; }
  inline const Selection &selection() const { return selection_; }
  inline const Document &document() const { return document_; }
  inline const OperationQueue &queue() const { return queue_; }
  inline const std::unordered_map<std::string, User> &users() const {
    return users_;
  }

private:
  void OnMessage(const std::string &sender, const UserJoin &payload);
  void OnMessage(const std::string &sender, const UserLeave &payload);
  void OnMessage(const std::string &sender, const DocumentChange &payload);
  void OnMessage(const std::string &sender, const CursorChange &payload);
  void OnMessage(const std::string &sender, const SelectionChange &payload);
  void OnMessage(const std::string &sender, const VersionSync &payload);
  void OnMessage(const std::string &sender, const FileSave &payload);
  void OnMessage(const std::string &sender, const LanguageChange &payload);
  void OnMessage(const std::string &sender, const OperationAck &payload);

  std::optional<Operation> CommitLocal(Operation op);
  bool Broadcast(MessagePayload payload);
  // 严格递增的时间戳
  uint64_t NextTimestamp();
  uint64_t Now() const;

  SessionOptions options_;
  Transport *transport_;
  Document document_;
  OperationQueue queue_;
  std::unordered_map<std::string, User> users_;
  Position cursor_;
  Selection selection_;
  uint64_t last_timestamp_{0};
};

} // namespace coedit

#endif
