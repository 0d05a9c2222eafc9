// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_DOCUMENT_OPERATION_QUEUE_H_
#define COEDIT_DOCUMENT_OPERATION_QUEUE_H_

#include <cstdint>
#include <list>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/timer.h"
#include "ot/operation.h"

namespace coedit {

namespace {
// 本地操作广播后在队列中保留的时间，超时即视为已被对端确认
constexpr static uint32_t kOperationExpireMillis = 5000;
// 过期时间轮的刻度，单位毫秒
constexpr static uint32_t kTickMillis = 100;
} // namespace

// 每个客户端一个，保存已广播但尚未确认的本地操作，按时间戳排序
// 远端操作到达时依次与这些操作做变换，得到可在本地状态上应用的操作
class OperationQueue {
public:
  explicit OperationQueue(uint32_t expire_millis = kOperationExpireMillis,
                          uint32_t tick_millis = kTickMillis);
  ~OperationQueue() = default;

  OperationQueue(const OperationQueue &) = delete;
  OperationQueue &operator=(const OperationQueue &) = delete;

  // 加入一个已广播的本地操作并开始计时，id重复时返回false
  bool Push(Operation op);

  // 收到确认后移除，返回该操作是否仍在队列中
  bool Acknowledge(const std::string &op_id);

  // 将远端操作依次与时间戳更早的待确认操作变换
  // 只向前传递远端一侧的结果，队列中的操作不会被修改
  Operation Reconcile(Operation remote) const;

  // 推进过期时间轮，返回本次过期移除的操作数量
  size_t Tick();
  size_t Update();

  inline size_t size() const { return entries_.size(); }
  inline bool empty() const { return entries_.empty(); }
  inline bool Contains(const std::string &op_id) const {
    return index_.count(op_id) != 0;
  }
  inline uint32_t expire_millis() const { return expire_millis_; }

  // 按时间戳顺序返回待确认的操作
  std::vector<Operation> Pending() const;

  void Clear();

private:
  struct pending_entry {
    Operation op;
    TimeWheel::timer_node timer;
    pending_entry(Operation operation, TimeWheel::TimerCallBack callback)
        : op(std::move(operation)), timer(std::move(callback)) {}
  };

  size_t RemoveExpired();

  TimeWheel wheel_;
  uint32_t expire_millis_;
  std::list<pending_entry> entries_;
  std::unordered_map<std::string, std::list<pending_entry>::iterator> index_;
  // 时间轮回调中只记录过期的id，推进结束后再统一移除
  std::vector<std::string> expired_;
};

} // namespace coedit

#endif
