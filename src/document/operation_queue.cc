// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "operation_queue.h"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "ot/transform.h"

namespace coedit {

OperationQueue::OperationQueue(uint32_t expire_millis, uint32_t tick_millis)
    : wheel_(tick_millis), expire_millis_(expire_millis) {}

bool OperationQueue::Push(Operation op) {
  if (index_.count(op.id)) {
    spdlog::warn("operation {} is already pending", op.id);
    return false;
  }
  // 保持时间戳升序，相同时间戳按加入顺序
  auto pos = std::upper_bound(
      entries_.begin(), entries_.end(), op.timestamp,
      [](uint64_t timestamp, const pending_entry &entry) {
        return timestamp < entry.op.timestamp;
      });
  std::string op_id = op.id;
  auto it = entries_.emplace(pos, std::move(op),
                             [this, op_id]() { expired_.push_back(op_id); });
  index_.emplace(std::move(op_id), it);
  wheel_.AddTimer(&it->timer, expire_millis_);
  return true;
}

bool OperationQueue::Acknowledge(const std::string &op_id) {
  auto it = index_.find(op_id);
  if (it == index_.end())
    return false;
  entries_.erase(it->second);
  index_.erase(it);
  return true;
}

Operation OperationQueue::Reconcile(Operation remote) const {
  for (const auto &entry : entries_) {
    // 时间戳不早于远端操作的本地操作，对方在生成操作时可能已经看到
    if (entry.op.timestamp >= remote.timestamp)
      continue;
    remote = transform(entry.op, remote).second;
  }
  return remote;
}

size_t OperationQueue::Tick() {
  wheel_.Tick();
  return RemoveExpired();
}

size_t OperationQueue::Update() {
  wheel_.Update();
  return RemoveExpired();
}

std::vector<Operation> OperationQueue::Pending() const {
  std::vector<Operation> result;
  result.reserve(entries_.size());
  for (const auto &entry : entries_) {
    result.push_back(entry.op);
  }
  return result;
}

void OperationQueue::Clear() {
  entries_.clear();
  index_.clear();
  expired_.clear();
}

size_t OperationQueue::RemoveExpired() {
  size_t removed = 0;
  for (const auto &op_id : expired_) {
    if (Acknowledge(op_id)) {
      spdlog::debug("pending operation {} expired without acknowledgment",
                    op_id);
      ++removed;
    }
  }
  expired_.clear();
  return removed;
}

} // namespace coedit
