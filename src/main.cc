// Copyright (c) 2025 Juantgd. All Rights Reserved.

#include <cstdint>
#include <deque>
#include <string>

#include <spdlog/cfg/env.h>
#include <spdlog/spdlog.h>

#include "session/session.h"

namespace {

// 进程内回环传输，消息先放入发件箱，由主循环转发给其他副本
class LoopbackTransport : public coedit::Transport {
public:
  bool Send(std::string data) override {
    outbox_.push_back(std::move(data));
    return true;
  }

  void DeliverTo(coedit::Session &peer) {
    while (!outbox_.empty()) {
      peer.HandleMessage(outbox_.front());
      outbox_.pop_front();
    }
  }

private:
  std::deque<std::string> outbox_;
};

} // namespace

int main() {
  // 日志级别由环境变量 SPDLOG_LEVEL 控制，例如 SPDLOG_LEVEL=debug
  spdlog::cfg::load_env_levels();

  // 两个副本共享一个逻辑时钟，保证演示结果可重复
  uint64_t logical_clock = 0;
  auto clock = [&logical_clock]() { return ++logical_clock; };

  LoopbackTransport alice_link;
  LoopbackTransport bob_link;
  coedit::Session alice(
      {.user_id = "alice", .document_id = "demo", .clock = clock},
      &alice_link);
  coedit::Session bob({.user_id = "bob", .document_id = "demo", .clock = clock},
                      &bob_link);

  auto seed = alice.ApplyLocalInsert({.line = 0, .column = 0}, "hello world");
  if (!seed) {
    spdlog::error("seed insert failed");
    return 1;
  }
  alice_link.DeliverTo(bob);
  // 充当服务端确认，之后的远端操作不再与该操作变换
  alice.Dispatch({.user_id = "server",
                  .timestamp = clock(),
                  .payload = coedit::OperationAck{.op_id = seed->id,
                                                  .version = 1}});

  // 两个副本基于同一版本并发编辑
  alice.ApplyLocalInsert({.line = 0, .column = 5}, "X");
  bob.ApplyLocalDelete({.line = 0, .column = 6}, 1);
  alice_link.DeliverTo(bob);
  bob_link.DeliverTo(alice);

  spdlog::info("alice: \"{}\" (version {})", alice.document().Text(),
               alice.document().version());
  spdlog::info("bob:   \"{}\" (version {})", bob.document().Text(),
               bob.document().version());
  if (alice.document().Text() != bob.document().Text()) {
    spdlog::error("replicas diverged");
    return 1;
  }
  spdlog::info("replicas converged");
  return 0;
}
