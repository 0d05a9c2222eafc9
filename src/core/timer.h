// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_CORE_TIMER_H_
#define COEDIT_CORE_TIMER_H_

#include <cstdint>
#include <functional>

namespace coedit {

namespace {
// 时间轮槽位数量，必须是2的幂
constexpr static uint32_t kTimeWheelSlots = 256;
} // namespace

// 单层哈希时间轮，超出一圈的定时器通过剩余圈数区分
// 非线程安全，由持有者所在的线程驱动
class TimeWheel {
public:
  using TimerCallBack = std::function<void()>;
  // 时间轮间隔，单位毫秒
  explicit TimeWheel(uint32_t tick = 100);
  ~TimeWheel();

  TimeWheel(const TimeWheel &) = delete;
  TimeWheel &operator=(const TimeWheel &) = delete;

  struct timer_node {
    uint64_t expires_;
    uint64_t rounds_;
    TimerCallBack callback_;
    timer_node *next, **pprev;
    bool pending;
    bool flag;
    explicit timer_node(TimerCallBack callback)
        : expires_(0), rounds_(0), callback_(std::move(callback)),
          next(nullptr), pprev(nullptr), pending(false), flag(false) {}
    // 防止对象销毁后破坏链表结构
    ~timer_node() { unlink(); }
    timer_node(const timer_node &) = delete;
    timer_node &operator=(const timer_node &) = delete;

    inline bool IsFired() const { return flag; }
    inline bool IsPending() const { return pending; }

    inline void unlink() {
      if (pprev)
        *pprev = next;
      if (next)
        next->pprev = pprev;
      next = nullptr;
      pprev = nullptr;
    }
  };

  // 取消一个尚未触发的定时器，已触发或未添加的定时器不受影响
  static void timer_cancel(timer_node *timer);

  // 添加一个n毫秒的计时器，已在时间轮中的计时器会被重新调度
  void AddTimer(timer_node *timer, uint32_t millis);

  // 推进一个刻度，触发到期的定时器
  // 回调函数中不能销毁同一刻度内到期的其他定时器
  void Tick();

  // 按照单调时钟补齐落后的刻度
  void Update();

  inline uint32_t tick_millis() const { return tick_; }
  inline uint64_t current_tick() const { return current_tick_; }
  // 时间轮中等待触发的定时器数量
  size_t size() const;

private:
  struct timer_head {
    timer_node *first{nullptr};
  };

  inline static void __insert(timer_head *head, timer_node *timer) {
    timer->next = head->first;
    if (head->first) {
      head->first->pprev = &timer->next;
    }
    timer->pprev = &head->first;
    head->first = timer;
  }

  timer_head slots_[kTimeWheelSlots];

  uint64_t current_tick_{0};
  uint64_t start_millis_;
  uint32_t tick_;
};

} // namespace coedit

#endif
