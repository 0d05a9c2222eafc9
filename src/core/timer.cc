// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "timer.h"

#include <vector>

#include "utils/helpers.h"

namespace coedit {

TimeWheel::TimeWheel(uint32_t tick) : tick_(tick == 0 ? 1 : tick) {
  start_millis_ = get_current_millis();
}

TimeWheel::~TimeWheel() {
  // 时间轮先于定时器销毁时，断开所有定时器与槽位的联系
  for (auto &slot : slots_) {
    while (slot.first) {
      timer_node *timer = slot.first;
      timer->unlink();
      timer->pending = false;
    }
  }
}

void TimeWheel::timer_cancel(TimeWheel::timer_node *timer) {
  timer->unlink();
  timer->pending = false;
}

void TimeWheel::AddTimer(TimeWheel::timer_node *timer, uint32_t millis) {
  timer_cancel(timer);
  uint64_t ticks = millis / tick_;
  if (ticks == 0)
    ticks = 1;
  timer->expires_ = current_tick_ + ticks;
  timer->rounds_ = (ticks - 1) / kTimeWheelSlots;
  timer->flag = false;
  timer->pending = true;
  __insert(&slots_[timer->expires_ & (kTimeWheelSlots - 1)], timer);
}

void TimeWheel::Tick() {
  ++current_tick_;
  timer_head *head = &slots_[current_tick_ & (kTimeWheelSlots - 1)];
  // 先摘下所有到期的定时器，再逐个触发，回调中可以安全地添加或取消定时器
  std::vector<timer_node *> fired;
  timer_node *timer = head->first;
  while (timer) {
    timer_node *next_timer = timer->next;
    if (timer->rounds_ > 0) {
      --timer->rounds_;
    } else {
      timer->unlink();
      fired.push_back(timer);
    }
    timer = next_timer;
  }
  for (timer_node *node : fired) {
    // 被同一刻度内先触发的回调取消
    if (!node->pending)
      continue;
    node->pending = false;
    node->flag = true;
    node->callback_();
  }
}

void TimeWheel::Update() {
  uint64_t now = get_current_millis();
  uint64_t target_ticks = (now - start_millis_) / tick_;
  while (current_tick_ < target_ticks)
    Tick();
}

size_t TimeWheel::size() const {
  size_t count = 0;
  for (const auto &slot : slots_) {
    for (timer_node *timer = slot.first; timer; timer = timer->next) {
      ++count;
    }
  }
  return count;
}

} // namespace coedit
