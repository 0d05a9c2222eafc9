// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "core/timer.h"

#include <gtest/gtest.h>

TEST(TimerTest, TimerBasicTest) {
  using namespace coedit;
  {
    TimeWheel tw;
    int count = 0;
    TimeWheel::timer_node timer1([&count]() { ++count; });
    TimeWheel::timer_node timer2([&count]() { ++count; });
    // 100ms后触发,即调用1次Tick触发
    tw.AddTimer(&timer1, 100);
    tw.AddTimer(&timer2, 100);
    ASSERT_EQ(tw.size(), 2);
    ASSERT_EQ(count, 0);
    tw.Tick();
    ASSERT_EQ(count, 2);
    ASSERT_EQ(tw.size(), 0);

    ASSERT_EQ(timer1.IsFired(), true);
    ASSERT_EQ(timer2.IsFired(), true);
  }
  {
    TimeWheel tw;
    int count = 0;
    TimeWheel::timer_node timer1([&count]() { ++count; });
    TimeWheel::timer_node timer2([&count]() { ++count; });
    // 1s后触发,即调用10次Tick触发
    tw.AddTimer(&timer1, 1000);
    for (int i = 0; i < 5; ++i)
      tw.Tick();
    // 添加一个500ms后触发的超时事件，即和timer1同时触发
    tw.AddTimer(&timer2, 500);
    for (int i = 0; i < 4; ++i)
      tw.Tick();
    ASSERT_EQ(count, 0);
    tw.Tick();
    ASSERT_EQ(timer1.IsFired(), true);
    ASSERT_EQ(timer2.IsFired(), true);
    ASSERT_EQ(count, 2);
  }
  {
    // 10ms一个刻度，超过一圈的定时器
    TimeWheel tw(10);
    int count = 0;
    TimeWheel::timer_node t1([&]() { ++count; });
    TimeWheel::timer_node t2([&]() { ++count; });
    TimeWheel::timer_node t3([&]() { ++count; });
    tw.AddTimer(&t1, 2560);
    tw.AddTimer(&t2, 2570);
    tw.AddTimer(&t3, 5130);
    for (int i = 0; i < 255; ++i) {
      tw.Tick();
    }
    ASSERT_EQ(count, 0);
    tw.Tick();
    ASSERT_EQ(count, 1);
    tw.Tick();
    ASSERT_EQ(count, 2);
    for (int i = 0; i < 255; ++i) {
      tw.Tick();
    }
    ASSERT_EQ(count, 2);
    tw.Tick();
    ASSERT_EQ(count, 3);
  }
}

TEST(TimerTest, TimerCancelTest) {
  using namespace coedit;
  {
    TimeWheel tw;
    int count = 0;
    TimeWheel::timer_node timer1([&count]() { ++count; });
    TimeWheel::timer_node timer2([&count]() { ++count; });
    tw.AddTimer(&timer1, 300);
    tw.AddTimer(&timer2, 300);
    TimeWheel::timer_cancel(&timer1);
    ASSERT_FALSE(timer1.IsPending());
    ASSERT_EQ(tw.size(), 1);
    for (int i = 0; i < 3; ++i)
      tw.Tick();
    ASSERT_EQ(count, 1);
    ASSERT_FALSE(timer1.IsFired());
    ASSERT_TRUE(timer2.IsFired());
  }
  {
    // 定时器先于时间轮销毁
    TimeWheel tw;
    int count = 0;
    {
      TimeWheel::timer_node timer([&count]() { ++count; });
      tw.AddTimer(&timer, 100);
      ASSERT_EQ(tw.size(), 1);
    }
    ASSERT_EQ(tw.size(), 0);
    tw.Tick();
    ASSERT_EQ(count, 0);
  }
  {
    // 回调中取消同一刻度到期的另一个定时器
    TimeWheel tw;
    int count = 0;
    TimeWheel::timer_node *other = nullptr;
    TimeWheel::timer_node timer1([&]() {
      ++count;
      TimeWheel::timer_cancel(other);
    });
    TimeWheel::timer_node timer2([&]() {
      ++count;
      TimeWheel::timer_cancel(other);
    });
    tw.AddTimer(&timer1, 100);
    tw.AddTimer(&timer2, 100);
    // 后加入的定时器位于链表头部，先被触发
    other = &timer1;
    tw.Tick();
    ASSERT_EQ(count, 1);
    ASSERT_TRUE(timer2.IsFired());
    ASSERT_FALSE(timer1.IsFired());
  }
  {
    // 重新添加会重置到期时间
    TimeWheel tw;
    int count = 0;
    TimeWheel::timer_node timer([&count]() { ++count; });
    tw.AddTimer(&timer, 200);
    tw.Tick();
    tw.AddTimer(&timer, 200);
    tw.Tick();
    ASSERT_EQ(count, 0);
    tw.Tick();
    ASSERT_EQ(count, 1);
  }
}
