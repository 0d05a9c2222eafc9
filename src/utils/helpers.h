// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_UTILS_HELPERS_H_
#define COEDIT_UTILS_HELPERS_H_

#include <cstdint>
#include <ctime>
#include <string>

namespace coedit {

// 单调时钟，用于驱动时间轮
static inline uint64_t get_current_millis() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return uint64_t(ts.tv_sec) * 1000 + uint64_t(ts.tv_nsec) / 1000000;
}

// 墙上时钟，操作的时间戳需要在不同副本之间比较
static inline uint64_t get_realtime_millis() {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return uint64_t(ts.tv_sec) * 1000 + uint64_t(ts.tv_nsec) / 1000000;
}

// 生成形如 "<user_id>_<millis>_<9位随机串>" 的操作id
std::string generate_operation_id(const std::string &user_id, uint64_t millis);

// 随机的base36字符串
std::string random_base36(size_t length);

} // namespace coedit

#endif
