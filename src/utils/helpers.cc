// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "helpers.h"

#include <random>

namespace coedit {

std::string random_base36(size_t length) {
  static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
  static thread_local std::mt19937_64 engine{std::random_device{}()};
  std::uniform_int_distribution<size_t> dist(0, sizeof(kAlphabet) - 2);
  std::string result;
  result.reserve(length);
  for (size_t i = 0; i < length; ++i) {
    result.push_back(kAlphabet[dist(engine)]);
  }
  return result;
}

std::string generate_operation_id(const std::string &user_id, uint64_t millis) {
  std::string id;
  id.reserve(user_id.size() + 32);
  id.append(user_id).append("_").append(std::to_string(millis)).append("_");
  id.append(random_base36(9));
  return id;
}

} // namespace coedit
