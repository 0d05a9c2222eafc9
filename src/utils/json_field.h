// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_UTILS_JSON_FIELD_H_
#define COEDIT_UTILS_JSON_FIELD_H_

#include <limits>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace coedit {

// 读取无符号整数字段
// 负数、浮点数或其他类型抛出 nlohmann::json::type_error，
// 超出T的取值范围抛出 std::out_of_range，不会发生静默截断
template <typename T>
T get_unsigned(const nlohmann::json &j, const char *key) {
  const nlohmann::json &value = j.at(key);
  auto raw = value.get_ref<const nlohmann::json::number_unsigned_t &>();
  if (raw > std::numeric_limits<T>::max()) {
    throw std::out_of_range(std::string("field ") + key + " out of range: " +
                            std::to_string(raw));
  }
  return static_cast<T>(raw);
}

// 字段缺失或为null时返回默认值，否则按 get_unsigned 校验
template <typename T>
T get_unsigned_or(const nlohmann::json &j, const char *key, T default_value) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return default_value;
  return get_unsigned<T>(j, key);
}

} // namespace coedit

#endif
