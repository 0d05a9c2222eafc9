// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_OT_POSITION_H_
#define COEDIT_OT_POSITION_H_

#include <cstdint>

#include <nlohmann/json.hpp>

namespace coedit {

namespace {
// 每行可编码的最大列数，行号乘以该值再加上列号得到全局索引
// 超过该列数的位置无法被正确编码，各副本必须使用相同的值
constexpr static int64_t kColumnStride = 1000;
} // namespace

struct Position {
  uint32_t line{0};
  uint32_t column{0};

  bool operator==(const Position &) const = default;
};

// 负数或超出uint32范围的行列号在解码时即被拒绝
void from_json(const nlohmann::json &j, Position &position);
void to_json(nlohmann::json &j, const Position &position);

// 行优先、列次之的全序
inline bool operator<(const Position &lhs, const Position &rhs) {
  return lhs.line < rhs.line ||
         (lhs.line == rhs.line && lhs.column < rhs.column);
}

// 该位置能否无损编码
inline bool position_is_encodable(const Position &position) {
  return position.column < kColumnStride;
}

// 位置 -> 全局索引，超出范围的列号会被截断到行内最后一个可编码列
int64_t position_to_index(const Position &position);

// 全局索引 -> 位置，负数索引视为文档起点
Position index_to_position(int64_t index);

// 按偏移量移动位置，结果不会小于文档起点
Position adjust_position(const Position &position, int64_t offset);

} // namespace coedit

#endif
