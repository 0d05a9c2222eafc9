// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "position.h"

#include <algorithm>

#include "utils/json_field.h"

namespace coedit {

void from_json(const nlohmann::json &j, Position &position) {
  position.line = get_unsigned<uint32_t>(j, "line");
  position.column = get_unsigned<uint32_t>(j, "column");
}

void to_json(nlohmann::json &j, const Position &position) {
  j["line"] = position.line;
  j["column"] = position.column;
}

int64_t position_to_index(const Position &position) {
  int64_t column = std::min<int64_t>(position.column, kColumnStride - 1);
  return static_cast<int64_t>(position.line) * kColumnStride + column;
}

Position index_to_position(int64_t index) {
  if (index < 0)
    index = 0;
  return {.line = static_cast<uint32_t>(index / kColumnStride),
          .column = static_cast<uint32_t>(index % kColumnStride)};
}

Position adjust_position(const Position &position, int64_t offset) {
  int64_t index = position_to_index(position) + offset;
  return index_to_position(std::max<int64_t>(0, index));
}

} // namespace coedit
