// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_OT_OPERATION_H_
#define COEDIT_OT_OPERATION_H_

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "position.h"

namespace coedit {

enum class OpType : uint32_t {
  UNKNOWN,
  INSERT,
  DELETE,
  RETAIN,
  CURSOR,
  SELECTION
};
NLOHMANN_JSON_SERIALIZE_ENUM(OpType, {{OpType::UNKNOWN, nullptr},
                                      {OpType::INSERT, "insert"},
                                      {OpType::DELETE, "delete"},
                                      {OpType::RETAIN, "retain"},
                                      {OpType::CURSOR, "cursor"},
                                      {OpType::SELECTION, "selection"}});

// 一次编辑操作，作为不可变的值传递
// 变换只会产生新的操作，id在变换前后保持不变
struct Operation {
  std::string id;
  OpType type{OpType::UNKNOWN};
  Position position;
  std::string content;
  std::optional<uint32_t> length;
  std::string user_id;
  uint64_t timestamp{0};
  // 生成该操作时所基于的文档版本
  uint64_t version{0};

  bool operator==(const Operation &) const = default;

  // 缺省长度按0处理
  inline uint32_t Length() const { return length.value_or(0); }

  // 操作在索引空间中的宽度，插入为内容长度，删除为删除长度
  int64_t Width() const;

  // 插入/删除会修改文本，其余类型在变换中保持不变
  inline bool IsStructural() const {
    return type == OpType::INSERT || type == OpType::DELETE;
  }

  static Operation Insert(std::string id, Position position,
                          std::string content, std::string user_id,
                          uint64_t timestamp, uint64_t version) {
    return {.id = std::move(id),
            .type = OpType::INSERT,
            .position = position,
            .content = std::move(content),
            .length = std::nullopt,
            .user_id = std::move(user_id),
            .timestamp = timestamp,
            .version = version};
  }
  // position为光标位置，删除光标之前的length个字符
  static Operation Delete(std::string id, Position position, uint32_t length,
                          std::string user_id, uint64_t timestamp,
                          uint64_t version) {
    return {.id = std::move(id),
            .type = OpType::DELETE,
            .position = position,
            .content = {},
            .length = length,
            .user_id = std::move(user_id),
            .timestamp = timestamp,
            .version = version};
  }
};

// 缺少必需字段或者字段类型错误时抛出nlohmann::json::exception
// 未知的操作类型解析为OpType::UNKNOWN，由调用方丢弃
void from_json(const nlohmann::json &j, Operation &op);
void to_json(nlohmann::json &j, const Operation &op);

} // namespace coedit

#endif
