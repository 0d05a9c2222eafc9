// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "operation.h"

#include "utils/json_field.h"

namespace coedit {

int64_t Operation::Width() const {
  switch (type) {
  case OpType::INSERT:
    return static_cast<int64_t>(content.length());
  case OpType::DELETE:
    return Length();
  default:
    return 0;
  }
}

void from_json(const nlohmann::json &j, Operation &op) {
  op.id = j.at("id").get<std::string>();
  op.type = j.at("type").get<OpType>();
  op.position = j.at("position").get<Position>();
  op.user_id = j.at("userId").get<std::string>();
  op.timestamp = get_unsigned<uint64_t>(j, "timestamp");
  op.version = get_unsigned<uint64_t>(j, "version");
  // 插入操作必须携带内容，其他类型的内容可以省略
  if (op.type == OpType::INSERT) {
    op.content = j.at("content").get<std::string>();
  } else {
    op.content = j.value("content", std::string{});
  }
  if (j.contains("length") && !j["length"].is_null()) {
    op.length = get_unsigned<uint32_t>(j, "length");
  } else {
    op.length.reset();
  }
}

void to_json(nlohmann::json &j, const Operation &op) {
  j["id"] = op.id;
  j["type"] = op.type;
  j["position"] = op.position;
  j["content"] = op.content;
  if (op.length.has_value()) {
    j["length"] = *op.length;
  }
  j["userId"] = op.user_id;
  j["timestamp"] = op.timestamp;
  j["version"] = op.version;
}

} // namespace coedit
