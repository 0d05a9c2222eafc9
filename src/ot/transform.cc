// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#include "transform.h"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace coedit {

namespace {

Operation with_position(const Operation &op, Position position) {
  Operation result(op);
  result.position = position;
  return result;
}

std::pair<Operation, Operation> transform_insert_insert(const Operation &op_a,
                                                        const Operation &op_b) {
  int64_t pos_a = position_to_index(op_a.position);
  int64_t pos_b = position_to_index(op_b.position);
  // 位置相同时按用户id排序，保证各副本得到相同的先后顺序
  if (pos_a < pos_b || (pos_a == pos_b && op_a.user_id < op_b.user_id)) {
    return {op_a,
            with_position(op_b, adjust_position(op_b.position, op_a.Width()))};
  }
  return {with_position(op_a, adjust_position(op_a.position, op_b.Width())),
          op_b};
}

std::pair<Operation, Operation> transform_insert_delete(const Operation &ins,
                                                        const Operation &del) {
  int64_t insert_pos = position_to_index(ins.position);
  DeleteSpan span = delete_span(del);
  if (insert_pos <= span.start) {
    return {ins,
            with_position(del, adjust_position(del.position, ins.Width()))};
  }
  if (insert_pos > span.end) {
    return {with_position(ins, adjust_position(ins.position, -span.length())),
            del};
  }
  // 插入点落在删除区间内，插入内容保留并移动到删除后的边界
  return {with_position(ins, index_to_position(span.start)), del};
}

std::pair<Operation, Operation> transform_delete_delete(const Operation &op_a,
                                                        const Operation &op_b) {
  DeleteSpan span_a = delete_span(op_a);
  DeleteSpan span_b = delete_span(op_b);
  if (span_a.end <= span_b.start) {
    return {op_a,
            with_position(op_b,
                          adjust_position(op_b.position, -span_a.length()))};
  }
  if (span_b.end <= span_a.start) {
    return {with_position(op_a,
                          adjust_position(op_a.position, -span_b.length())),
            op_b};
  }
  // 区间重叠：合并为一个覆盖并集的删除交给op_a，op_b退化为空操作，避免重复删除
  int64_t start = std::min(span_a.start, span_b.start);
  int64_t end = std::max(span_a.end, span_b.end);
  Operation merged(op_a);
  merged.position = index_to_position(end);
  merged.length = static_cast<uint32_t>(end - start);
  Operation noop(op_b);
  noop.type = OpType::RETAIN;
  noop.length = 0;
  spdlog::debug("overlapping deletes {} and {} merged into [{}, {})", op_a.id,
                op_b.id, start, end);
  return {std::move(merged), std::move(noop)};
}

} // namespace

DeleteSpan delete_span(const Operation &op) {
  int64_t end = position_to_index(op.position);
  return {.start = std::max<int64_t>(0, end - op.Length()), .end = end};
}

std::pair<Operation, Operation> transform(const Operation &op_a,
                                          const Operation &op_b) {
  if (op_a.type == OpType::INSERT && op_b.type == OpType::INSERT) {
    return transform_insert_insert(op_a, op_b);
  }
  if (op_a.type == OpType::INSERT && op_b.type == OpType::DELETE) {
    return transform_insert_delete(op_a, op_b);
  }
  if (op_a.type == OpType::DELETE && op_b.type == OpType::INSERT) {
    auto [b_prime, a_prime] = transform_insert_delete(op_b, op_a);
    return {std::move(a_prime), std::move(b_prime)};
  }
  if (op_a.type == OpType::DELETE && op_b.type == OpType::DELETE) {
    return transform_delete_delete(op_a, op_b);
  }
  return {op_a, op_b};
}

} // namespace coedit
