// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_OT_TRANSFORM_H_
#define COEDIT_OT_TRANSFORM_H_

#include <utility>

#include "operation.h"

namespace coedit {

// 删除操作在索引空间中覆盖的区间 [start, end)
// 删除以光标位置为终点向前删除，所以end为光标所在索引
struct DeleteSpan {
  int64_t start;
  int64_t end;

  inline int64_t length() const { return end - start; }
};

DeleteSpan delete_span(const Operation &op);

// 对两个基于同一文档状态的并发操作进行变换
// 返回 (op_a', op_b')：op_a' 可在op_b之后应用，op_b' 可在op_a之后应用
// 只有插入/删除之间需要变换，其余类型原样返回
std::pair<Operation, Operation> transform(const Operation &op_a,
                                          const Operation &op_b);

} // namespace coedit

#endif
