// Copyright (c) 2025-2026 Juantgd. All Rights Reserved.

#ifndef COEDIT_INCLUDE_TRANSPORT_H_
#define COEDIT_INCLUDE_TRANSPORT_H_

#include <string>

namespace coedit {

// 传输层接口类，会话通过该接口向其他副本广播消息
// 具体实现(websocket、进程内回环等)由使用方提供
class Transport {
public:
  virtual ~Transport() = default;
  // 发送一条已编码的消息，发送失败时返回false
  virtual bool Send(std::string data) = 0;
};

} // namespace coedit

#endif
