/*
 * 설명: 연결 식별자별로 살아 있는 WebSocket 연결 핸들을 보관한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcaster_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "codebattle/observability.hpp"

namespace codebattle {

// 전송 계층이 소유하는 송신 가능한 연결. Send 는 블로킹하지 않아야 한다.
class ConnectionHandle {
 public:
  virtual ~ConnectionHandle() = default;
  virtual void Send(std::string message) = 0;
};

class ConnectionRegistry {
 public:
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  void Register(const std::string& connection_id, const std::shared_ptr<ConnectionHandle>& handle);
  // 같은 핸들이 여전히 등록되어 있을 때만 제거한다.
  void Unregister(const std::string& connection_id, const ConnectionHandle* handle);
  void Unregister(const std::string& connection_id);
  std::shared_ptr<ConnectionHandle> Find(const std::string& connection_id) const;
  bool Contains(const std::string& connection_id) const;
  std::vector<std::string> ConnectionIds() const;
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<ConnectionHandle> handle;
    const ConnectionHandle* raw{nullptr};
  };

  void PublishCountLocked();

  std::unordered_map<std::string, Entry> connections_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace codebattle
