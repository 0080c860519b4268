/*
 * 설명: 연결 식별자와 WebSocket 핸들의 매핑을 안전하게 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/broadcaster_test.cpp
 */
#include "codebattle/connection_registry.hpp"

namespace codebattle {

void ConnectionRegistry::Register(const std::string& connection_id, const std::shared_ptr<ConnectionHandle>& handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_[connection_id] = Entry{handle, handle.get()};
  PublishCountLocked();
}

void ConnectionRegistry::Unregister(const std::string& connection_id, const ConnectionHandle* handle) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return;
  }
  if (it->second.raw == handle) {
    connections_.erase(it);
    PublishCountLocked();
  }
}

void ConnectionRegistry::Unregister(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (connections_.erase(connection_id) > 0) {
    PublishCountLocked();
  }
}

std::shared_ptr<ConnectionHandle> ConnectionRegistry::Find(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second.handle.lock();
}

bool ConnectionRegistry::Contains(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.count(connection_id) > 0;
}

std::vector<std::string> ConnectionRegistry::ConnectionIds() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(connections_.size());
  for (const auto& [id, entry] : connections_) {
    ids.push_back(id);
  }
  return ids;
}

std::size_t ConnectionRegistry::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

void ConnectionRegistry::PublishCountLocked() {
  if (observability_) {
    observability_->SetWebsocketActive(connections_.size());
  }
}

}  // namespace codebattle
