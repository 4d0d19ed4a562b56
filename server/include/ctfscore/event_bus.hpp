/*
 * 설명: 점수 변경 이벤트를 io_context 작업으로 구독자에게 비동기 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/leaderboard_cache_test.cpp
 */
#pragma once

#include <functional>
#include <mutex>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "ctfscore/model.hpp"

namespace ctfscore {

class EventBus {
 public:
  using Handler = std::function<void(const ScoreEvent&)>;

  explicit EventBus(boost::asio::io_context& ioc) : ioc_(ioc) {}

  void Subscribe(Handler handler);
  // 발행자는 구독자 처리를 기다리지 않는다.
  void Publish(const ScoreEvent& event);

 private:
  boost::asio::io_context& ioc_;
  std::vector<Handler> handlers_;
  mutable std::mutex mutex_;
};

}  // namespace ctfscore
