/*
 * 설명: 점수 변경 이벤트를 구독자별 비동기 작업으로 게시한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "ctfscore/event_bus.hpp"

#include <boost/asio/post.hpp>

namespace ctfscore {

void EventBus::Subscribe(Handler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  handlers_.push_back(std::move(handler));
}

void EventBus::Publish(const ScoreEvent& event) {
  std::vector<Handler> handlers;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers = handlers_;
  }
  for (auto& handler : handlers) {
    boost::asio::post(ioc_, [handler, event]() { handler(event); });
  }
}

}  // namespace ctfscore
