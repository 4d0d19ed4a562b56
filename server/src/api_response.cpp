/*
 * 설명: JSON 응답 엔벨로프를 생성하고 시각을 직렬화한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "ctfscore/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace ctfscore {

std::string FormatTimestamp(TimePoint tp) {
  auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  if (secs > tp) {
    secs -= std::chrono::seconds(1);
  }
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
  auto itt = std::chrono::system_clock::to_time_t(secs);
  std::tm tm_utc{};
  gmtime_r(&itt, &tm_utc);
  std::ostringstream ss;
  ss << std::put_time(&tm_utc, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return ss.str();
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", FormatTimestamp(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", FormatTimestamp(std::chrono::system_clock::now())}};
  return envelope;
}

}  // namespace ctfscore
