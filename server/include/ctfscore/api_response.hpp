/*
 * 설명: REST 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "ctfscore/model.hpp"

namespace ctfscore {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);

// ISO-8601 UTC, 밀리초 포함
std::string FormatTimestamp(TimePoint tp);

}  // namespace ctfscore
