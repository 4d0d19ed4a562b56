/*
 * 설명: 플래그/증명 문자열 정규화와 상수 시간 비교를 제공한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/flag_match_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

namespace ctfscore {

std::string TrimCopy(std::string_view text);
std::string NormalizeFlag(std::string_view text, bool case_sensitive);
bool FlagMatches(std::string_view stored, std::string_view submitted, bool case_sensitive);

}  // namespace ctfscore
