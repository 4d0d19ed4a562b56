/*
 * 설명: 앞뒤 공백 제거와 소문자화 후 바이트 단위로 플래그를 비교한다.
 * 버전: v1.0.0
 * 테스트: server/tests/unit/flag_match_test.cpp
 */
#include "ctfscore/flag.hpp"

#include <algorithm>
#include <cctype>

#include <openssl/crypto.h>

namespace ctfscore {
namespace {
bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }
}  // namespace

std::string TrimCopy(std::string_view text) {
  auto begin = std::find_if_not(text.begin(), text.end(), IsSpace);
  auto end = std::find_if_not(text.rbegin(), text.rend(), IsSpace).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string NormalizeFlag(std::string_view text, bool case_sensitive) {
  std::string normalized = TrimCopy(text);
  if (!case_sensitive) {
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  }
  return normalized;
}

bool FlagMatches(std::string_view stored, std::string_view submitted, bool case_sensitive) {
  auto expected = NormalizeFlag(stored, case_sensitive);
  auto actual = NormalizeFlag(submitted, case_sensitive);
  if (expected.empty() || expected.size() != actual.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.data(), actual.data(), expected.size()) == 0;
}

}  // namespace ctfscore
