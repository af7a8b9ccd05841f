#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - DecisionKind, HttpMethod 를 직접 include 하지 않는다.
// - decision_raw (uint8_t): 호출자가 static_cast<uint8_t>(DecisionKind) 로 변환
// - method 는 문자열로 전달한다.
//
// [민감정보 취급 주의]
// - path 는 쿼리 스트링을 제거한 경로만 담는다. 토큰이 쿼리에 실리는
//   경우가 있으므로 원본 URL 을 넘기지 말 것.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// DecisionLog
//   해석 1건의 결과.
//   decision_raw: DecisionKind 값을 uint8_t 로 저장
//     호출자: static_cast<uint8_t>(decision.kind)
//   requirement : AccessRequirement::describe() 결과
// ---------------------------------------------------------------------------
struct DecisionLog {
    std::uint64_t                              request_id{0};
    std::string                                method{};
    std::string                                path{};
    std::string                                principal{};
    std::uint8_t                               decision_raw{0};
    std::string                                matched_pattern{};
    std::string                                requirement{};
    std::chrono::system_clock::time_point      timestamp{};
    std::chrono::microseconds                  duration{0};    // 해석 소요 시간
};

// ---------------------------------------------------------------------------
// RejectionLog
//   거부/설정 오류 이벤트.
//   reason: 사람이 읽을 수 있는 사유 (클라이언트에 직접 노출 금지)
// ---------------------------------------------------------------------------
struct RejectionLog {
    std::uint64_t                              request_id{0};
    std::string                                method{};
    std::string                                path{};
    std::string                                principal{};
    std::uint8_t                               decision_raw{0};
    std::string                                reason{};
    std::chrono::system_clock::time_point      timestamp{};
};
