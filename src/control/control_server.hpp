#pragma once

// ---------------------------------------------------------------------------
// control_server.hpp
//
// Unix Domain Socket 관리 채널. 운영 CLI 에 통계/규칙 조회, 해석 시험,
// 캐시 무효화, requestmap 변경을 노출한다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 프레임: [4byte LE 길이][JSON 본문]
//     예: {"command": "resolve", "method": "GET", "path": "/admin/users"}
//   응답 프레임: [4byte LE 길이][JSON 본문]
//     성공: {"ok": true,  "payload": { ... }}
//     실패: {"ok": false, "error": "<메시지>"}
//
// [지원 커맨드]
//   "stats"             : StatsSnapshot
//   "rules"             : 컴파일된 규칙 목록 (정렬 순서 그대로)
//   "resolve"           : method, path 로 해석 결과 조회
//   "clear_cached_rules": 캐시 무효화
//   "requestmap_put"    : pattern, access, [http_method] 추가 후 무효화
//   "requestmap_delete" : id 삭제 후 무효화
//   requestmap_* 은 RequestmapInstances 구성에서만 동작한다.
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입.
//   run() 은 co_return 까지 accept 루프를 유지한다.
//   stop() 은 acceptor 를 닫아 run() 을 종료시킨다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include "policy/policy_resolver.hpp"
#include "policy/rule.hpp"
#include "policy/rule_source.hpp"
#include "stats/stats_collector.hpp"

namespace asio = boost::asio;

class ControlServer {
public:
    // 생성자
    //   socket_path : Unix Domain Socket 파일 경로
    //   resolver    : 해석/무효화 대상
    //   stats       : 공유 통계 수집기 (read-only)
    //   lockdown    : "resolve" 커맨드에 적용할 lockdown 설정
    //   dynamic     : requestmap 변경 대상 (RequestmapInstances 가 아니면 nullptr)
    //   ioc         : 외부에서 주입된 Asio io_context
    ControlServer(const std::filesystem::path&        socket_path,
                  std::shared_ptr<PolicyResolver>     resolver,
                  std::shared_ptr<StatsCollector>     stats,
                  LockdownPolicy                      lockdown,
                  std::shared_ptr<DynamicStoreSource> dynamic,
                  asio::io_context&                   ioc);

    ~ControlServer();

    ControlServer(const ControlServer&)            = delete;
    ControlServer& operator=(const ControlServer&) = delete;
    ControlServer(ControlServer&&)                 = delete;
    ControlServer& operator=(ControlServer&&)      = delete;

    // run
    //   소켓 바인드/리슨 후 accept 루프를 실행한다.
    asio::awaitable<void> run();

    // stop
    //   acceptor 를 닫아 run() 의 accept 루프를 종료한다.
    void stop();

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    // 요청 JSON 하나를 처리해 응답 JSON 을 만든다.
    [[nodiscard]] std::string dispatch(std::string_view request_json);

    [[nodiscard]] std::string handle_stats() const;
    [[nodiscard]] std::string handle_rules() const;
    [[nodiscard]] std::string handle_resolve(std::string_view request_json) const;
    [[nodiscard]] std::string handle_clear_cached_rules();
    [[nodiscard]] std::string handle_requestmap_put(std::string_view request_json);
    [[nodiscard]] std::string handle_requestmap_delete(std::string_view request_json);

    std::filesystem::path                  socket_path_;
    std::shared_ptr<PolicyResolver>        resolver_;
    std::shared_ptr<StatsCollector>        stats_;
    LockdownPolicy                         lockdown_;
    std::shared_ptr<DynamicStoreSource>    dynamic_;
    asio::io_context&                      ioc_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
};
