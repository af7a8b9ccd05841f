#include "control/control_server.hpp"
#include "logger/structured_logger.hpp"
#include "policy/access_evaluator.hpp"
#include "policy/policy_loader.hpp"
#include "policy/policy_resolver.hpp"
#include "policy/rule_cache.hpp"
#include "policy/source_assembly.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 정책 로드 ──────────────────────────────────────────────────────
    //   규칙 오류는 기동 시점에 실패한다 (해석 시점으로 미루지 않는다).
    const std::string policy_path = env_str("POLICY_PATH", "config/policy.yaml");
    auto loaded = PolicyLoader::load(policy_path);
    if (!loaded) {
        spdlog::critical("urlgate: cannot start, policy load failed: {}", loaded.error());
        return EXIT_FAILURE;
    }
    const GatewayConfig config = std::move(*loaded);

    // ── 설정 (환경변수가 YAML global 보다 우선) ─────────────────────────
    const std::string socket_path = env_str("UDS_SOCKET_PATH", "/tmp/urlgate.sock");
    const std::string log_path    = env_str("LOG_PATH",        config.global.log_path);
    const std::string log_level   = env_str("LOG_LEVEL",       config.global.log_level);

    spdlog::set_level(spdlog::level::from_str(log_level));

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    spdlog::info("Starting urlgate policy resolver");
    spdlog::info("Policy: {}", policy_path);
    spdlog::info("Security config type: {}", to_string(config.security.security_config_type));
    spdlog::info("Lockdown: reject_if_no_rule={}, reject_public_invocations={}",
                 config.security.lockdown.reject_if_no_rule,
                 config.security.lockdown.reject_public_invocations);
    spdlog::info("UDS socket: {}", socket_path);
    spdlog::info("Log level: {}", log_level);

    std::shared_ptr<StructuredLogger> logger;
    try {
        logger = std::make_shared<StructuredLogger>(StructuredLogger::parse_level(log_level), log_path);
    } catch (const std::runtime_error& e) {
        spdlog::critical("urlgate: {}", e.what());
        return EXIT_FAILURE;
    }

    // ── 규칙 소스 / 캐시 / 해석기 ───────────────────────────────────────
    auto assembled = assemble_rule_sources(config);
    if (!assembled) {
        spdlog::critical("urlgate: cannot assemble rule sources: {} [{}]",
                         assembled.error().message, assembled.error().context);
        return EXIT_FAILURE;
    }

    auto stats     = std::make_shared<StatsCollector>();
    auto cache     = std::make_shared<RuleCache>(assembled->sources, stats);
    auto evaluator = std::make_shared<const AuthorityAccessEvaluator>();
    auto resolver  = std::make_shared<PolicyResolver>(cache, evaluator, stats, logger);

    // 첫 컴파일을 기동 시점에 수행해 잘못된 규칙을 조기에 드러낸다
    if (auto warmed = resolver->compiled_rules(); !warmed) {
        spdlog::critical("urlgate: initial rule compilation failed: {} [{}]",
                         warmed.error().message, warmed.error().context);
        return EXIT_FAILURE;
    } else {
        spdlog::info("urlgate: {} rules compiled", (*warmed)->rules.size());
    }

    // ── 제어 소켓 + 시그널 ──────────────────────────────────────────────
    boost::asio::io_context ioc;
    ControlServer server{socket_path, resolver, stats, config.security.lockdown,
                         assembled->dynamic, ioc};

    boost::asio::co_spawn(
        ioc,
        server.run(),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("urlgate: control_server error: {}", e.what());
                }
            }
        }
    );

    // SIGTERM / SIGINT → 종료
    boost::asio::signal_set signals_stop{ioc, SIGTERM, SIGINT};
    signals_stop.async_wait(
        [&server, &ioc](const boost::system::error_code& ec, int /*signum*/) {
            if (!ec) {
                spdlog::info("urlgate: shutdown signal received");
                server.stop();
                ioc.stop();
            }
        }
    );

    // SIGHUP → 캐시 무효화 (수신 후 재등록하여 반복 감지)
    boost::asio::signal_set signals_hup{ioc, SIGHUP};
    std::function<void()> setup_hup;
    setup_hup = [&signals_hup, &setup_hup, &resolver]() {
        signals_hup.async_wait(
            [&setup_hup, &resolver](const boost::system::error_code& ec, int /*signum*/) {
                if (!ec) {
                    spdlog::info("urlgate: SIGHUP received, clearing cached rules");
                    resolver->clear_cached_rules();
                    setup_hup();
                }
            }
        );
    };
    setup_hup();

    ioc.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("urlgate stopped");

    return EXIT_SUCCESS;
}
