// ---------------------------------------------------------------------------
// control_server.cpp
//
// ControlServer 구현: Unix Domain Socket 관리 채널.
//
// [프로토콜]
//   요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
//   요청 필드는 문자열 또는 부호 없는 정수만 사용하므로 JSON 라이브러리
//   없이 "key": value 형태만 단순 파싱한다.
//
// [변경 커맨드]
//   requestmap_put / requestmap_delete 는 저장소 변경이 성공한 뒤에만
//   DynamicStoreSource::invalidate() 를 호출한다. 응답을 받은 클라이언트의
//   다음 resolve 는 변경을 관찰한다.
// ---------------------------------------------------------------------------

#include "control/control_server.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "policy/access_requirement.hpp"

namespace {

// ---------------------------------------------------------------------------
// json_escape
//   JSON 문자열 값 이스케이프 (따옴표 없이 내용만 반환).
// ---------------------------------------------------------------------------
std::string json_escape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string_view source_kind_name(RuleSourceKind kind) noexcept {
    switch (kind) {
        case RuleSourceKind::kStaticDeclaration: return "static-declaration";
        case RuleSourceKind::kConfigMap:         return "config-map";
        case RuleSourceKind::kDynamicStore:      return "dynamic-store";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// serialize_snapshot
//   StatsSnapshot → JSON. captured_at 은 Unix epoch 밀리초.
// ---------------------------------------------------------------------------
std::string serialize_snapshot(const StatsSnapshot& s) {
    const auto epoch_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        s.captured_at.time_since_epoch()).count();

    return fmt::format(
        R"({{"total_resolutions":{},"matched":{},"denied_no_rule":{},"config_error_no_rule":{},"access_denied":{},"source_failures":{},"rebuilds":{},"rejection_rate":{:.4f},"captured_at_ms":{}}})",
        s.total_resolutions,
        s.matched,
        s.denied_no_rule,
        s.config_error_no_rule,
        s.access_denied,
        s.source_failures,
        s.rebuilds,
        s.rejection_rate,
        epoch_ms
    );
}

std::string serialize_rules(const CompiledRuleSet& set) {
    std::string out = fmt::format(R"({{"generation":{},"count":{},"rules":[)", set.generation, set.rules.size());
    bool first = true;
    for (const auto& entry : set.rules) {
        if (!first) {
            out += ',';
        }
        first = false;
        const std::string_view method =
            entry.rule.http_method ? to_string(*entry.rule.http_method) : std::string_view{"*"};
        out += fmt::format(R"({{"pattern":"{}","http_method":"{}","access":"{}","source":"{}"}})",
                           json_escape(entry.rule.pattern), method,
                           json_escape(entry.rule.access.describe()),
                           source_kind_name(entry.source_kind));
    }
    out += "]}";
    return out;
}

std::string make_ok_response(std::string_view data) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", data);
}

std::string make_error_response(std::string_view msg) {
    return fmt::format(R"({{"ok":false,"error":"{}"}})", json_escape(msg));
}

std::string make_error_response(const PolicyError& err) {
    if (err.context.empty()) {
        return make_error_response(fmt::format("{}: {}", to_string(err.code), err.message));
    }
    return make_error_response(fmt::format("{}: {} [{}]", to_string(err.code), err.message, err.context));
}

std::array<uint8_t, 4> encode_le4(uint32_t val) {
    return {
        static_cast<uint8_t>(val),
        static_cast<uint8_t>(val >> 8),
        static_cast<uint8_t>(val >> 16),
        static_cast<uint8_t>(val >> 24),
    };
}

uint32_t decode_le4(const std::array<uint8_t, 4>& buf) {
    return static_cast<uint32_t>(buf[0])
         | (static_cast<uint32_t>(buf[1]) << 8)
         | (static_cast<uint32_t>(buf[2]) << 16)
         | (static_cast<uint32_t>(buf[3]) << 24);
}

// ---------------------------------------------------------------------------
// find_value
//   "key" 뒤의 ':' 와 공백을 건너뛴 값 시작 위치. 키가 없으면 nullopt.
// ---------------------------------------------------------------------------
std::optional<std::size_t> find_value(std::string_view json, std::string_view key) {
    const std::string quoted = fmt::format("\"{}\"", key);
    const auto pos = json.find(quoted);
    if (pos == std::string_view::npos) {
        return std::nullopt;
    }
    auto start = pos + quoted.size();
    while (start < json.size() && json[start] == ' ') { ++start; }
    if (start >= json.size() || json[start] != ':') {
        return std::nullopt;
    }
    ++start;
    while (start < json.size() && json[start] == ' ') { ++start; }
    return start;
}

// ---------------------------------------------------------------------------
// parse_string_field
//   "key":"<value>" 패턴만 지원. 없거나 문자열이 아니면 빈 문자열.
// ---------------------------------------------------------------------------
std::string parse_string_field(std::string_view json, std::string_view key) {
    auto start = find_value(json, key);
    if (!start || *start >= json.size() || json[*start] != '"') {
        return {};
    }
    std::size_t i = *start + 1;  // 여는 따옴표 건너뜀
    std::string value;
    while (i < json.size()) {
        const char c = json[i++];
        if (c == '"') { break; }
        if (c == '\\' && i < json.size()) {
            value += json[i++];  // 단순 escape 처리
        } else {
            value += c;
        }
    }
    return value;
}

// "key": 123 또는 "key": "123"
std::optional<std::uint64_t> parse_uint_field(std::string_view json, std::string_view key) {
    auto start = find_value(json, key);
    if (!start) {
        return std::nullopt;
    }
    std::size_t i = *start;
    if (i < json.size() && json[i] == '"') {
        ++i;
    }
    std::uint64_t value{0};
    const auto [ptr, ec] = std::from_chars(json.data() + i, json.data() + json.size(), value);
    if (ec != std::errc{} || ptr == json.data() + i) {
        return std::nullopt;
    }
    return value;
}

// 단일 클라이언트에서 수신할 최대 메시지 크기 (4MiB)
constexpr uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

constexpr std::string_view kRequestmapUnavailable =
    "requestmap commands require security_config_type RequestmapInstances";

}  // namespace

// ---------------------------------------------------------------------------
// ControlServer 생성자/소멸자
// ---------------------------------------------------------------------------
ControlServer::ControlServer(const std::filesystem::path&        socket_path,
                             std::shared_ptr<PolicyResolver>     resolver,
                             std::shared_ptr<StatsCollector>     stats,
                             LockdownPolicy                      lockdown,
                             std::shared_ptr<DynamicStoreSource> dynamic,
                             asio::io_context&                   ioc)
    : socket_path_{socket_path}
    , resolver_{std::move(resolver)}
    , stats_{std::move(stats)}
    , lockdown_{lockdown}
    , dynamic_{std::move(dynamic)}
    , ioc_{ioc}
    , acceptor_{ioc}
{}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code cancel_ec;
        acceptor_.cancel(cancel_ec);
        if (cancel_ec && cancel_ec != asio::error::bad_descriptor) {
            spdlog::warn("control_server: acceptor cancel error: {}", cancel_ec.message());
        }

        boost::system::error_code close_ec;
        acceptor_.close(close_ec);
        if (close_ec && close_ec != asio::error::bad_descriptor) {
            spdlog::warn("control_server: acceptor close error: {}", close_ec.message());
        }
    };

    // acceptor 소유 스레드(io_context)에서 정리한다
    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

// ---------------------------------------------------------------------------
// run
//   기존 소켓 파일 제거 → bind/listen → accept 루프.
// ---------------------------------------------------------------------------
asio::awaitable<void> ControlServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("control_server: failed to remove old socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("control_server: open error: {}", ec.message());
        co_return;
    }

    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("control_server: bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }

    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("control_server: listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("control_server: listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket   client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(
            client_socket, asio::redirect_error(asio::use_awaitable, accept_ec));

        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("control_server: accept loop stopped");
            } else {
                spdlog::error("control_server: accept error: {}", accept_ec.message());
            }
            co_return;
        }

        asio::co_spawn(ioc_, handle_client(std::move(client_socket)), asio::detached);
    }
}

// ---------------------------------------------------------------------------
// handle_client
//   요청 1건 처리: 헤더 → 바디 → dispatch → 응답 송신.
// ---------------------------------------------------------------------------
asio::awaitable<void> ControlServer::handle_client(asio::local::stream_protocol::socket socket) {
    std::array<uint8_t, 4>    req_hdr{};
    boost::system::error_code hdr_ec;
    const std::size_t hdr_n = co_await asio::async_read(
        socket, asio::buffer(req_hdr), asio::redirect_error(asio::use_awaitable, hdr_ec));

    if (hdr_ec) {
        if (hdr_ec != asio::error::eof) {
            spdlog::warn("control_server: read header error: {}", hdr_ec.message());
        }
        co_return;
    }
    if (hdr_n != 4) {
        spdlog::warn("control_server: short header ({} bytes)", hdr_n);
        co_return;
    }

    const uint32_t body_len = decode_le4(req_hdr);
    if (body_len == 0 || body_len > kMaxRequestSize) {
        spdlog::warn("control_server: invalid body length {}", body_len);
        co_return;
    }

    std::vector<char>         body_buf(body_len);
    boost::system::error_code body_ec;
    const std::size_t body_n = co_await asio::async_read(
        socket, asio::buffer(body_buf), asio::redirect_error(asio::use_awaitable, body_ec));

    if (body_ec) {
        spdlog::warn("control_server: read body error: {}", body_ec.message());
        co_return;
    }
    if (body_n != body_len) {
        spdlog::warn("control_server: short body ({}/{} bytes)", body_n, body_len);
        co_return;
    }

    const std::string response_body = dispatch(std::string_view{body_buf.data(), body_n});

    const auto resp_hdr = encode_le4(static_cast<uint32_t>(response_body.size()));
    std::array<asio::const_buffer, 2> bufs{
        asio::buffer(resp_hdr),
        asio::buffer(response_body),
    };
    boost::system::error_code write_ec;
    const std::size_t write_n = co_await asio::async_write(
        socket, bufs, asio::redirect_error(asio::use_awaitable, write_ec));

    if (write_ec) {
        spdlog::warn("control_server: write error: {}", write_ec.message());
        co_return;
    }

    spdlog::debug("control_server: response_bytes={}", write_n);
}

// ---------------------------------------------------------------------------
// dispatch
// ---------------------------------------------------------------------------
std::string ControlServer::dispatch(std::string_view request_json) {
    const std::string cmd = parse_string_field(request_json, "command");

    if (cmd == "stats") {
        return handle_stats();
    }
    if (cmd == "rules") {
        return handle_rules();
    }
    if (cmd == "resolve") {
        return handle_resolve(request_json);
    }
    if (cmd == "clear_cached_rules") {
        return handle_clear_cached_rules();
    }
    if (cmd == "requestmap_put") {
        return handle_requestmap_put(request_json);
    }
    if (cmd == "requestmap_delete") {
        return handle_requestmap_delete(request_json);
    }
    if (cmd.empty()) {
        spdlog::warn("control_server: missing or malformed 'command' field");
        return make_error_response("missing or malformed 'command' field");
    }
    spdlog::warn("control_server: unknown command '{}'", cmd);
    return make_error_response(fmt::format("unknown command '{}'", cmd));
}

std::string ControlServer::handle_stats() const {
    if (!stats_) {
        return make_error_response("stats collector is not configured");
    }
    return make_ok_response(serialize_snapshot(stats_->snapshot()));
}

std::string ControlServer::handle_rules() const {
    auto compiled = resolver_->compiled_rules();
    if (!compiled) {
        return make_error_response(compiled.error());
    }
    return make_ok_response(serialize_rules(**compiled));
}

std::string ControlServer::handle_resolve(std::string_view request_json) const {
    const std::string method_text = parse_string_field(request_json, "method");
    const std::string path        = parse_string_field(request_json, "path");
    if (path.empty()) {
        return make_error_response("resolve requires 'path'");
    }
    const auto method = parse_http_method(method_text.empty() ? std::string_view{"GET"} : method_text);
    if (!method) {
        return make_error_response(fmt::format("unknown http method '{}'", method_text));
    }

    auto decision = resolver_->resolve(*method, path, lockdown_);
    if (!decision) {
        return make_error_response(decision.error());
    }

    return make_ok_response(fmt::format(
        R"({{"decision":"{}","status":{},"matched_pattern":"{}","requirement":"{}"}})",
        to_string(decision->kind), http_status_for(*decision),
        json_escape(decision->matched_pattern),
        decision->kind == DecisionKind::kMatched ? json_escape(decision->requirement.describe())
                                                 : std::string{}));
}

std::string ControlServer::handle_clear_cached_rules() {
    resolver_->clear_cached_rules();
    spdlog::info("control_server: cached rules cleared");
    return make_ok_response(R"({"invalidated":true})");
}

std::string ControlServer::handle_requestmap_put(std::string_view request_json) {
    if (!dynamic_) {
        return make_error_response(kRequestmapUnavailable);
    }

    RuleEntry entry{};
    entry.pattern     = parse_string_field(request_json, "pattern");
    entry.access      = split_config_attribute(parse_string_field(request_json, "access"));
    entry.http_method = parse_string_field(request_json, "http_method");
    if (entry.pattern.empty()) {
        return make_error_response("requestmap_put requires 'pattern'");
    }

    auto id = dynamic_->add_rule(entry);
    if (!id) {
        return make_error_response(id.error());
    }
    dynamic_->invalidate();

    spdlog::info("control_server: requestmap id={} added for '{}'", *id, entry.pattern);
    return make_ok_response(fmt::format(R"({{"id":{}}})", *id));
}

std::string ControlServer::handle_requestmap_delete(std::string_view request_json) {
    if (!dynamic_) {
        return make_error_response(kRequestmapUnavailable);
    }

    const auto id = parse_uint_field(request_json, "id");
    if (!id) {
        return make_error_response("requestmap_delete requires a numeric 'id'");
    }

    auto removed = dynamic_->remove_rule(*id);
    if (!removed) {
        return make_error_response(removed.error());
    }
    dynamic_->invalidate();

    spdlog::info("control_server: requestmap id={} removed", *id);
    return make_ok_response(fmt::format(R"({{"id":{}}})", *id));
}
