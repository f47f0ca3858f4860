/**
 * @file test_request_executor.cpp
 * @brief Tests for RequestExecutor: fault gate, terminal envelope, forward relay.
 *
 * Validates:
 *  - Fault fires iff draw < percentage; a fired fault never reaches the upstream
 *  - Non-firing faults hand the remaining path back to the interpreter
 *  - Forward builds scheme://hop + remaining path with the inbound method/body
 *  - Upstream status/headers/body are relayed; framing headers recomputed
 *  - 400 / 502 error bodies
 *  - Statistical behaviour at 0%, 100% and 50% with a seeded source
 */

#include <gtest/gtest.h>
#include <deque>
#include <initializer_list>
#include <memory>
#include <string>
#include <vector>

#include "meshnode/net/run_blocking.hpp"
#include "meshnode/net/upstream_client.hpp"
#include "meshnode/obs/logger.hpp"
#include "meshnode/routing/random_source.hpp"
#include "meshnode/routing/request_executor.hpp"
#include "meshnode/routing/response_envelope.hpp"

namespace http = boost::beast::http;
using namespace std::chrono_literals;
using meshnode::net::Clock;
using meshnode::net::Deadline;
using meshnode::net::OutboundRequest;
using meshnode::net::Request;
using meshnode::net::Response;
using meshnode::net::UpstreamResult;
using meshnode::net::run_blocking;
using meshnode::obs::Logger;
using meshnode::routing::RandomSource;
using meshnode::routing::RequestExecutor;
using meshnode::routing::decode_envelope;

namespace {

///
/// Records every outbound call and answers with a canned result.
///
class FakeUpstream final : public meshnode::net::UpstreamClient {
public:
  boost::asio::awaitable<UpstreamResult>
  send(const OutboundRequest& out, Deadline deadline,
       meshnode::net::CancelSignal* cancel = nullptr) const override {
    calls.push_back(out);
    deadlines.push_back(deadline);
    cancels.push_back(cancel);
    if (!error.empty()) co_return meshnode_detail::unexpected(error);
    co_return reply;
  }

  static Response envelope_reply(unsigned status, const std::string& service) {
    Response res{http::int_to_status(status), 11};
    res.result(status);
    res.set(http::field::content_type, "application/json");
    res.body() = *meshnode::routing::encode_envelope({static_cast<int>(status), service, "relayed"});
    res.prepare_payload();
    return res;
  }

  Response    reply = envelope_reply(200, "downstream");
  std::string error;
  mutable std::vector<OutboundRequest> calls;
  mutable std::vector<Deadline>        deadlines;
  mutable std::vector<meshnode::net::CancelSignal*> cancels;
};

///
/// Returns scripted draws in order, then repeats the last one.
///
class ScriptedRandom final : public RandomSource {
public:
  explicit ScriptedRandom(std::deque<int> draws) : draws_(std::move(draws)) {}

  int uniform_int(int lo, int hi) override {
    last_lo = lo;
    last_hi = hi;
    if (draws_.size() > 1) {
      const int v = draws_.front();
      draws_.pop_front();
      return v;
    }
    return draws_.front();
  }

  int last_lo = -1;
  int last_hi = -1;

private:
  std::deque<int> draws_;
};

Request make_request(http::verb verb, std::string target, std::string body = {}) {
  Request req{verb, target, 11};
  req.body() = std::move(body);
  req.prepare_payload();
  return req;
}

struct Harness {
  std::shared_ptr<FakeUpstream>   upstream = std::make_shared<FakeUpstream>();
  std::shared_ptr<ScriptedRandom> random;
  RequestExecutor                 exec;

  Harness(std::initializer_list<int> draws)
      : random(std::make_shared<ScriptedRandom>(std::deque<int>(draws))),
        exec(upstream, random) {}

  Response run(const Request& req, std::string_view path, Deadline d = Clock::now() + 5s) {
    return run_blocking(exec.execute_path(req, path, "node-a", d, Logger{}));
  }
};

} // namespace

// --------------------------- Terminal --------------------------------------

/**
 * @test Terminal_Returns_Local_Envelope
 * @brief "/" answers 200 with this node's name and never calls the upstream.
 */
TEST(RequestExecutor, Terminal_Returns_Local_Envelope) {
  Harness h{0};
  auto res = h.run(make_request(http::verb::get, "/"), "/");

  EXPECT_EQ(res.result_int(), 200u);
  EXPECT_EQ(res[http::field::content_type], "application/json");
  auto env = decode_envelope(res.body());
  ASSERT_TRUE(env);
  EXPECT_EQ(env->status, 200);
  EXPECT_EQ(env->service, "node-a");
  EXPECT_EQ(env->message, "Request processed successfully");
  EXPECT_TRUE(h.upstream->calls.empty());
}

// --------------------------- Fault -----------------------------------------

/**
 * @test Fault_Fires_Below_Percentage
 * @brief draw 29 < 30 fires; the envelope carries the reason phrase.
 */
TEST(RequestExecutor, Fault_Fires_Below_Percentage) {
  Harness h{29};
  auto res = h.run(make_request(http::verb::get, "/"), "/fault/503/30/proxy/b:8080");

  EXPECT_EQ(res.result_int(), 503u);
  auto env = decode_envelope(res.body());
  ASSERT_TRUE(env);
  EXPECT_EQ(env->status, 503);
  EXPECT_EQ(env->service, "node-a");
  EXPECT_EQ(env->message, "Fault injected: 503 Service Unavailable");
  EXPECT_TRUE(h.upstream->calls.empty());
  EXPECT_EQ(h.random->last_lo, 0);
  EXPECT_EQ(h.random->last_hi, 100);
}

/**
 * @test Fault_Skipped_At_Percentage
 * @brief draw == percentage does not fire; the forward after it runs.
 */
TEST(RequestExecutor, Fault_Skipped_At_Percentage) {
  Harness h{30};
  auto res = h.run(make_request(http::verb::get, "/"), "/fault/503/30/proxy/b:8080/x");

  EXPECT_EQ(res.result_int(), 200u);
  ASSERT_EQ(h.upstream->calls.size(), 1u);
  EXPECT_EQ(h.upstream->calls[0].authority, "b:8080");
  EXPECT_EQ(h.upstream->calls[0].target, "/x");
  EXPECT_FALSE(h.upstream->calls[0].tls);
}

/**
 * @test Fault_Skipped_Then_Terminal
 * @brief A 0% fault with nothing after it answers as the final hop.
 */
TEST(RequestExecutor, Fault_Skipped_Then_Terminal) {
  Harness h{0};
  auto res = h.run(make_request(http::verb::get, "/"), "/fault/500/0");

  EXPECT_EQ(res.result_int(), 200u);
  auto env = decode_envelope(res.body());
  ASSERT_TRUE(env);
  EXPECT_EQ(env->service, "node-a");
  EXPECT_TRUE(h.upstream->calls.empty());
}

/**
 * @test Fault_Consecutive_Each_Drawn
 * @brief Two fault gates in a row: the first misses, the second fires.
 */
TEST(RequestExecutor, Fault_Consecutive_Each_Drawn) {
  Harness h{60, 10};
  auto res = h.run(make_request(http::verb::get, "/"), "/fault/500/50/fault/404/50/proxy/b:1");

  EXPECT_EQ(res.result_int(), 404u);
  auto env = decode_envelope(res.body());
  ASSERT_TRUE(env);
  EXPECT_EQ(env->message, "Fault injected: 404 Not Found");
  EXPECT_TRUE(h.upstream->calls.empty());
}

/**
 * @test Fault_Unregistered_Code
 * @brief Codes without a reason phrase use "Unknown Error".
 */
TEST(RequestExecutor, Fault_Unregistered_Code) {
  Harness h{0};
  auto res = h.run(make_request(http::verb::get, "/"), "/fault/599");

  EXPECT_EQ(res.result_int(), 599u);
  auto env = decode_envelope(res.body());
  ASSERT_TRUE(env);
  EXPECT_EQ(env->message, "Fault injected: 599 Unknown Error");
}

// --------------------------- Errors ----------------------------------------

/**
 * @test ParseError_Is_400
 * @brief Malformed paths answer 400 text/plain with the parse error text.
 */
TEST(RequestExecutor, ParseError_Is_400) {
  Harness h{0};
  auto res = h.run(make_request(http::verb::get, "/proxy/"), "/proxy/");

  EXPECT_EQ(res.result_int(), 400u);
  EXPECT_EQ(res[http::field::content_type], "text/plain; charset=utf-8");
  EXPECT_EQ(res.body(), "invalid path: empty service name\n");
  EXPECT_TRUE(h.upstream->calls.empty());
}

/**
 * @test ParseError_After_Fault_Is_400
 * @brief The remaining path is validated only when the fault misses.
 */
TEST(RequestExecutor, ParseError_After_Fault_Is_400) {
  Harness miss{99};
  auto res = miss.run(make_request(http::verb::get, "/"), "/fault/500/50/nowhere");
  EXPECT_EQ(res.result_int(), 400u);
  EXPECT_EQ(res.body(), "invalid path: must start with /proxy/ or /fault/\n");

  Harness hit{0};
  auto fired = hit.run(make_request(http::verb::get, "/"), "/fault/500/50/nowhere");
  EXPECT_EQ(fired.result_int(), 500u);
}

/**
 * @test Upstream_Error_Is_502
 * @brief Transport failures surface as 502 with the error text.
 */
TEST(RequestExecutor, Upstream_Error_Is_502) {
  Harness h{0};
  h.upstream->error = "GET \"http://b:1/\": Connection refused";
  auto res = h.run(make_request(http::verb::get, "/"), "/proxy/b:1");

  EXPECT_EQ(res.result_int(), 502u);
  EXPECT_EQ(res.body(), "Next hop error: GET \"http://b:1/\": Connection refused\n");
  EXPECT_EQ(decode_envelope(res.body()).has_value(), false);
}

// --------------------------- Forward ---------------------------------------

/**
 * @test Forward_Relays_Upstream_Verbatim
 * @brief Status, headers and body come from the upstream; framing is recomputed.
 */
TEST(RequestExecutor, Forward_Relays_Upstream_Verbatim) {
  Harness h{0};
  h.upstream->reply = FakeUpstream::envelope_reply(418, "node-b");
  h.upstream->reply.set("X-Upstream", "yes");
  h.upstream->reply.set(http::field::connection, "close");

  auto res = h.run(make_request(http::verb::get, "/"), "/proxy/b:8080");

  EXPECT_EQ(res.result_int(), 418u);
  EXPECT_EQ(res["X-Upstream"], "yes");
  EXPECT_EQ(res[http::field::content_type], "application/json");
  EXPECT_EQ(res.find(http::field::connection), res.end());
  EXPECT_EQ(res[http::field::content_length], std::to_string(res.body().size()));
  auto env = decode_envelope(res.body());
  ASSERT_TRUE(env);
  EXPECT_EQ(env->service, "node-b");   // never rewritten by the relaying node
}

/**
 * @test Forward_Passes_Method_Body_Deadline
 * @brief The outbound call mirrors the inbound method/body and shares the deadline.
 */
TEST(RequestExecutor, Forward_Passes_Method_Body_Deadline) {
  Harness h{0};
  const Deadline d = Clock::now() + 1234ms;
  auto req = make_request(http::verb::put, "/proxy/b:8080/items/7", "payload=1");

  auto res = h.run(req, "/proxy/b:8080/items/7", d);
  EXPECT_EQ(res.result_int(), 200u);
  ASSERT_EQ(h.upstream->calls.size(), 1u);
  const auto& out = h.upstream->calls[0];
  EXPECT_EQ(out.method, "PUT");
  EXPECT_EQ(out.body, "payload=1");
  EXPECT_EQ(out.target, "/items/7");
  EXPECT_EQ(out.url(), "http://b:8080/items/7");
  ASSERT_EQ(h.upstream->deadlines.size(), 1u);
  EXPECT_EQ(h.upstream->deadlines[0], d);
}

/**
 * @test Forward_Https_Hop
 * @brief https:// hops go out over TLS.
 */
TEST(RequestExecutor, Forward_Https_Hop) {
  Harness h{0};
  (void)h.run(make_request(http::verb::get, "/"), "/proxy/https://secure:8443");

  ASSERT_EQ(h.upstream->calls.size(), 1u);
  EXPECT_TRUE(h.upstream->calls[0].tls);
  EXPECT_EQ(h.upstream->calls[0].url(), "https://secure:8443/");
}

/**
 * @test Forward_Head_Keeps_Length
 * @brief HEAD relays keep the upstream Content-Length with an empty body.
 */
TEST(RequestExecutor, Forward_Head_Keeps_Length) {
  Harness h{0};
  Response up{http::status::ok, 11};
  up.set(http::field::content_length, "42");
  h.upstream->reply = up;

  auto res = h.run(make_request(http::verb::head, "/proxy/b:1"), "/proxy/b:1");
  EXPECT_EQ(res.result_int(), 200u);
  EXPECT_EQ(res[http::field::content_length], "42");
  EXPECT_TRUE(res.body().empty());
}

// --------------------------- Cancellation ----------------------------------

/**
 * @test Forward_Passes_Cancel_Signal
 * @brief The inbound request's cancel signal reaches the outbound call.
 */
TEST(RequestExecutor, Forward_Passes_Cancel_Signal) {
  Harness h{0};
  meshnode::net::CancelSignal cancel;
  const auto req = make_request(http::verb::get, "/proxy/b:1");

  auto res = run_blocking(h.exec.execute_path(req, "/proxy/b:1", "node-a", Clock::now() + 5s,
                                              Logger{}, &cancel));
  EXPECT_EQ(res.result_int(), 200u);
  ASSERT_EQ(h.upstream->cancels.size(), 1u);
  EXPECT_EQ(h.upstream->cancels.front(), &cancel);
}

/**
 * @test CancelSignal_Runs_Handler_Once
 * @brief emit() runs the installed handler once; a late install runs at once;
 *        clear() drops the handler.
 */
TEST(CancelSignal, CancelSignal_Runs_Handler_Once) {
  meshnode::net::CancelSignal sig;
  int fired = 0;
  sig.install([&] { ++fired; });
  EXPECT_FALSE(sig.emitted());
  sig.emit();
  sig.emit();
  EXPECT_TRUE(sig.emitted());
  EXPECT_EQ(fired, 1);

  sig.install([&] { fired += 10; });
  EXPECT_EQ(fired, 11);

  meshnode::net::CancelSignal cleared;
  cleared.install([&] { fired += 100; });
  cleared.clear();
  cleared.emit();
  EXPECT_EQ(fired, 11);
}

// --------------------------- Statistics ------------------------------------

/**
 * @test Stats_Zero_Percent_Never_Fires
 * @brief 1000 requests at 0%: no faults, every request reaches the forward target.
 */
TEST(RequestExecutor, Stats_Zero_Percent_Never_Fires) {
  auto upstream = std::make_shared<FakeUpstream>();
  RequestExecutor exec(upstream, meshnode::routing::make_random_source(7));

  constexpr int N = 1000;
  int faults = 0;
  for (int i = 0; i < N; ++i) {
    auto res = run_blocking(exec.execute_path(make_request(http::verb::get, "/"), "/fault/500/0/proxy/b:8080",
                                              "node-a", Clock::now() + 5s, Logger{}));
    if (res.result_int() == 500u) ++faults;
  }
  EXPECT_EQ(faults, 0);
  EXPECT_EQ(upstream->calls.size(), static_cast<std::size_t>(N));
}

/**
 * @test Stats_Hundred_Percent_Never_Forwards
 * @brief 1000 requests at 100%: the hop behind the fault is never contacted.
 */
TEST(RequestExecutor, Stats_Hundred_Percent_Never_Forwards) {
  auto upstream = std::make_shared<FakeUpstream>();
  upstream->reply = FakeUpstream::envelope_reply(200, "hidden-backend");
  RequestExecutor exec(upstream, meshnode::routing::make_random_source(7));

  for (int i = 0; i < 1000; ++i) {
    auto res = run_blocking(exec.execute_path(make_request(http::verb::get, "/"), "/fault/503/100/proxy/b:8080",
                                              "node-a", Clock::now() + 5s, Logger{}));
    ASSERT_EQ(res.result_int(), 503u);
    ASSERT_EQ(res.body().find("hidden-backend"), std::string::npos);
  }
  EXPECT_TRUE(upstream->calls.empty());
}

/**
 * @test Stats_Fifty_Percent_Within_Tolerance
 * @brief 2000 requests at 50%: observed fault rate within 40%..60%.
 */
TEST(RequestExecutor, Stats_Fifty_Percent_Within_Tolerance) {
  auto upstream = std::make_shared<FakeUpstream>();
  RequestExecutor exec(upstream, meshnode::routing::make_random_source(20240601));

  constexpr int N = 2000;
  int faults = 0;
  for (int i = 0; i < N; ++i) {
    auto res = run_blocking(exec.execute_path(make_request(http::verb::get, "/"), "/fault/503/50",
                                              "node-a", Clock::now() + 5s, Logger{}));
    if (res.result_int() == 503u) ++faults;
  }
  const double rate = static_cast<double>(faults) / N;
  EXPECT_GT(rate, 0.40);
  EXPECT_LT(rate, 0.60);
}

/**
 * @test Seeded_Source_Reproducible
 * @brief Equal seeds give equal draw sequences.
 */
TEST(RandomSource, Seeded_Source_Reproducible) {
  meshnode::routing::Mt19937RandomSource a(99), b(99);
  for (int i = 0; i < 100; ++i) {
    const int x = a.uniform_int(0, 100);
    EXPECT_EQ(x, b.uniform_int(0, 100));
    EXPECT_GE(x, 0);
    EXPECT_LT(x, 100);
  }
}
