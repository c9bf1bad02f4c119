#include <catch2/catch.hpp>
#include <chrono>
#include <memory>
#include <vector>

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>

#include "client/tracker/fake_transport.hpp"
#include "client/tracker/tracker.hpp"

using namespace std::chrono_literals;
using swc::test::FakeTransport;
using swc::test::TRACKER;

namespace
{
struct Session
{
  boost::asio::io_context io {};
  std::shared_ptr<FakeTransport> transport = std::make_shared<FakeTransport>();
  std::shared_ptr<aux::CancellationFlag> cancellation =
      std::make_shared<aux::CancellationFlag>();
  std::shared_ptr<swc::UdpTracker> tracker;
  std::vector<swc::AnnounceResult> results;

  explicit Session(swc::ClientSettings settings = {})
      : tracker {std::make_shared<swc::UdpTracker>(
          io.get_executor(), transport, TRACKER, settings, cancellation)}
  {
  }

  std::expected<void, swc::TrackerFailure> announce(
      swc::AnnounceRequest request = {})
  {
    return tracker->announce(request,
                             [this](swc::AnnounceResult result)
                             { results.push_back(std::move(result)); });
  }

  void connect(uint64_t connection_id = 0x1122334455667788)
  {
    REQUIRE(announce().has_value());
    transport->deliver(swc::test::connect_response(
        swc::test::transaction_of(transport->sent.back()), connection_id));
  }

  void run_until_results(size_t count)
  {
    for (int i = 0; i < 200 && results.size() < count && !io.stopped(); i++) {
      io.run_for(5ms);
    }
  }
};

swc::ClientSettings fast_retries(uint32_t max_retransmits)
{
  swc::ClientSettings settings {};
  settings.retry.request_timeout = 2ms;
  settings.retry.max_retransmits = max_retransmits;
  return settings;
}
}  // namespace

TEST_CASE("Retry backoff doubles per attempt", "[library]")
{
  swc::RetryPolicy policy {};

  REQUIRE(policy.timeout_for_attempt(0) == 15s);
  REQUIRE(policy.timeout_for_attempt(1) == 30s);
  REQUIRE(policy.timeout_for_attempt(8) == 3840s);
}

TEST_CASE("Announce connects first", "[library]")
{
  Session session {};

  REQUIRE(session.transport->handler == nullptr);
  REQUIRE(session.announce().has_value());

  REQUIRE(session.transport->handler != nullptr);
  REQUIRE(session.transport->sent.size() == 1);
  REQUIRE(session.transport->destinations[0] == TRACKER);

  const auto& connect = session.transport->sent[0];
  REQUIRE(connect.size() == 16);
  REQUIRE(swc::test::read_u64(connect, 0) == swc::ANNOUNCER_MAGIC);
  REQUIRE(swc::test::action_of(connect) == 0);

  REQUIRE(session.tracker->state() == swc::SessionState::ConnectPending);
  REQUIRE(session.tracker->queued_announces() == 1);
  REQUIRE(session.tracker->pending_requests() == 1);
  REQUIRE_FALSE(session.tracker->connection_id().has_value());
}

TEST_CASE("Announce is sent after the matching connect response", "[library]")
{
  Session session {};
  REQUIRE(session.announce().has_value());

  auto connect_transaction = swc::test::transaction_of(session.transport->sent[0]);

  session.transport->deliver(
      swc::test::connect_response(connect_transaction + 1, 42));

  REQUIRE(session.tracker->state() == swc::SessionState::ConnectPending);
  REQUIRE(session.transport->sent.size() == 1);

  session.transport->deliver(swc::test::connect_response(connect_transaction, 42));

  REQUIRE(session.tracker->state() == swc::SessionState::Ready);
  REQUIRE(session.tracker->connection_id() == 42u);
  REQUIRE(session.tracker->queued_announces() == 0);
  REQUIRE(session.transport->sent.size() == 2);

  const auto& announce = session.transport->sent[1];
  REQUIRE(announce.size() == 98);
  REQUIRE(swc::test::read_u64(announce, 0) == 42);
  REQUIRE(swc::test::action_of(announce) == 1);
  REQUIRE(session.results.empty());
}

TEST_CASE("Announce response reaches the callback", "[library]")
{
  Session session {};
  session.connect();

  std::vector<swc::PeerContactInfo> peers {
      {boost::asio::ip::make_address_v4("10.0.0.1"), 6881},
      {boost::asio::ip::make_address_v4("10.0.0.2"), 6882}};

  session.transport->deliver(swc::test::announce_response(
      swc::test::transaction_of(session.transport->sent.back()), 1800, peers));

  REQUIRE(session.results.size() == 1);
  REQUIRE(session.results[0].has_value());
  REQUIRE(session.results[0]->interval == 1800);
  REQUIRE(session.results[0]->leechers == 1);
  REQUIRE(session.results[0]->seeders == 2);
  REQUIRE(session.results[0]->peers == peers);
  REQUIRE(session.tracker->pending_requests() == 0);
}

TEST_CASE("Announce request carries caller progress and the session key", "[library]")
{
  Session session {};
  session.connect();

  swc::AnnounceRequest request {};
  request.left = 777;
  request.event = swc::AnnounceEvent::Completed;
  request.port = 6881;

  REQUIRE(session.announce(request).has_value());
  REQUIRE(session.transport->sent.size() == 3);

  const auto& first = session.transport->sent[1];
  const auto& second = session.transport->sent[2];

  REQUIRE(swc::test::read_u64(second, 64) == 777);
  REQUIRE(swc::test::read_u32(second, 80)
          == static_cast<uint32_t>(swc::AnnounceEvent::Completed));
  // key
  REQUIRE(swc::test::read_u32(first, 88) == swc::test::read_u32(second, 88));
  REQUIRE(swc::test::transaction_of(first) != swc::test::transaction_of(second));
}

TEST_CASE("Responses are matched by transaction, not by order", "[library]")
{
  Session session {};
  session.connect();
  REQUIRE(session.announce().has_value());

  auto first = swc::test::transaction_of(session.transport->sent[1]);
  auto second = swc::test::transaction_of(session.transport->sent[2]);

  session.transport->deliver(swc::test::announce_response(second, 20));
  session.transport->deliver(swc::test::announce_response(first, 10));

  REQUIRE(session.results.size() == 2);
  REQUIRE(session.results[0]->interval == 20);
  REQUIRE(session.results[1]->interval == 10);

  // duplicate of an already answered response
  session.transport->deliver(swc::test::announce_response(first, 10));
  REQUIRE(session.results.size() == 2);
}

TEST_CASE("Announces queued while connecting are all released", "[library]")
{
  Session session {};
  REQUIRE(session.announce().has_value());
  REQUIRE(session.announce().has_value());

  REQUIRE(session.transport->sent.size() == 1);
  REQUIRE(session.tracker->queued_announces() == 2);

  session.transport->deliver(swc::test::connect_response(
      swc::test::transaction_of(session.transport->sent[0]), 7));

  REQUIRE(session.transport->sent.size() == 3);
  REQUIRE(swc::test::action_of(session.transport->sent[1]) == 1);
  REQUIRE(swc::test::action_of(session.transport->sent[2]) == 1);
  REQUIRE(swc::test::transaction_of(session.transport->sent[1])
          != swc::test::transaction_of(session.transport->sent[2]));
  REQUIRE(session.tracker->pending_requests() == 2);
}

TEST_CASE("Noise is discarded", "[library]")
{
  Session session {};
  REQUIRE(session.announce().has_value());
  auto connect_transaction = swc::test::transaction_of(session.transport->sent[0]);

  // unexpected sender
  session.transport->deliver(
      swc::test::connect_response(connect_transaction, 1),
      swc::udp::endpoint {boost::asio::ip::make_address_v4("10.9.9.9"), 6969});
  // too short
  session.transport->deliver({0, 0, 0});
  // unmatched transaction
  session.transport->deliver(
      swc::test::connect_response(connect_transaction ^ 0xFFFF, 1));
  // wrong action for a pending connect
  session.transport->deliver(swc::test::announce_response(connect_transaction, 10));
  // truncated connect response
  auto truncated = swc::test::connect_response(connect_transaction, 1);
  truncated.resize(12);
  session.transport->deliver(truncated);

  REQUIRE(session.tracker->state() == swc::SessionState::ConnectPending);
  REQUIRE(session.tracker->pending_requests() == 1);
  REQUIRE(session.results.empty());

  session.transport->deliver(swc::test::connect_response(connect_transaction, 1));
  REQUIRE(session.tracker->state() == swc::SessionState::Ready);
}

TEST_CASE("Tracker error fails the request", "[library]")
{
  Session session {};
  session.connect();

  session.transport->deliver(swc::test::error_response(
      swc::test::transaction_of(session.transport->sent.back()), "torrent not registered"));

  REQUIRE(session.results.size() == 1);
  REQUIRE_FALSE(session.results[0].has_value());
  REQUIRE(session.results[0].error().code == swc::TrackerErrc::Rejected);
  REQUIRE(session.results[0].error().message == "torrent not registered");
  REQUIRE(session.tracker->state() == swc::SessionState::Ready);
}

TEST_CASE("Tracker error on connect fails queued announces", "[library]")
{
  Session session {};
  REQUIRE(session.announce().has_value());
  REQUIRE(session.announce().has_value());

  session.transport->deliver(swc::test::error_response(
      swc::test::transaction_of(session.transport->sent[0]), "go away"));

  REQUIRE(session.results.size() == 2);
  REQUIRE(session.results[1].error().code == swc::TrackerErrc::Rejected);
  REQUIRE(session.tracker->state() == swc::SessionState::Uninitialized);
  REQUIRE(session.tracker->queued_announces() == 0);
}

TEST_CASE("Send failure is reported immediately", "[library]")
{
  Session session {};
  session.transport->next_error =
      make_error_code(boost::asio::error::network_unreachable);

  auto sent = session.announce();

  REQUIRE_FALSE(sent.has_value());
  REQUIRE(sent.error().code == swc::TrackerErrc::TransportFailure);
  REQUIRE(session.tracker->state() == swc::SessionState::Uninitialized);
  REQUIRE(session.tracker->queued_announces() == 0);
  REQUIRE(session.tracker->pending_requests() == 0);
  REQUIRE(session.results.empty());
}

TEST_CASE("Unanswered connect is retransmitted then times out", "[library]")
{
  Session session {fast_retries(2)};
  REQUIRE(session.announce().has_value());

  session.run_until_results(1);

  REQUIRE(session.transport->sent.size() == 3);
  REQUIRE(session.transport->sent[1] == session.transport->sent[0]);
  REQUIRE(session.transport->sent[2] == session.transport->sent[0]);

  REQUIRE(session.results.size() == 1);
  REQUIRE(session.results[0].error().code == swc::TrackerErrc::Timeout);
  REQUIRE(session.tracker->state() == swc::SessionState::Uninitialized);
  REQUIRE(session.tracker->pending_requests() == 0);
}

TEST_CASE("Unanswered announce times out and keeps the connection", "[library]")
{
  Session session {fast_retries(1)};
  session.connect();

  session.run_until_results(1);

  REQUIRE(session.transport->sent.size() == 3);
  REQUIRE(session.transport->sent[2] == session.transport->sent[1]);
  REQUIRE(session.results.size() == 1);
  REQUIRE(session.results[0].error().code == swc::TrackerErrc::Timeout);
  REQUIRE(session.tracker->state() == swc::SessionState::Ready);
}

TEST_CASE("Expired connection id triggers a new connect", "[library]")
{
  swc::ClientSettings settings {};
  settings.connection_ttl = 0s;

  Session session {settings};
  session.connect();
  REQUIRE(session.transport->sent.size() == 2);

  REQUIRE(session.announce().has_value());

  REQUIRE(session.transport->sent.size() == 3);
  REQUIRE(swc::test::action_of(session.transport->sent[2]) == 0);
  REQUIRE(session.tracker->state() == swc::SessionState::ConnectPending);
}

TEST_CASE("Retransmission after expiry reconnects first", "[library]")
{
  auto settings = fast_retries(3);
  settings.connection_ttl = 0s;

  Session session {settings};
  session.connect(42);
  REQUIRE(session.transport->sent.size() == 2);

  for (int i = 0; i < 100 && session.transport->sent.size() < 3; i++) {
    session.io.run_one_for(5ms);
  }

  REQUIRE(session.transport->sent.size() == 3);
  REQUIRE(swc::test::action_of(session.transport->sent[2]) == 0);
  REQUIRE(session.tracker->state() == swc::SessionState::ConnectPending);
  REQUIRE(session.tracker->queued_announces() == 1);
  REQUIRE_FALSE(session.tracker->connection_id().has_value());

  session.transport->deliver(swc::test::connect_response(
      swc::test::transaction_of(session.transport->sent[2]), 99));

  const auto& announce = session.transport->sent.back();
  REQUIRE(swc::test::action_of(announce) == 1);
  REQUIRE(swc::test::read_u64(announce, 0) == 99);
  REQUIRE(session.results.empty());

  // the retry budget carries over, so the announce still ends in a timeout
  session.run_until_results(1);

  REQUIRE(session.results.size() == 1);
  REQUIRE(session.results[0].error().code == swc::TrackerErrc::Timeout);
}

TEST_CASE("Teardown drops pending requests without callbacks", "[library]")
{
  Session session {fast_retries(8)};
  session.connect();
  REQUIRE(session.announce().has_value());
  REQUIRE(session.tracker->pending_requests() == 2);

  std::weak_ptr<swc::UdpTracker> weak = session.tracker;
  session.tracker.reset();

  REQUIRE(weak.expired());
  REQUIRE(session.transport->closed);
  REQUIRE(session.transport->handler == nullptr);

  session.io.run_for(50ms);
  REQUIRE(session.results.empty());
}

TEST_CASE("Shutdown rejects further announces", "[library]")
{
  Session session {};
  REQUIRE(session.announce().has_value());

  session.tracker->shutdown();

  REQUIRE(session.tracker->pending_requests() == 0);
  REQUIRE(session.tracker->queued_announces() == 0);
  REQUIRE(session.results.empty());

  auto sent = session.announce();
  REQUIRE_FALSE(sent.has_value());
  REQUIRE(sent.error().code == swc::TrackerErrc::ShutDown);
}

TEST_CASE("Stop request halts retransmission", "[library]")
{
  Session session {fast_retries(8)};
  REQUIRE(session.announce().has_value());

  session.cancellation->request();
  session.io.run_for(50ms);

  REQUIRE(session.transport->sent.size() == 1);
  REQUIRE(session.results.empty());

  auto sent = session.announce();
  REQUIRE_FALSE(sent.has_value());
  REQUIRE(sent.error().code == swc::TrackerErrc::ShutDown);
}

TEST_CASE("Stopped event is sent once after a stop request", "[library]")
{
  Session session {};
  session.connect(42);
  auto pending = session.tracker->pending_requests();

  session.cancellation->request();

  swc::AnnounceRequest request {};
  request.event = swc::AnnounceEvent::Started;
  REQUIRE(session.tracker->announce_stopped(request).has_value());

  const auto& stopped = session.transport->sent.back();
  REQUIRE(session.transport->sent.size() == 3);
  REQUIRE(swc::test::action_of(stopped) == 1);
  REQUIRE(swc::test::read_u64(stopped, 0) == 42);
  REQUIRE(swc::test::read_u32(stopped, 80)
          == static_cast<uint32_t>(swc::AnnounceEvent::Stopped));
  REQUIRE(session.tracker->pending_requests() == pending);

  session.tracker->shutdown();
  REQUIRE(session.tracker->announce_stopped(request).error().code
          == swc::TrackerErrc::ShutDown);
}

TEST_CASE("Stopped event needs a connection id", "[library]")
{
  Session session {};
  REQUIRE(session.announce().has_value());

  auto sent = session.tracker->announce_stopped({});

  REQUIRE_FALSE(sent.has_value());
  REQUIRE(sent.error().code == swc::TrackerErrc::NotConnected);
  REQUIRE(session.transport->sent.size() == 1);
}
