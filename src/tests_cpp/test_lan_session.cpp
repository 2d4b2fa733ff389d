#include "../engine/room_controller.hpp"
#include "../observability/simple_metrics.hpp"
#include "test_support.hpp"
#include <cassert>
#include <future>
#include <iostream>

using namespace lanshare;
using namespace std::chrono_literals;

namespace {

// Waits for an acknowledged-send completion.
class SendWaiter {
public:
  RoomController::SendCallback callback() {
    auto p = promise_;
    return [p](const SendResult &r) { p->set_value(r); };
  }
  SendResult get(std::chrono::milliseconds timeout = 5s) {
    auto f = promise_->get_future();
    if (f.wait_for(timeout) != std::future_status::ready)
      throw std::runtime_error("send did not complete");
    return f.get();
  }

private:
  std::shared_ptr<std::promise<SendResult>> promise_ =
      std::make_shared<std::promise<SendResult>>();
};

RoomOptions single_options(uint16_t base) {
  return test::loopback_options(base, base, base + 10, base + 19);
}

size_t pending_for(RoomController &room, const PeerId &peer) {
  auto counts = room.pending_share_counts();
  auto it = counts.find(peer);
  return it == counts.end() ? 0 : it->second.count;
}

} // namespace

void test_pair_session() {
  // Each node announces to the other's discovery port.
  test::TestNode a("lan-a", "AAA",
                   test::loopback_options(47301, 47302, 47310, 47319));
  test::TestNode b("lan-b", "ZZZ",
                   test::loopback_options(47302, 47301, 47320, 47329));

  assert(a.room().join_room("RIVER1", "Alice"));
  assert(b.room().join_room("RIVER1", "Bob"));
  assert(test::wait_until(
      [&] { return a.connected_to("ZZZ") && b.connected_to("AAA"); }));

  // Several announcement rounds later the lower id has dialed exactly once
  std::this_thread::sleep_for(700ms);
  assert(a.room().connect_attempts() == 1);
  assert(b.room().connect_attempts() == 0);
  auto status = a.room().status();
  assert(status.peers.size() == 1);
  assert(status.peers[0].display_name == "Bob" && status.peers[0].connected);

  // One article
  SendWaiter one;
  a.room().send_articles_with_ack("ZZZ", {test::make_article(1)}, false,
                                  one.callback());
  SendResult r = one.get();
  assert(r.success && !r.queued && r.error.empty());
  assert(test::wait_until([&] { return b.log().articles().size() == 1; }));
  auto got = b.log().articles()[0];
  assert(got.peer_id == "AAA" && got.sender_name == "Alice");
  assert(got.article == test::make_article(1));
  assert(b.log().batches().empty());

  // Two articles arrive as one batch event
  SendWaiter two;
  a.room().send_articles_with_ack(
      "ZZZ", {test::make_article(2), test::make_article(3)}, false,
      two.callback());
  assert(two.get().success);
  assert(test::wait_until([&] { return b.log().batches().size() == 1; }));
  assert(b.log().batches()[0].articles.size() == 2);
  assert(b.log().articles().size() == 1);

  // Broadcast from the other side
  std::promise<std::map<PeerId, SendResult>> fanout;
  b.room().broadcast_articles_with_ack(
      {test::make_article(4)}, true,
      [&](const std::map<PeerId, SendResult> &results) {
        fanout.set_value(results);
      });
  auto results = fanout.get_future().get();
  assert(results.size() == 1);
  assert(results.at("AAA").success);

  // Echo round trip
  assert(a.room().send_echo("ZZZ"));
  assert(test::wait_until([&] { return a.log().echoes().size() == 1; }));
  assert(a.log().echoes()[0].sender_name == "Bob");
  assert(a.log().echoes()[0].round_trip_ms >= 0);

  assert(a.room().broadcast(make_heartbeat()) == 1);
  assert(a.room().send_to_peer("ZZZ", make_heartbeat()));
  assert(!a.room().send_to_peer("nobody", make_heartbeat()));

  // Leaving with goodbye
  b.room().leave_room();
  assert(test::wait_until([&] { return !a.log().disconnects().empty(); }));
  std::this_thread::sleep_for(300ms);
  auto gone = a.log().disconnects();
  assert(gone.size() == 1);
  assert(gone[0].peer_id == "ZZZ" && gone[0].reason == DisconnectReason::Goodbye);
  assert(!a.connected_to("ZZZ"));
  assert(a.room().status().in_room);
  a.room().leave_room();
  std::cout << "[PASS] Two nodes discover, share and part" << std::endl;
}

void test_ack_timeout_queues() {
  test::TestNode node("lan-ack", "AAA", single_options(47340));
  assert(node.room().join_room("RIVER1", "Alice"));

  test::RawPeer raw;
  assert(raw.join(node.room().tcp_port(), "PEER1", "Raw"));
  assert(test::wait_until([&] { return node.connected_to("PEER1"); }));

  SendWaiter queued;
  node.room().send_articles_with_ack(
      "PEER1", {test::make_article(1), test::make_article(2)}, true,
      queued.callback());
  auto batch = raw.read_until(MessageKind::ArticleShareBatch);
  assert(batch && batch->articles.size() == 2);
  assert(batch->sender_name == "Alice");
  SendResult r = queued.get();
  assert(!r.success && r.queued);
  assert(r.error == "ack timeout");
  assert(pending_for(node.room(), "PEER1") == 2);
  assert(!node.log().pending().empty());

  raw.send(make_heartbeat());
  SendWaiter unqueued;
  node.room().send_articles_with_ack("PEER1", {test::make_article(3)}, false,
                                     unqueued.callback());
  assert(raw.read_until(MessageKind::ArticleShareBatch));
  r = unqueued.get();
  assert(!r.success && !r.queued && r.error == "ack timeout");
  assert(pending_for(node.room(), "PEER1") == 2);

  // Now drain and acknowledge
  raw.send(make_heartbeat());
  assert(node.room().process_pending_shares_for_peer("PEER1"));
  batch = raw.read_until(MessageKind::ArticleShareBatch);
  assert(batch && batch->articles.size() == 2);
  assert(batch->articles[0] == test::make_article(1));
  raw.send(make_share_ack(batch->message_id));
  assert(test::wait_until(
      [&] { return pending_for(node.room(), "PEER1") == 0; }));
  assert(!node.room().process_pending_shares_for_peer("PEER1"));

  node.room().leave_room();
  std::cout << "[PASS] Unacknowledged shares are queued" << std::endl;
}

void test_offline_queue_drains_on_connect() {
  test::TestNode node("lan-offline", "AAA", single_options(47360));
  assert(node.room().join_room("RIVER1", "Alice"));

  SendWaiter offline;
  node.room().send_article_with_queue("PEER2", "Later", test::make_article(7),
                                      offline.callback());
  SendResult r = offline.get();
  assert(!r.success && r.queued && r.error == "peer not connected");

  SendWaiter bad_url;
  Article local{"http://192.168.1.5/feed", "Local", {}, {}, {}};
  node.room().send_article_with_queue("PEER2", "Later", local,
                                      bad_url.callback());
  r = bad_url.get();
  assert(!r.success && !r.queued && r.error == "invalid article url");

  auto rows = node.room().pending_shares();
  assert(rows.size() == 1);
  assert(rows[0].peer_id == "PEER2" && rows[0].peer_name == "Later");

  SendWaiter no_queue;
  node.room().send_articles_with_ack("PEER2", {test::make_article(8)}, false,
                                     no_queue.callback());
  r = no_queue.get();
  assert(!r.success && !r.queued);
  assert(pending_for(node.room(), "PEER2") == 1);

  // The peer shows up and receives the queue without asking
  test::RawPeer raw;
  assert(raw.join(node.room().tcp_port(), "PEER2", "Later"));
  auto batch = raw.read_until(MessageKind::ArticleShareBatch);
  assert(batch && batch->articles.size() == 1);
  assert(batch->articles[0] == test::make_article(7));
  raw.send(make_share_ack(batch->message_id));
  assert(test::wait_until(
      [&] { return pending_for(node.room(), "PEER2") == 0; }));
  assert(test::wait_until([&] {
    auto events = node.log().pending();
    return !events.empty() && events.back().counts.empty();
  }));

  node.room().leave_room();
  std::cout << "[PASS] Offline queue drains on connect" << std::endl;
}

void test_drain_gives_up() {
  auto o = single_options(47380);
  o.max_share_attempts = 2;
  SimpleMetrics sm;
  set_metrics(&sm);
  {
    test::TestNode node("lan-giveup", "AAA", o);
    assert(node.room().join_room("RIVER1", "Alice"));
    node.pending().add("PEER3", "Flaky", test::make_article(9));

    test::RawPeer raw;
    assert(raw.join(node.room().tcp_port(), "PEER3", "Flaky"));
    assert(raw.read_until(MessageKind::ArticleShareBatch));
    assert(test::wait_until([&] {
      auto rows = node.room().pending_shares();
      return rows.size() == 1 && rows[0].attempts == 1;
    }));

    raw.send(make_heartbeat());
    assert(node.room().process_pending_shares_for_peer("PEER3"));
    // A second drain while one is in flight is refused
    assert(!node.room().process_pending_shares_for_peer("PEER3"));
    assert(raw.read_until(MessageKind::ArticleShareBatch));
    assert(test::wait_until([&] { return node.room().pending_shares().empty(); }));
    assert(sm.get_count("pending_discarded") == 1);
    node.room().leave_room();
  }
  set_metrics(nullptr);
  std::cout << "[PASS] Pending share discarded after max attempts" << std::endl;
}

void test_silent_peer_times_out() {
  test::TestNode node("lan-silent", "AAA", single_options(47400));
  assert(node.room().join_room("RIVER1", "Alice"));

  test::RawPeer raw;
  assert(raw.join(node.room().tcp_port(), "PEER4", "Quiet"));
  assert(test::wait_until([&] { return node.connected_to("PEER4"); }));

  // Heartbeats keep coming while we say nothing
  assert(raw.read_until(MessageKind::Heartbeat));

  assert(test::wait_until([&] { return !node.log().disconnects().empty(); },
                          4s));
  std::this_thread::sleep_for(700ms);
  auto gone = node.log().disconnects();
  assert(gone.size() == 1);
  assert(gone[0].peer_id == "PEER4");
  assert(gone[0].display_name == "Quiet");
  assert(gone[0].reason == DisconnectReason::Timeout);
  assert(!node.connected_to("PEER4"));
  assert(raw.wait_closed());

  node.room().leave_room();
  std::cout << "[PASS] Silent peer times out once" << std::endl;
}

void test_answering_peer_stays() {
  test::TestNode node("lan-alive", "AAA", single_options(47420));
  assert(node.room().join_room("RIVER1", "Alice"));

  test::RawPeer raw;
  assert(raw.join(node.room().tcp_port(), "PEER5", "Chatty"));
  auto until = std::chrono::steady_clock::now() + 2500ms;
  while (std::chrono::steady_clock::now() < until) {
    if (auto hb = raw.read_until(MessageKind::Heartbeat, 500ms))
      raw.send(make_heartbeat_ack());
  }
  assert(node.connected_to("PEER5"));
  assert(node.log().disconnects().empty());

  // Dropping the socket is reported as an error
  raw.close();
  assert(test::wait_until([&] { return !node.log().disconnects().empty(); }));
  auto gone = node.log().disconnects();
  assert(gone.size() == 1 && gone[0].reason == DisconnectReason::Error);
  node.room().leave_room();
  std::cout << "[PASS] Heartbeat answers keep a peer alive" << std::endl;
}

void test_leave_says_goodbye() {
  test::TestNode node("lan-bye", "AAA", single_options(47440));
  assert(node.room().join_room("RIVER1", "Alice"));

  test::RawPeer p1, p2, p3;
  assert(p1.join(node.room().tcp_port(), "PEER6", "One"));
  assert(p2.join(node.room().tcp_port(), "PEER7", "Two"));
  assert(p3.join(node.room().tcp_port(), "PEER8", "Three"));
  assert(test::wait_until([&] { return node.room().status().peers.size() == 3; }));

  SendWaiter cancelled;
  node.room().send_articles_with_ack("PEER6", {test::make_article(1)}, false,
                                     cancelled.callback());
  assert(p1.read_until(MessageKind::ArticleShareBatch));

  node.room().leave_room();
  SendResult r = cancelled.get();
  assert(!r.success && r.error == "cancelled");

  for (auto *p : {&p1, &p2, &p3}) {
    auto bye = p->read_until(MessageKind::Goodbye);
    assert(bye && bye->peer_id == "AAA");
    assert(p->wait_closed());
  }
  auto res = node.room().resources();
  assert(res.sockets == 0 && res.timers == 0);
  // Goodbyes we send do not count as disconnect events
  assert(node.log().disconnects().empty());
  std::cout << "[PASS] Leave sends goodbye to every peer" << std::endl;
}

void test_goodbye_follows_queued_frames() {
  test::TestNode node("lan-bye-busy", "AAA", single_options(47480));

  for (int round = 0; round < 5; ++round) {
    assert(node.room().join_room("RIVER1", "Alice"));
    std::vector<PeerId> ids;
    std::vector<std::unique_ptr<test::RawPeer>> peers;
    for (int i = 0; i < 3; ++i) {
      ids.push_back("BUSY" + std::to_string(round) + std::to_string(i));
      peers.push_back(std::make_unique<test::RawPeer>());
      assert(peers.back()->join(node.room().tcp_port(), ids.back(), "Busy"));
    }
    assert(test::wait_until(
        [&] { return node.room().status().peers.size() == 3; }));

    // Leave while every link still has frames waiting to be written
    for (const auto &id : ids) {
      node.room().send_to_peer(id, make_heartbeat());
      node.room().send_articles_with_ack(
          id, {test::make_article(round)}, false, [](const SendResult &) {});
      node.room().send_to_peer(id, make_heartbeat());
    }
    node.room().leave_room();

    for (auto &p : peers) {
      auto batch = p->read_until(MessageKind::ArticleShareBatch);
      assert(batch && batch->articles.size() == 1);
      auto bye = p->read_until(MessageKind::Goodbye);
      assert(bye && bye->peer_id == "AAA");
      assert(p->wait_closed());
    }
  }
  assert(node.log().disconnects().empty());
  std::cout << "[PASS] Goodbye follows frames still queued at leave"
            << std::endl;
}

void test_bad_frames() {
  auto o = single_options(47460);
  o.max_frame_bytes = 2048;
  SimpleMetrics sm;
  set_metrics(&sm);
  {
    test::TestNode node("lan-frames", "AAA", o);
    assert(node.room().join_room("RIVER1", "Alice"));

    // Shares before a handshake are ignored
    test::RawPeer early;
    assert(early.connect(node.room().tcp_port()));
    early.send(make_share_batch("x-1", "Sneaky", {test::make_article(1)}));
    assert(test::wait_until(
        [&] { return sm.get_count("frames_dropped_before_handshake") == 1; }));
    assert(node.log().articles().empty());

    // Garbage lines are dropped but the link survives
    test::RawPeer raw;
    assert(raw.join(node.room().tcp_port(), "PEER9", "Noisy"));
    raw.send_raw("this is not json\n");
    raw.send_raw("{\"type\":\"telepathy\"}\n");
    raw.send(make_share_batch("x-2", "Noisy", {test::make_article(2)}));
    auto ack = raw.read_until(MessageKind::ArticleShareAck);
    assert(ack && ack->message_id == "x-2");
    assert(test::wait_until([&] { return node.log().articles().size() == 1; }));
    assert(sm.get_count("frames_dropped_malformed") == 1);
    assert(sm.get_count("frames_dropped_unknown_type") == 1);

    // A frame over the limit ends the link
    raw.send_raw(std::string(4096, 'x'));
    assert(test::wait_until([&] { return !node.log().disconnects().empty(); }));
    assert(node.log().disconnects()[0].reason == DisconnectReason::Error);
    assert(sm.get_count("frames_dropped_oversize") == 1);
    node.room().leave_room();
  }
  set_metrics(nullptr);
  std::cout << "[PASS] Bad frames handled" << std::endl;
}

int main() {
  try {
    test_pair_session();
    test_ack_timeout_queues();
    test_offline_queue_drains_on_connect();
    test_drain_gives_up();
    test_silent_peer_times_out();
    test_answering_peer_stays();
    test_leave_says_goodbye();
    test_goodbye_follows_queued_frames();
    test_bad_frames();
    std::cout << "All LAN session tests passed!" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Test Failed: " << e.what() << std::endl;
    return 1;
  }
  return 0;
}
