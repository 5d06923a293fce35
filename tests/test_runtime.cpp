#include "test_framework.hpp"

#include "domshield/dom/document.hpp"
#include "domshield/runtime/clock.hpp"
#include "domshield/runtime/event_loop.hpp"
#include "domshield/runtime/idle_scheduler.hpp"
#include "domshield/runtime/page.hpp"

#include <memory>
#include <string>
#include <vector>

void register_runtime_tests(std::vector<domshield::tests::TestCase> &tests) {
  using domshield::tests::require;
  namespace runtime = domshield::runtime;
  namespace dom = domshield::dom;

  tests.push_back({"event_loop_runs_timers_in_due_order", [] {
                     runtime::ManualClock clock(1'000);
                     runtime::EventLoop loop(clock);
                     std::vector<std::string> order;
                     (void)loop.set_timeout([&order] { order.push_back("late"); }, 30);
                     (void)loop.set_timeout([&order] { order.push_back("early"); }, 10);
                     loop.post([&order] { order.push_back("posted"); });

                     require(loop.run_pending() == 1, "only the posted task is due");
                     clock.advance(30);
                     require(loop.run_pending() == 2, "both timers due");
                     require(order == std::vector<std::string>{"posted", "early", "late"},
                             "due order");
                     require(!loop.has_pending_work(), "loop drained");
                   }});

  tests.push_back({"event_loop_interval_repeats_until_cleared", [] {
                     runtime::ManualClock clock;
                     runtime::EventLoop loop(clock);
                     int ticks = 0;
                     const auto id = loop.set_interval([&ticks] { ++ticks; }, 150);
                     loop.run_until(1'000, [&clock](runtime::Millis at) { clock.set(at); });
                     require(ticks == 6, "150ms interval fires six times in one second");
                     require(clock.now_ms() == 1'000, "clock ends at the deadline");

                     loop.clear_timer(id);
                     loop.run_until(2'000, [&clock](runtime::Millis at) { clock.set(at); });
                     require(ticks == 6, "cleared interval stays quiet");
                   }});

  tests.push_back({"event_loop_idle_requests_run_in_slice_or_on_timeout", [] {
                     runtime::ManualClock clock;
                     runtime::EventLoop loop(clock);
                     std::vector<runtime::IdleDeadline> seen;
                     (void)loop.request_idle(
                         [&seen](const runtime::IdleDeadline &deadline) {
                           seen.push_back(deadline);
                         },
                         500);
                     require(loop.pending_idle_requests() == 1, "queued");
                     require(loop.run_idle_slice(16) == 1, "idle slice runs the request");
                     require(seen.size() == 1 && !seen[0].did_timeout &&
                                 seen[0].time_remaining == 16,
                             "slice deadline");
                     require(!loop.has_pending_work(), "timeout timer cancelled with it");

                     (void)loop.request_idle(
                         [&seen](const runtime::IdleDeadline &deadline) {
                           seen.push_back(deadline);
                         },
                         500);
                     loop.run_until(499, [&clock](runtime::Millis at) { clock.set(at); });
                     require(seen.size() == 1, "not yet timed out");
                     loop.run_until(500, [&clock](runtime::Millis at) { clock.set(at); });
                     require(seen.size() == 2 && seen[1].did_timeout, "ran by timeout");
                     require(loop.pending_idle_requests() == 0, "request consumed");
                   }});

  tests.push_back({"event_loop_idle_slice_stops_at_budget", [] {
                     runtime::ManualClock clock;
                     runtime::EventLoop loop(clock);
                     int ran = 0;
                     for (int i = 0; i < 5; ++i) {
                       (void)loop.request_idle(
                           [&ran, &clock](const runtime::IdleDeadline &) {
                             ++ran;
                             clock.advance(4);
                           },
                           1'000);
                     }
                     (void)loop.run_idle_slice(8);
                     require(ran == 2, "two 4ms tasks fit an 8ms slice");
                     require(loop.pending_idle_requests() == 3, "rest wait for the next slice");
                   }});

  tests.push_back({"idle_scheduler_falls_back_to_timer", [] {
                     runtime::ManualClock clock;
                     runtime::EventLoop loop(clock);
                     runtime::IdleScheduler scheduler(loop, false);
                     int ran = 0;
                     (void)scheduler.schedule([&ran] { ++ran; }, 500, 100);
                     require(loop.pending_idle_requests() == 0, "no idle request without support");
                     loop.run_until(99, [&clock](runtime::Millis at) { clock.set(at); });
                     require(ran == 0, "fallback delay not reached");
                     loop.run_until(100, [&clock](runtime::Millis at) { clock.set(at); });
                     require(ran == 1, "fallback timer ran");

                     const auto id = scheduler.schedule([&ran] { ++ran; }, 500, 100);
                     scheduler.cancel(id);
                     loop.run_until(1'000, [&clock](runtime::Millis at) { clock.set(at); });
                     require(ran == 1, "cancelled work never runs");
                   }});

  tests.push_back({"page_delivers_mutations_through_the_loop", [] {
                     runtime::ManualClock clock;
                     runtime::Page page(dom::Document::create(), clock, {"https://a.test/"});
                     int deliveries = 0;
                     auto observer = std::make_shared<dom::MutationObserver>(
                         [&deliveries](const std::vector<dom::MutationRecord> &) {
                           ++deliveries;
                         });
                     dom::MutationObserverInit init;
                     init.child_list = true;
                     init.subtree = true;
                     observer->observe(page.document().document_element(), init);

                     page.document().body()->append_child(page.document().create_element("p"));
                     page.document().body()->append_child(page.document().create_element("p"));
                     require(deliveries == 0, "delivery is asynchronous");
                     page.pump();
                     require(deliveries == 1, "one delivery for the batch");
                   }});

  tests.push_back({"page_init_tokens_are_claimed_once", [] {
                     runtime::ManualClock clock;
                     runtime::Page page(nullptr, clock);
                     require(page.claim_init_token("x"), "first claim");
                     require(!page.claim_init_token("x"), "second claim refused");
                     require(page.has_init_token("x"), "token recorded");
                     require(page.document().body() != nullptr, "default document created");
                   }});
}
