#include <catch2/catch.hpp>

#include <ucon/detail/grant.hpp>

#include <vector>

using namespace ucon;

struct counter_state {
  int value = 0;
};

TEST_CASE("grant creates zero initialized state on first enter", "[grant]") {
  grant<counter_state, 2> g;

  CHECK(!g.attached(5));
  CHECK(g.enter_existing(5, [](counter_state &) { return error_code::success; }) == error_code::invalid);

  CHECK(g.enter(5, [](counter_state &s) {
    CHECK(s.value == 0);
    s.value = 7;
    return error_code::success;
  }) == error_code::success);
  CHECK(g.attached(5));

  int seen = 0;
  CHECK(g.enter_existing(5, [&](counter_state &s) {
    seen = s.value;
    return error_code::busy;
  }) == error_code::busy);
  CHECK(seen == 7);
}

TEST_CASE("grant has a fixed capacity", "[grant]") {
  grant<counter_state, 2> g;
  auto noop = [](counter_state &) { return error_code::success; };

  CHECK(g.enter(1, noop) == error_code::success);
  CHECK(g.enter(2, noop) == error_code::success);
  CHECK(g.enter(3, noop) == error_code::no_memory);
  CHECK(g.size() == 2);

  CHECK(g.release(1) == error_code::success);
  CHECK(g.release(1) == error_code::invalid);
  CHECK(g.enter(3, [](counter_state &s) {
    // reused entry is clean
    CHECK(s.value == 0);
    return error_code::success;
  }) == error_code::success);
}

TEST_CASE("grant releases state", "[grant]") {
  grant<counter_state, 2> g;
  g.enter(1, [](counter_state &s) { s.value = 3; return error_code::success; });
  REQUIRE(g.release(1) == error_code::success);

  g.enter(1, [](counter_state &s) {
    CHECK(s.value == 0);
    return error_code::success;
  });
}

TEST_CASE("grant reports nested access to the same entry", "[grant]") {
  grant<counter_state, 3> g;

  error_code inner = error_code::success;
  error_code other = error_code::fail;
  error_code release = error_code::success;
  g.enter(1, [&](counter_state &) {
    inner = g.enter(1, [](counter_state &) { return error_code::success; });
    other = g.enter(2, [](counter_state &) { return error_code::success; });
    release = g.release(1);
    return error_code::success;
  });

  CHECK(inner == error_code::reserve);
  CHECK(other == error_code::success);
  CHECK(release == error_code::reserve);
  CHECK(g.attached(1));
}

TEST_CASE("grant visits processes in attachment order", "[grant]") {
  grant<counter_state, 4> g;
  for (process_id pid : {30u, 10u, 20u}) {
    g.enter(pid, [&](counter_state &s) { s.value = static_cast<int>(pid); return error_code::success; });
  }

  std::vector<process_id> order;
  g.each([&](process_id pid, counter_state &s) {
    CHECK(s.value == static_cast<int>(pid));
    order.push_back(pid);
    return false;
  });
  CHECK(order == std::vector<process_id>{30, 10, 20});

  // stops at the first hit
  order.clear();
  g.each([&](process_id pid, counter_state &) {
    order.push_back(pid);
    return pid == 10;
  });
  CHECK(order == std::vector<process_id>{30, 10});

  // entered entries are skipped
  order.clear();
  g.enter(10, [&](counter_state &) {
    g.each([&](process_id pid, counter_state &) {
      order.push_back(pid);
      return false;
    });
    return error_code::success;
  });
  CHECK(order == std::vector<process_id>{30, 20});
}
