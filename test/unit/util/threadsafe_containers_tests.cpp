// Copyright (c) 2025 The bitwire developers
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>

#include "util/threadsafe_containers.hpp"

#include <string>
#include <thread>
#include <vector>

using bitwire::util::ThreadSafeMap;

TEST_CASE("ThreadSafeMap basic operations", "[threadsafe_map]") {
  ThreadSafeMap<int, std::string> map;

  CHECK(map.Insert(1, "one"));
  CHECK_FALSE(map.Insert(1, "uno"));
  CHECK(map.Size() == 1);

  std::string seen;
  CHECK(map.Read(1, [&](const std::string& v) { seen = v; }));
  CHECK(seen == "one");
  CHECK_FALSE(map.Read(2, [&](const std::string&) {}));

  CHECK(map.Erase(1));
  CHECK_FALSE(map.Erase(1));
  CHECK(map.Size() == 0);
}

TEST_CASE("ThreadSafeMap ForEach visits keys in order", "[threadsafe_map]") {
  ThreadSafeMap<int, int> map;
  map.Insert(3, 30);
  map.Insert(1, 10);
  map.Insert(2, 20);

  std::vector<int> keys;
  int sum = 0;
  map.ForEach([&](int k, int v) {
    keys.push_back(k);
    sum += v;
  });
  CHECK(keys == std::vector<int>{1, 2, 3});
  CHECK(sum == 60);
}

TEST_CASE("ThreadSafeMap concurrent inserts", "[threadsafe_map]") {
  ThreadSafeMap<int, int> map;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&map, t] {
      for (int i = 0; i < 250; ++i) {
        map.Insert(t * 1000 + i, i);
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  CHECK(map.Size() == 1000);
}
