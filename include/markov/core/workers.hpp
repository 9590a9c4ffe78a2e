#pragma once
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace markov {

// Runs body(t) for t in [0, n), each on its own thread started by spawn.
// The first exception from a body, or from a failed launch, is rethrown once
// every started thread has been joined.
template <class Body, class Spawn>
void run_workers(std::size_t n, Body body, Spawn spawn) {
  std::vector<std::thread> workers;
  workers.reserve(n);

  std::mutex error_mu;
  std::exception_ptr first_error = nullptr;

  auto guarded = [&](std::size_t t) {
    try {
      body(t);
    } catch (...) {
      std::scoped_lock lk(error_mu);
      if (!first_error)
        first_error = std::current_exception();
    }
  };

  try {
    for (std::size_t t = 0; t < n; ++t)
      workers.push_back(spawn([&guarded, t]() { guarded(t); }));
  } catch (...) {
    for (auto &th : workers)
      th.join();
    throw;
  }

  for (auto &th : workers)
    th.join();
  if (first_error)
    std::rethrow_exception(first_error);
}

template <class Body>
void run_workers(std::size_t n, Body body) {
  run_workers(n, std::move(body), [](auto fn) { return std::thread(std::move(fn)); });
}

} // namespace markov
