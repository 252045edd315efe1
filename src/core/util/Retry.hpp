#pragma once
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "core/Errors.hpp"

namespace pmp {

struct RetryPolicy {
  int attempts = 3;                              // total tries, >= 1
  std::chrono::milliseconds initialBackoff{200};
  std::chrono::milliseconds maxBackoff{5000};
};

// Runs fn, retrying only on BackendUnavailableError with exponential backoff.
// The last BackendUnavailableError is rethrown once attempts are exhausted.
template <typename Fn>
auto with_retry(const RetryPolicy& policy, const std::string& what, Fn&& fn) -> decltype(fn()) {
  auto backoff = policy.initialBackoff;
  const int attempts = policy.attempts < 1 ? 1 : policy.attempts;
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const BackendUnavailableError& e) {
      if (attempt >= attempts) {
        spdlog::error("{}: giving up after {} attempt(s): {}", what, attempt, e.what());
        throw;
      }
      spdlog::warn("{}: attempt {}/{} failed ({}), retrying in {} ms",
                   what, attempt, attempts, e.what(), backoff.count());
      std::this_thread::sleep_for(backoff);
      backoff = std::min(backoff * 2, policy.maxBackoff);
    }
  }
}

} // namespace pmp
