#pragma once

#include "fetch_cache/async_result.hpp"

#include <atomic>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <thread>
#include <vector>

namespace fetch_cache {

template <typename T> using Operation = std::function<T(std::stop_token)>;

// Runs one operation on its own thread, bounded by a timeout. A timed out
// operation is asked to stop through its token and its thread is parked
// until it returns; whatever it produces afterwards is dropped.
class OperationRunner {
public:
  explicit OperationRunner(Millis timeout);
  ~OperationRunner();

  OperationRunner(const OperationRunner &) = delete;
  OperationRunner &operator=(const OperationRunner &) = delete;

  template <typename T> AsyncResult<T> run(Operation<T> op);

  Millis timeout() const { return timeout_; }
  std::size_t parked() const;

private:
  struct Parked {
    std::jthread worker;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void park(std::jthread worker, std::shared_ptr<std::atomic<bool>> done);
  void reap();
  void reap_locked();

  Millis timeout_;
  mutable std::mutex mu_;
  std::vector<Parked> parked_;
};

template <typename T> AsyncResult<T> OperationRunner::run(Operation<T> op) {
  reap();
  const auto start = Clock::now();
  auto promise = std::make_shared<std::promise<T>>();
  auto future = promise->get_future();
  auto done = std::make_shared<std::atomic<bool>>(false);

  std::jthread worker;
  try {
    worker = std::jthread([op = std::move(op), promise, done](std::stop_token stop) {
      try {
        promise->set_value(op(stop));
      } catch (...) {
        promise->set_exception(std::current_exception());
      }
      done->store(true);
    });
  } catch (const std::system_error &e) {
    return AsyncResult<T>::fail(ErrorKind::Failure, e.what(), elapsed_ms(start));
  }

  if (future.wait_for(timeout_) != std::future_status::ready) {
    worker.request_stop();
    park(std::move(worker), std::move(done));
    return AsyncResult<T>::fail(ErrorKind::Timeout, kTimeoutMessage,
                                elapsed_ms(start));
  }
  worker.join();

  try {
    return AsyncResult<T>::ok(future.get(), elapsed_ms(start));
  } catch (const std::exception &e) {
    return AsyncResult<T>::fail(ErrorKind::Failure, e.what(), elapsed_ms(start));
  } catch (...) {
    return AsyncResult<T>::fail(ErrorKind::Failure, "Unknown error",
                                elapsed_ms(start));
  }
}

} // namespace fetch_cache
