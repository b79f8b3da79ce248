#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace tsdb {

// Ограничение на graceful shutdown: дедлайн и/или ручная отмена.
// Передаётся через shared_ptr; nullptr, ошибка вызывающего.
class ShutdownContext {
public:
  using clock = std::chrono::steady_clock;

  // Без дедлайна, завершается только через cancel().
  static std::shared_ptr<ShutdownContext> background() {
    return std::shared_ptr<ShutdownContext>(new ShutdownContext(std::nullopt));
  }

  static std::shared_ptr<ShutdownContext> with_deadline(clock::time_point tp) {
    return std::shared_ptr<ShutdownContext>(new ShutdownContext(tp));
  }

  static std::shared_ptr<ShutdownContext> with_timeout(clock::duration d) {
    return with_deadline(clock::now() + d);
  }

  void cancel() noexcept { cancelled_.store(true); }

  bool cancelled() const noexcept { return cancelled_.load(); }

  bool expired() const {
    return deadline_.has_value() && clock::now() >= *deadline_;
  }

  bool done() const { return cancelled() || expired(); }

  const std::optional<clock::time_point> &deadline() const noexcept {
    return deadline_;
  }

private:
  explicit ShutdownContext(std::optional<clock::time_point> deadline)
      : deadline_(deadline) {}

  const std::optional<clock::time_point> deadline_;
  std::atomic<bool> cancelled_{false};
};

} // namespace tsdb
