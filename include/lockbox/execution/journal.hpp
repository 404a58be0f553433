#pragma once

#include <lockbox/schema/transaction_event.hpp>
#include <functional>
#include <vector>

namespace lockbox::execution {

/// Undo log for one public engine call.
///
/// Core components register an undo action next to every mutation they make
/// and stage their events here. `commit()` publishes the staged events;
/// destroying an uncommitted journal reverts every mutation in reverse order
/// and drops the staged events.
class journal final {
 public:
  journal() = default;
  ~journal();

  journal(const journal&) = delete;
  journal& operator=(const journal&) = delete;
  journal(journal&&) = delete;
  journal& operator=(journal&&) = delete;

  void on_rollback(std::function<void()> undo);
  void emit(lockbox::schema::transaction_event_t event);

  const std::vector<lockbox::schema::transaction_event_t>& events() const;

  /// Keep every mutation and hand over the staged events.
  std::vector<lockbox::schema::transaction_event_t> commit();

  /// Revert every mutation recorded so far. Safe to call more than once.
  void rollback();

 private:
  std::vector<std::function<void()>> undo_;
  std::vector<lockbox::schema::transaction_event_t> events_;
  bool committed_{false};
};

}  // namespace lockbox::execution
