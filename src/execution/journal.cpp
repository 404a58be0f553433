#include <lockbox/execution/journal.hpp>
#include <iterator>
#include <utility>

namespace lockbox::execution {

journal::~journal() {
  if (!committed_) {
    rollback();
  }
}

void journal::on_rollback(std::function<void()> undo) {
  undo_.push_back(std::move(undo));
}

void journal::emit(lockbox::schema::transaction_event_t event) {
  events_.push_back(std::move(event));
}

const std::vector<lockbox::schema::transaction_event_t>& journal::events()
    const {
  return events_;
}

std::vector<lockbox::schema::transaction_event_t> journal::commit() {
  committed_ = true;
  undo_.clear();
  return std::exchange(events_, {});
}

void journal::rollback() {
  for (auto it = std::rbegin(undo_); it != std::rend(undo_); ++it) {
    (*it)();
  }
  undo_.clear();
  events_.clear();
}

}  // namespace lockbox::execution
