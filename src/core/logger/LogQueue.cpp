// ============================================================================
// LOG QUEUE IMPLEMENTATION
// ============================================================================

#include "core/logger/LogQueue.h"
#include <iterator>

LogQueue::LogQueue(size_t capacity)
  : _capacity(capacity > 0 ? capacity : 1),
    _dropped(0) {}

void LogQueue::push(std::string line) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_lines.size() >= _capacity) {
    _lines.pop_front();
    _dropped++;
  }
  _lines.push_back(std::move(line));
}

std::vector<std::string> LogQueue::takeAll() {
  std::deque<std::string> taken;
  {
    std::lock_guard<std::mutex> lock(_mutex);
    taken.swap(_lines);
  }
  return std::vector<std::string>(std::make_move_iterator(taken.begin()),
                                  std::make_move_iterator(taken.end()));
}

size_t LogQueue::size() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _lines.size();
}

size_t LogQueue::droppedCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _dropped;
}
