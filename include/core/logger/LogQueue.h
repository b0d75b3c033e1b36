// ============================================================================
// LOG QUEUE - Bounded hand-off of log lines between tasks
// ============================================================================
// Any task may push(); one consumer task calls takeAll(). When full the
// oldest line is dropped and counted.
// ============================================================================

#ifndef LOG_QUEUE_H
#define LOG_QUEUE_H

#include <deque>
#include <mutex>
#include <string>
#include <vector>

class LogQueue {
public:
  explicit LogQueue(size_t capacity);

  void push(std::string line);

  /** Oldest first, leaves the queue empty */
  std::vector<std::string> takeAll();

  size_t size() const;
  size_t droppedCount() const;

private:
  const size_t _capacity;
  mutable std::mutex _mutex;
  std::deque<std::string> _lines;
  size_t _dropped;
};

#endif // LOG_QUEUE_H
