#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>

#include "transfer/transfer_types.hpp"

namespace transfer
{

// Single-producer progress sequence for one session. The engine pushes from
// the loop thread and closes it when the session resolves; the consumer
// drains in order from any thread. Once closed and drained it stays empty.
class ProgressStream
{
  public:
    void push(const ProgressEvent &ev);
    void close();

    // Blocks until an event is available or the stream is closed and drained.
    bool next(ProgressEvent &out);

    bool closed() const;

  private:
    mutable std::mutex        mu_;
    std::condition_variable   cv_;
    std::deque<ProgressEvent> events_;
    bool                      closed_{false};
};

}  // namespace transfer
