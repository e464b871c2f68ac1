#include "transfer/progress_stream.hpp"

namespace transfer
{

void ProgressStream::push(const ProgressEvent &ev)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (closed_)
            return;
        events_.push_back(ev);
    }
    cv_.notify_all();
}

void ProgressStream::close()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressStream::next(ProgressEvent &out)
{
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return closed_ || !events_.empty(); });
    if (events_.empty())
        return false;
    out = events_.front();
    events_.pop_front();
    return true;
}

bool ProgressStream::closed() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return closed_;
}

}  // namespace transfer
