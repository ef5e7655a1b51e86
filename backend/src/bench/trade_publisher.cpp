#include "bench/trade_publisher.hpp"
#include "codec/message_codec.hpp"

#include <stdexcept>

double wall_clock_seconds()
{
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

TradePublisher::TradePublisher(PushSocket& socket, bool benchmarking, std::size_t window)
    : socket_(socket), benchmarking_(benchmarking), window_(window)
{
    if (window_ == 0) throw std::invalid_argument("latency window must be positive");
    if (benchmarking_) samples_.reserve(window_);
}

PublishResult TradePublisher::publish_trade(Side side, double qty)
{
    return publish(TradeEvent{side, qty, wall_clock_seconds()});
}

PublishResult TradePublisher::publish(const Event& ev)
{
    return send_frame(MessageCodec::encode(ev));
}

PublishResult TradePublisher::send_frame(std::string frame)
{
    PublishResult r;
    const auto t0 = std::chrono::steady_clock::now();
    r.status = socket_.try_send(std::move(frame));
    r.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - t0);

    if (r.ok()) ++published_;
    else ++dropped_;
    if (benchmarking_) record(r.elapsed_us());
    return r;
}

void TradePublisher::record(double us)
{
    if (samples_.size() < window_) {
        samples_.push_back(us);
        return;
    }
    samples_[next_] = us;
    next_ = (next_ + 1) % window_;
}

LatencyStats TradePublisher::latency_stats() const
{
    std::vector<double> copy = samples_;
    return compute_latency_stats(copy);
}

void TradePublisher::reset_stats()
{
    samples_.clear();
    next_ = 0;
}
