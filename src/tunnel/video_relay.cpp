#include "tunnel/video_relay.hpp"

#include <exception>
#include <iostream>
#include <vector>

namespace glonax_agent::tunnel {

VideoRelay::Subscription& VideoRelay::Subscription::operator=(Subscription&& other) noexcept {
  if (this != &other) {
    reset();
    relay_ = std::move(other.relay_);
    id_ = other.id_;
    other.id_ = 0;
  }
  return *this;
}

void VideoRelay::Subscription::reset() noexcept {
  if (id_ == 0) {
    return;
  }
  if (const auto relay = relay_.lock()) {
    (*relay)->unsubscribe(id_);
  }
  relay_.reset();
  id_ = 0;
}

VideoRelay::VideoRelay() : self_(std::make_shared<VideoRelay*>(this)) {}

VideoRelay::~VideoRelay() = default;

VideoRelay::Subscription VideoRelay::subscribe(Sink sink) {
  const std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t id = next_id_++;
  sinks_.emplace(id, std::move(sink));
  return Subscription(self_, id);
}

VideoRelay::Subscription VideoRelay::subscribe(std::shared_ptr<MediaLink> track) {
  return subscribe([track = std::move(track)](const VideoSample& sample) {
    if (track->is_open()) {
      track->send_sample(sample);
    }
  });
}

std::size_t VideoRelay::publish(const VideoSample& sample) {
  std::vector<Sink> sinks;
  {
    const std::lock_guard<std::mutex> lock(mutex_);
    sinks.reserve(sinks_.size());
    for (const auto& [_, sink] : sinks_) {
      sinks.push_back(sink);
    }
  }

  std::size_t delivered = 0;
  for (const auto& sink : sinks) {
    try {
      sink(sample);
      ++delivered;
    } catch (const std::exception& ex) {
      std::cerr << "[rtc] video sample dropped: " << ex.what() << '\n';
    }
  }
  return delivered;
}

std::size_t VideoRelay::subscriber_count() const {
  const std::lock_guard<std::mutex> lock(mutex_);
  return sinks_.size();
}

void VideoRelay::unsubscribe(const std::uint64_t id) {
  const std::lock_guard<std::mutex> lock(mutex_);
  sinks_.erase(id);
}

}  // namespace glonax_agent::tunnel
