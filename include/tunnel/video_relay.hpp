#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>

#include "tunnel/peer_link.hpp"

namespace glonax_agent::tunnel {

// Fans one shared video source out to every subscribed track without
// buffering: a subscriber that is not open simply misses the sample.
class VideoRelay {
 public:
  using Sink = std::function<void(const VideoSample&)>;

  // Unsubscribes on destruction.
  class Subscription {
   public:
    Subscription() = default;
    Subscription(std::weak_ptr<VideoRelay*> relay, std::uint64_t id) : relay_(std::move(relay)), id_(id) {}
    ~Subscription() { reset(); }

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;
    Subscription(Subscription&& other) noexcept { *this = std::move(other); }
    Subscription& operator=(Subscription&& other) noexcept;

    void reset() noexcept;
    [[nodiscard]] bool active() const noexcept { return id_ != 0; }

   private:
    std::weak_ptr<VideoRelay*> relay_{};
    std::uint64_t id_{0};
  };

  VideoRelay();
  ~VideoRelay();

  VideoRelay(const VideoRelay&) = delete;
  VideoRelay& operator=(const VideoRelay&) = delete;

  [[nodiscard]] Subscription subscribe(Sink sink);
  [[nodiscard]] Subscription subscribe(std::shared_ptr<MediaLink> track);

  // Returns the number of sinks the sample was offered to.
  std::size_t publish(const VideoSample& sample);

  [[nodiscard]] std::size_t subscriber_count() const;

  // Index of the only source this relay carries.
  static constexpr std::int64_t kSourceTrack = 0;

 private:
  void unsubscribe(std::uint64_t id);

  mutable std::mutex mutex_{};
  std::unordered_map<std::uint64_t, Sink> sinks_{};
  std::uint64_t next_id_{1};
  std::shared_ptr<VideoRelay*> self_;
};

}  // namespace glonax_agent::tunnel
