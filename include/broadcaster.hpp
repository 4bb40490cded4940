#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "controller.hpp"
#include "frame_store.hpp"
#include "metrics.hpp"
#include "night_vision.hpp"
#include "types.hpp"

struct StreamConfig {
  int max_clients{5};
  int stream_fps{30};
  int reduced_stream_fps{15};  // night vision active or reduced processing
  int empty_wait_ms{10};
  std::string boundary{"frame"};
};

class Broadcaster;

// One connected client. Releases its slot when destroyed.
class ClientSession {
public:
  ClientSession(Broadcaster& owner, uint64_t id);
  ~ClientSession();
  ClientSession(const ClientSession&) = delete;
  ClientSession& operator=(const ClientSession&) = delete;

  uint64_t id() const { return id_; }
  TimePoint last_sent() const { return last_sent_; }
  uint64_t frames_sent() const { return frames_sent_; }

private:
  friend class Broadcaster;
  Broadcaster& owner_;
  uint64_t id_;
  TimePoint last_sent_{};
  uint64_t last_seq_{0};
  uint64_t frames_sent_{0};
};

// Returns false when the client is gone.
using ChunkWriter = std::function<bool(const char* data, size_t len)>;

class Broadcaster {
public:
  Broadcaster(StreamConfig cfg, const EncodeCache& cache, const ProcessingState& processing,
              const NightVision& nv, MetricsRegistry* metrics = nullptr);

  // nullptr when max_clients sessions are already active.
  std::shared_ptr<ClientSession> try_acquire();

  // Per-client loop. Returns when a write fails or `running` goes false.
  void stream(ClientSession& session, const ChunkWriter& write,
              const std::atomic<bool>& running) const;

  // Writes one multipart part for the given JPEG.
  bool write_part(const JpegBytes& jpeg, const ChunkWriter& write) const;

  std::chrono::milliseconds client_interval() const;
  std::string content_type() const { return "multipart/x-mixed-replace; boundary=" + cfg_.boundary; }

  int active_clients() const { return active_.load(); }
  int max_clients() const { return cfg_.max_clients; }
  uint64_t total_served() const { return next_id_.load() - 1; }

private:
  friend class ClientSession;
  void release(uint64_t id);

  StreamConfig cfg_;
  const EncodeCache& cache_;
  const ProcessingState& processing_;
  const NightVision& nv_;
  MetricsRegistry* metrics_;

  std::mutex slots_mu_;
  std::atomic<int> active_{0};
  std::atomic<uint64_t> next_id_{1};
};
