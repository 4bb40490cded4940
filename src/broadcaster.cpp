#include "broadcaster.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

ClientSession::ClientSession(Broadcaster& owner, uint64_t id)
    : owner_(owner), id_(id), last_sent_(Clock::now()) {}

ClientSession::~ClientSession() { owner_.release(id_); }

Broadcaster::Broadcaster(StreamConfig cfg, const EncodeCache& cache,
                         const ProcessingState& processing, const NightVision& nv,
                         MetricsRegistry* metrics)
    : cfg_(std::move(cfg)), cache_(cache), processing_(processing), nv_(nv), metrics_(metrics) {}

std::shared_ptr<ClientSession> Broadcaster::try_acquire() {
  std::lock_guard<std::mutex> g(slots_mu_);
  if (active_.load() >= cfg_.max_clients) {
    if (metrics_) metrics_->inc_rejected();
    spdlog::warn("Rejecting client: {} of {} slots in use", active_.load(), cfg_.max_clients);
    return nullptr;
  }
  active_.fetch_add(1);
  auto session = std::make_shared<ClientSession>(*this, next_id_.fetch_add(1));
  spdlog::info("Client {} connected ({}/{})", session->id(), active_.load(), cfg_.max_clients);
  return session;
}

void Broadcaster::release(uint64_t id) {
  std::lock_guard<std::mutex> g(slots_mu_);
  active_.fetch_sub(1);
  spdlog::info("Client {} disconnected ({}/{})", id, active_.load(), cfg_.max_clients);
}

std::chrono::milliseconds Broadcaster::client_interval() const {
  const bool reduced = nv_.active() || processing_.get().reduce_processing;
  const int fps = std::max(1, reduced ? cfg_.reduced_stream_fps : cfg_.stream_fps);
  return std::chrono::milliseconds(1000 / fps);
}

bool Broadcaster::write_part(const JpegBytes& jpeg, const ChunkWriter& write) const {
  const std::string header = "--" + cfg_.boundary +
                             "\r\nContent-Type: image/jpeg\r\nContent-Length: " +
                             std::to_string(jpeg.size()) + "\r\n\r\n";
  if (!write(header.data(), header.size())) return false;
  if (!write(reinterpret_cast<const char*>(jpeg.data()), jpeg.size())) return false;
  return write("\r\n", 2);
}

void Broadcaster::stream(ClientSession& session, const ChunkWriter& write,
                         const std::atomic<bool>& running) const {
  const auto empty_wait = std::chrono::milliseconds(std::max(1, cfg_.empty_wait_ms));
  while (running) {
    const auto interval = client_interval();
    const auto since = Clock::now() - session.last_sent_;
    if (since < interval) {
      std::this_thread::sleep_for(interval - since);
    }

    EncodedFrame f = cache_.get();
    if (f.empty() || f.seq == session.last_seq_) {
      std::this_thread::sleep_for(empty_wait);
      continue;
    }

    if (!write_part(*f.bytes, write)) {
      spdlog::debug("Client {} write failed after {} frames", session.id(), session.frames_sent_);
      return;
    }
    session.last_seq_ = f.seq;
    session.last_sent_ = Clock::now();
    session.frames_sent_++;
  }
}
