#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace tale {

// Campaign-keyed exclusive locks. Contention is rejected, never queued.
class CampaignLockRegistry {
 public:
  class Guard {
   public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

    const std::string& campaign_id() const { return campaign_id_; }

   private:
    friend class CampaignLockRegistry;
    Guard(CampaignLockRegistry* registry, std::string campaign_id);
    void release();

    CampaignLockRegistry* registry_ = nullptr;
    std::string campaign_id_;
  };

  std::optional<Guard> try_acquire(const std::string& campaign_id);
  bool is_locked(const std::string& campaign_id) const;

 private:
  void release(const std::string& campaign_id);

  mutable std::mutex mutex_;
  std::set<std::string> held_;
};

} // namespace tale
