#include "tale/campaign_lock.h"

#include <utility>

namespace tale {

CampaignLockRegistry::Guard::Guard(CampaignLockRegistry* registry, std::string campaign_id)
    : registry_(registry), campaign_id_(std::move(campaign_id)) {}

CampaignLockRegistry::Guard::Guard(Guard&& other) noexcept
    : registry_(std::exchange(other.registry_, nullptr)), campaign_id_(std::move(other.campaign_id_)) {}

CampaignLockRegistry::Guard& CampaignLockRegistry::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    release();
    registry_ = std::exchange(other.registry_, nullptr);
    campaign_id_ = std::move(other.campaign_id_);
  }
  return *this;
}

CampaignLockRegistry::Guard::~Guard() {
  release();
}

void CampaignLockRegistry::Guard::release() {
  if (registry_ != nullptr) {
    registry_->release(campaign_id_);
    registry_ = nullptr;
  }
}

std::optional<CampaignLockRegistry::Guard> CampaignLockRegistry::try_acquire(const std::string& campaign_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!held_.insert(campaign_id).second) {
    return std::nullopt;
  }
  return Guard(this, campaign_id);
}

bool CampaignLockRegistry::is_locked(const std::string& campaign_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return held_.count(campaign_id) > 0;
}

void CampaignLockRegistry::release(const std::string& campaign_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  held_.erase(campaign_id);
}

} // namespace tale
