/**
 * @file in_process_cluster.cpp
 * @brief Membership table and the view/transport adapters over it.
 */
#include "sluice/cluster/in_process_cluster.hpp"

#include <algorithm>
#include <utility>

#include "sluice/obs/logging.hpp"

namespace sluice::cluster {

namespace {

class LocalView final : public ClusterView {
public:
    LocalView(InProcessCluster& cluster, std::string self) : cluster_(cluster), self_(std::move(self)) {}

    std::vector<std::string> peer_router_ids() const override { return cluster_.peers_of(self_); }

    std::int64_t waiting_requests(const std::string& router_id, const std::string& service_id) const override {
        return cluster_.waiting_requests(router_id, service_id);
    }

private:
    InProcessCluster& cluster_;
    std::string       self_;
};

class LocalTransport final : public InterRouterTransport {
public:
    LocalTransport(InProcessCluster& cluster, std::string self) : cluster_(cluster), self_(std::move(self)) {}

    bool send_offer(const std::string& router_id, core::WorkStealingOffer offer) override {
        if (router_id == self_) return false;
        return cluster_.send_offer(router_id, std::move(offer));
    }

    bool complete_offer(const std::string& router_id, const std::string& service_id,
                        const std::string& instance_id, const std::string& cid) override {
        return cluster_.complete_offer(router_id, service_id, instance_id, cid);
    }

private:
    InProcessCluster& cluster_;
    std::string       self_;
};

} // namespace

bool InProcessCluster::join(ClusterMember& member) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    const auto [it, inserted] = members_.emplace(member.router_id(), &member);
    if (!inserted) {
        obs::logger()->warn("cluster: router-id {} already joined", member.router_id());
        return false;
    }
    obs::logger()->info("cluster: {} joined ({} members)", member.router_id(), members_.size());
    return true;
}

void InProcessCluster::leave(const std::string& router_id) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    if (members_.erase(router_id) == 0) return;
    obs::logger()->info("cluster: {} left ({} members)", router_id, members_.size());
    for (auto& [id, m] : members_) m->peer_departed(router_id);
}

std::vector<std::string> InProcessCluster::members() const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    std::vector<std::string> out;
    out.reserve(members_.size());
    for (const auto& kv : members_) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

std::unique_ptr<ClusterView> InProcessCluster::view(std::string self_router_id) {
    return std::make_unique<LocalView>(*this, std::move(self_router_id));
}

std::unique_ptr<InterRouterTransport> InProcessCluster::transport(std::string self_router_id) {
    return std::make_unique<LocalTransport>(*this, std::move(self_router_id));
}

std::vector<std::string> InProcessCluster::peers_of(const std::string& self_router_id) const {
    auto out = members();
    out.erase(std::remove(out.begin(), out.end(), self_router_id), out.end());
    return out;
}

std::int64_t InProcessCluster::waiting_requests(const std::string& router_id, const std::string& service_id) const {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    const auto* m = find(router_id);
    return m ? m->waiting_requests(service_id) : 0;
}

bool InProcessCluster::send_offer(const std::string& router_id, core::WorkStealingOffer offer) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    auto* m = find(router_id);
    if (!m) {
        obs::logger()->debug("cluster: offer {} to unknown router {}", offer.cid, router_id);
        return false;
    }
    m->receive_offer(std::move(offer));
    return true;
}

bool InProcessCluster::complete_offer(const std::string& router_id, const std::string& service_id,
                                      const std::string& instance_id, const std::string& cid) {
    std::lock_guard<std::recursive_mutex> lk(mu_);
    auto* m = find(router_id);
    if (!m) {
        obs::logger()->debug("cluster: completion of {} for departed router {}", cid, router_id);
        return false;
    }
    m->receive_offer_complete(service_id, instance_id, cid);
    return true;
}

ClusterMember* InProcessCluster::find(const std::string& router_id) const {
    auto it = members_.find(router_id);
    return it == members_.end() ? nullptr : it->second;
}

} // namespace sluice::cluster
