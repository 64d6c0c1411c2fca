#pragma once
/**
 * @file in_process_cluster.hpp
 * @brief Cluster of routers living in one process (local runs and tests).
 *
 * Members are registered by raw pointer and must leave() before they are
 * destroyed. Calls into a member are made under the cluster lock, which is
 * recursive so a member may reach the transport again from the same thread.
 */

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "sluice/cluster/cluster.hpp"

namespace sluice::cluster {

class InProcessCluster final {
public:
    InProcessCluster() = default;
    InProcessCluster(const InProcessCluster&)            = delete;
    InProcessCluster& operator=(const InProcessCluster&) = delete;

    /// Register @p member. Returns false if its router-id is already taken.
    bool join(ClusterMember& member);

    /// Unregister @p router_id and notify the remaining members.
    void leave(const std::string& router_id);

    [[nodiscard]] std::vector<std::string> members() const;

    /// View as seen from @p self_router_id (the cluster must outlive it).
    [[nodiscard]] std::unique_ptr<ClusterView> view(std::string self_router_id);

    /// Transport for @p self_router_id (the cluster must outlive it).
    [[nodiscard]] std::unique_ptr<InterRouterTransport> transport(std::string self_router_id);

    // Used by the adapters.
    [[nodiscard]] std::vector<std::string> peers_of(const std::string& self_router_id) const;
    [[nodiscard]] std::int64_t waiting_requests(const std::string& router_id, const std::string& service_id) const;
    bool send_offer(const std::string& router_id, core::WorkStealingOffer offer);
    bool complete_offer(const std::string& router_id, const std::string& service_id,
                        const std::string& instance_id, const std::string& cid);

private:
    [[nodiscard]] ClusterMember* find(const std::string& router_id) const;

    mutable std::recursive_mutex mu_;
    std::unordered_map<std::string, ClusterMember*> members_;
};

} // namespace sluice::cluster
