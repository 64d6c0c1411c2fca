#pragma once
/**
 * @file cluster.hpp
 * @brief Peer-router interfaces: membership/gossip view and offer transport.
 *
 * A router only sees its peers through these two narrow interfaces. The view
 * is eventually consistent (gossiped metrics); the transport is fire-and-forget
 * with the outcome carried back on the offer's response cell.
 */

#include <cstdint>
#include <string>
#include <vector>

#include "sluice/core/messages.hpp"

namespace sluice::cluster {

/** @class ClusterView
 *  @brief Read side of cluster membership and shared metrics.
 */
class ClusterView {
public:
    virtual ~ClusterView() = default;

    /// Ids of live peers, excluding the asking router.
    virtual std::vector<std::string> peer_router_ids() const = 0;

    /// Requests of @p service_id waiting for an instance at @p router_id (0 when unknown).
    virtual std::int64_t waiting_requests(const std::string& router_id, const std::string& service_id) const = 0;
};

/** @class InterRouterTransport
 *  @brief Delivery of work-stealing traffic to a peer.
 */
class InterRouterTransport {
public:
    virtual ~InterRouterTransport() = default;

    /**
     * @brief Hand @p offer to @p router_id. The peer answers on offer.response.
     * @return false when the peer is unreachable (offer not delivered).
     */
    virtual bool send_offer(const std::string& router_id, core::WorkStealingOffer offer) = 0;

    /// Tell the owner @p router_id that the borrowed instance is no longer used.
    virtual bool complete_offer(const std::string& router_id, const std::string& service_id,
                                const std::string& instance_id, const std::string& cid) = 0;
};

/** @class ClusterMember
 *  @brief Receiving end of a router as seen by the transport.
 */
class ClusterMember {
public:
    virtual ~ClusterMember() = default;

    [[nodiscard]] virtual const std::string& router_id() const noexcept = 0;

    /// Inbound offer; answered asynchronously on offer.response.
    virtual void receive_offer(core::WorkStealingOffer offer) = 0;

    /// The borrower at another router released @p instance_id.
    virtual void receive_offer_complete(const std::string& service_id, const std::string& instance_id,
                                        const std::string& cid) = 0;

    /// Local waiting requests for @p service_id (gossiped to peers).
    [[nodiscard]] virtual std::int64_t waiting_requests(const std::string& service_id) const = 0;

    /// @p router_id left the cluster.
    virtual void peer_departed(const std::string& router_id) = 0;
};

} // namespace sluice::cluster
