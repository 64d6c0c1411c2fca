// InstanceRegistry: RCU implementation notes
// We implement RCU with shared_ptr snapshots:
//   • Readers: atomic_load (ACQUIRE) → non-blocking, consistent view.
//   • Writers: build the next map, atomic_store (RELEASE).
// Old snapshots stay alive until the last reader drops its reference.

#include "sluice/scheduler/instance_registry.hpp"

#include <algorithm>
#include <memory>   // atomic_load/atomic_store for shared_ptr
#include <unordered_set>

#include "sluice/obs/logging.hpp"

namespace sluice::scheduler {

//------------------------------- Validation -----------------------------------

bool InstanceRegistry::validateId(std::string_view id) noexcept {
    if (id.empty() || id.size() > Limits::MaxIdLen) return false;
    // Allow [A-Za-z0-9_.:-]
    for (char c : id) {
        const bool ok = (c == '_' || c == '-' || c == '.' || c == ':' ||
                         (c >= '0' && c <= '9') ||
                         (c >= 'A' && c <= 'Z') ||
                         (c >= 'a' && c <= 'z'));
        if (!ok) return false;
    }
    return true;
}

bool InstanceRegistry::validateInstance(const ServiceInstance& inst, std::string_view service_id) noexcept {
    if (!validateId(inst.id)) return false;
    if (inst.service_id != service_id) return false;
    if (inst.host.empty() || inst.host.size() > Limits::MaxHostLen) return false;
    return inst.port != 0;
}

InstanceList InstanceRegistry::sanitize(const InstanceList& list, std::string_view service_id) {
    InstanceList out;
    out.reserve(std::min(list.size(), Limits::MaxInstancesPerService));
    std::unordered_set<std::string_view> seen;
    for (const auto& inst : list) {
        if (out.size() >= Limits::MaxInstancesPerService || !validateInstance(inst, service_id) ||
            !seen.insert(inst.id).second) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            obs::logger()->warn("registry dropped instance '{}' of {}", inst.id, service_id);
            continue;
        }
        out.push_back(inst);
    }
    return out;
}

//------------------------------- Public API -----------------------------------

std::shared_ptr<const InstanceRegistry::Map>
InstanceRegistry::snapshot() const noexcept {
    // RCU read: acquire pairs with the RELEASE in publish().
    return std::atomic_load_explicit(&map_, std::memory_order_acquire);
}

std::optional<ServiceRecord> InstanceRegistry::service_state(std::string_view service_id) const {
    auto snap = snapshot();
    if (!snap) return std::nullopt;
    auto it = snap->find(service_id);
    if (it == snap->end()) return std::nullopt;
    return it->second; // copy
}

std::vector<std::string> InstanceRegistry::service_ids() const {
    std::vector<std::string> out;
    auto snap = snapshot();
    if (!snap) return out;
    out.reserve(snap->size());
    for (const auto& kv : *snap) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

bool InstanceRegistry::hasService(std::string_view service_id) const noexcept {
    auto snap = snapshot();
    return snap && (snap->find(service_id) != snap->end());
}

std::size_t InstanceRegistry::size() const noexcept {
    auto snap = snapshot();
    return snap ? snap->size() : 0;
}

std::optional<ServiceInstance> InstanceRegistry::findInstance(std::string_view service_id,
                                                              std::string_view instance_id) const {
    auto snap = snapshot();
    if (!snap) return std::nullopt;
    auto it = snap->find(service_id);
    if (it == snap->end()) return std::nullopt;
    for (const auto* list : {&it->second.healthy, &it->second.unhealthy}) {
        for (const auto& inst : *list) {
            if (inst.id == instance_id) return inst;
        }
    }
    return std::nullopt;
}

RegistryErr InstanceRegistry::apply(const SchedulerSnapshot& s) {
    if (s.available_service_ids.size() > Limits::MaxServices) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return RegistryErr::Capacity;
    }

    auto next = std::make_shared<Map>();
    next->reserve(s.available_service_ids.size());
    for (const auto& service_id : s.available_service_ids) {
        if (!validateId(service_id)) {
            failures_.fetch_add(1, std::memory_order_relaxed);
            obs::logger()->warn("registry ignored invalid service id '{}'", service_id);
            continue;
        }
        ServiceRecord rec;
        rec.healthy   = sanitize(SchedulerSnapshot::instances_of(s.healthy_instances, service_id), service_id);
        rec.unhealthy = sanitize(SchedulerSnapshot::instances_of(s.unhealthy_instances, service_id), service_id);
        rec.killed    = sanitize(SchedulerSnapshot::instances_of(s.killed_instances, service_id), service_id);
        next->emplace(service_id, std::move(rec));
    }

    publish(std::move(next));
    applies_.fetch_add(1, std::memory_order_relaxed);
    return RegistryErr::Ok;
}

RegistryErr InstanceRegistry::upsertService(std::string_view service_id, ServiceRecord record) {
    if (!validateId(service_id)) { failures_.fetch_add(1, std::memory_order_relaxed); return RegistryErr::Invalid; }
    for (const auto* list : {&record.healthy, &record.unhealthy, &record.killed}) {
        for (const auto& inst : *list) {
            if (!validateInstance(inst, service_id)) {
                failures_.fetch_add(1, std::memory_order_relaxed);
                return RegistryErr::Invalid;
            }
        }
    }

    auto snap = snapshot();
    if (snap->size() >= Limits::MaxServices && snap->find(service_id) == snap->end()) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return RegistryErr::Capacity;
    }

    auto next = std::make_shared<Map>(*snap); // copy-on-write
    next->insert_or_assign(std::string(service_id), std::move(record));
    publish(std::move(next));
    upserts_.fetch_add(1, std::memory_order_relaxed);
    return RegistryErr::Ok;
}

RegistryErr InstanceRegistry::removeService(std::string_view service_id) noexcept {
    auto snap = snapshot();
    if (!snap || snap->find(service_id) == snap->end()) return RegistryErr::NotFound;

    auto next = std::make_shared<Map>(*snap);
    next->erase(next->find(service_id));
    publish(std::move(next));
    removes_.fetch_add(1, std::memory_order_relaxed);
    return RegistryErr::Ok;
}

void InstanceRegistry::clear() noexcept {
    publish(std::make_shared<Map>());
    // Not counting as failure/success here; treated as maintenance op.
}

InstanceRegistry::Stats InstanceRegistry::stats() const noexcept {
    Stats s;
    s.applies           = applies_.load(std::memory_order_relaxed);
    s.upserts           = upserts_.load(std::memory_order_relaxed);
    s.removes           = removes_.load(std::memory_order_relaxed);
    s.failures          = failures_.load(std::memory_order_relaxed);
    s.dropped_instances = dropped_.load(std::memory_order_relaxed);
    return s;
}

void InstanceRegistry::publish(std::shared_ptr<Map> next) noexcept {
    // RCU update: RELEASE pairs with reader ACQUIRE so the fully built map is visible.
    std::shared_ptr<const Map> cnext = std::move(next); // convert Map -> const Map
    std::atomic_store_explicit(&map_, std::move(cnext), std::memory_order_release);
    version_.fetch_add(1, std::memory_order_relaxed);
}

} // namespace sluice::scheduler
