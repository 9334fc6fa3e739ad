#include "tiltbox/systems/binding_system.hpp"

#include <algorithm>

#include "tiltbox/components/basic.hpp"
#include "tiltbox/core/profile.hpp"

namespace Systems {

void BindingSystem::update(entt::registry &registry,
                           const std::vector<entt::entity> &order,
                           std::int64_t timeStepMicros,
                           const EngineConfig &config) {
    PROFILE_SCOPE("BindingSystem");

    for (entt::entity const entity : order) {
        auto *set = registry.try_get<Components::BindingSet>(entity);
        if (set == nullptr) {
            continue;
        }

        auto &body = registry.get<Components::Body>(entity);
        auto &bound = set->bound;
        bound.erase(std::remove_if(bound.begin(), bound.end(), [&](const Components::BoundPartner &entry) {
            if (!registry.valid(entry.partner)) {
                return true;
            }
            entry.binding.enforce(body, registry.get<Components::Body>(entry.partner), timeStepMicros, config);
            return false;
        }), bound.end());
    }
}

std::size_t BindingSystem::attachPending(entt::registry &registry,
                                         const std::vector<entt::entity> &order,
                                         entt::entity newcomer) {
    auto const &target = registry.get<Components::Body>(newcomer);
    std::size_t created = 0;

    for (entt::entity const entity : order) {
        auto *pending = registry.try_get<Components::PendingAnchors>(entity);
        if (pending == nullptr || pending->anchors.empty()) {
            continue;
        }

        auto const &body = registry.get<Components::Body>(entity);
        auto &bound = registry.get_or_emplace<Components::BindingSet>(entity).bound;
        auto &anchors = pending->anchors;
        anchors.erase(std::remove_if(anchors.begin(), anchors.end(), [&](const Bindings::Unbound &anchor) {
            auto binding = Bindings::Binding::tryBind(body, anchor, target);
            if (!binding) {
                return false;
            }
            bound.push_back(Components::BoundPartner{*binding, newcomer});
            ++created;
            return true;
        }), anchors.end());
    }
    return created;
}

} // namespace Systems
