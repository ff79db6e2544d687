#include "ActionRouter.hpp"
#include "AppLogger.hpp"

ActionRouter::ActionRouter(GestureSource& source)
    : source_(source) {
}

ActionRouter::~ActionRouter() {
    unbind_all();
}

void ActionRouter::set_action_handler(CullAction action, ActionHandler handler) {
    if (action == CullAction::Disabled) return;
    handlers_[action] = std::move(handler);
}

void ActionRouter::bind(const GestureMapping& mapping) {
    unbind_all();

    for (const auto& [gesture, name] : mapping) {
        const std::optional<CullAction> action = action_from_name(name);
        if (!action) {
            LOG_WARN("Router", QString("Unknown action '%1' for %2, leaving it unbound")
                     .arg(name, gesture_config_key(gesture)));
            continue;
        }
        if (*action == CullAction::Disabled) {
            continue;
        }

        const CullAction bound = *action;
        source_.connect_gesture(gesture, [this, bound]() { dispatch(bound); });
        bindings_[gesture] = bound;
        LOG_DEBUG("Router", QString("%1 -> %2").arg(gesture_label(gesture), action_name(bound)));
    }
}

void ActionRouter::unbind_all() {
    for (const auto& binding : bindings_) {
        source_.disconnect_gesture(binding.first);
    }
    bindings_.clear();
}

CullAction ActionRouter::bound_action(Gesture gesture) const {
    auto it = bindings_.find(gesture);
    return it == bindings_.end() ? CullAction::Disabled : it->second;
}

bool ActionRouter::is_bound(Gesture gesture) const {
    return bindings_.count(gesture) > 0;
}

QString ActionRouter::instructions_text() const {
    auto upper = [this](Gesture gesture) {
        return action_name(bound_action(gesture)).toUpper();
    };
    return QString("L-Click: %1  |  R-Click: %2  |  Wheel: %3/%4")
        .arg(upper(Gesture::PrimaryClick), upper(Gesture::SecondaryClick),
             upper(Gesture::WheelUp), upper(Gesture::WheelDown));
}

std::optional<Gesture> ActionRouter::normalize_wheel(WheelSignal signal, int delta) {
    switch (signal) {
        case WheelSignal::DiscreteUp:
            return Gesture::WheelUp;
        case WheelSignal::DiscreteDown:
            return Gesture::WheelDown;
        case WheelSignal::Combined:
            if (delta > 0) return Gesture::WheelUp;
            if (delta < 0) return Gesture::WheelDown;
            return std::nullopt;
    }
    return std::nullopt;
}

void ActionRouter::dispatch(CullAction action) {
    auto it = handlers_.find(action);
    if (it == handlers_.end() || !it->second) {
        LOG_DEBUG("Router", QString("No handler installed for %1").arg(action_name(action)));
        return;
    }
    it->second();
}
