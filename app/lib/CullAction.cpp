#include "CullAction.hpp"

std::optional<CullAction> action_from_name(const QString& name) {
    const QString key = name.trimmed().toLower();
    for (CullAction action : kAllActions) {
        if (action_name(action) == key) {
            return action;
        }
    }
    return std::nullopt;
}

QString action_name(CullAction action) {
    switch (action) {
        case CullAction::Keep:     return "keep";
        case CullAction::Reject:   return "reject";
        case CullAction::Next:     return "next";
        case CullAction::Previous: return "previous";
        case CullAction::Skip:     return "skip";
        case CullAction::Disabled: return "disabled";
    }
    return "disabled";
}

QString action_label(CullAction action) {
    QString name = action_name(action);
    name[0] = name[0].toUpper();
    return name;
}

QStringList valid_action_names() {
    QStringList names;
    for (CullAction action : kAllActions) {
        names << action_name(action);
    }
    return names;
}

QString gesture_config_key(Gesture gesture) {
    switch (gesture) {
        case Gesture::PrimaryClick:   return "left_click";
        case Gesture::SecondaryClick: return "right_click";
        case Gesture::WheelUp:        return "wheel_up";
        case Gesture::WheelDown:      return "wheel_down";
    }
    return QString();
}

QString gesture_config_section(Gesture gesture) {
    switch (gesture) {
        case Gesture::PrimaryClick:
        case Gesture::SecondaryClick:
            return "button_mappings";
        case Gesture::WheelUp:
        case Gesture::WheelDown:
            return "wheel_mappings";
    }
    return QString();
}

QString gesture_config_path(Gesture gesture) {
    return gesture_config_section(gesture) + "." + gesture_config_key(gesture);
}

QString gesture_label(Gesture gesture) {
    switch (gesture) {
        case Gesture::PrimaryClick:   return "Left Click";
        case Gesture::SecondaryClick: return "Right Click";
        case Gesture::WheelUp:        return "Wheel Up";
        case Gesture::WheelDown:      return "Wheel Down";
    }
    return QString();
}
