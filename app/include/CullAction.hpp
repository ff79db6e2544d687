#ifndef CULL_ACTION_HPP
#define CULL_ACTION_HPP

#include <QString>
#include <QStringList>
#include <array>
#include <map>
#include <optional>

// Everything a gesture can trigger. Skip currently behaves like Next but is
// kept separate so skipped images can be tracked on their own.
enum class CullAction {
    Keep,
    Reject,
    Next,
    Previous,
    Skip,
    Disabled
};

// Logical input gestures the canvas can deliver.
enum class Gesture {
    PrimaryClick,
    SecondaryClick,
    WheelUp,
    WheelDown
};

// Gesture -> configured action name, as read from the settings document.
// Names are kept raw so unknown ones can be reported when binding.
using GestureMapping = std::map<Gesture, QString>;

constexpr std::array<CullAction, 6> kAllActions = {
    CullAction::Keep, CullAction::Reject, CullAction::Next,
    CullAction::Previous, CullAction::Skip, CullAction::Disabled
};

constexpr std::array<Gesture, 4> kAllGestures = {
    Gesture::PrimaryClick, Gesture::SecondaryClick, Gesture::WheelUp, Gesture::WheelDown
};

std::optional<CullAction> action_from_name(const QString& name);
QString action_name(CullAction action);
QString action_label(CullAction action);
QStringList valid_action_names();

// "left_click", "right_click", "wheel_up", "wheel_down"
QString gesture_config_key(Gesture gesture);
// Section of the settings document holding the gesture's mapping
QString gesture_config_section(Gesture gesture);
// Dotted path, e.g. "button_mappings.left_click"
QString gesture_config_path(Gesture gesture);
QString gesture_label(Gesture gesture);

#endif // CULL_ACTION_HPP
