#ifndef ACTION_ROUTER_HPP
#define ACTION_ROUTER_HPP

#include "CullAction.hpp"
#include <QString>
#include <functional>
#include <map>
#include <optional>

// Whatever delivers gestures (the image canvas in the app, a fake in tests).
// A gesture has at most one handler; connecting again replaces it.
class GestureSource {
public:
    using Handler = std::function<void()>;

    virtual ~GestureSource() = default;

    virtual void connect_gesture(Gesture gesture, Handler handler) = 0;
    virtual void disconnect_gesture(Gesture gesture) = 0;
};

// Low-level wheel input. Some platforms report one signal with a signed
// delta, others report two discrete button-style signals.
enum class WheelSignal {
    Combined,
    DiscreteUp,
    DiscreteDown
};

class ActionRouter {
public:
    using ActionHandler = std::function<void()>;

    explicit ActionRouter(GestureSource& source);
    ~ActionRouter();

    ActionRouter(const ActionRouter&) = delete;
    ActionRouter& operator=(const ActionRouter&) = delete;

    // Dispatch table entry; Disabled never gets one
    void set_action_handler(CullAction action, ActionHandler handler);

    // Releases every gesture bound so far, then binds from mapping.
    // "disabled" and unrecognized names leave the gesture unbound.
    void bind(const GestureMapping& mapping);
    void unbind_all();

    CullAction bound_action(Gesture gesture) const;
    bool is_bound(Gesture gesture) const;

    // "L-Click: KEEP  |  R-Click: REJECT  |  Wheel: PREVIOUS/NEXT"
    QString instructions_text() const;

    // Positive delta is up; a zero delta on a combined signal is nothing
    static std::optional<Gesture> normalize_wheel(WheelSignal signal, int delta = 0);

private:
    void dispatch(CullAction action);

    GestureSource& source_;
    std::map<CullAction, ActionHandler> handlers_;
    std::map<Gesture, CullAction> bindings_;
};

#endif // ACTION_ROUTER_HPP
