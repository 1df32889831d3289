#pragma once

/**
 * @file event.h
 * @brief Decoded scene-mutation commands and outbound input events
 */

#include <glint/drawable.h>
#include <glint/tween.h>
#include <string>
#include <variant>
#include <vector>

namespace glint {

/// Insert or update a drawable by id
struct DrawEvent {
    Drawable drawable;
};

/// Start (or replace) the tween for (targetId, property of value)
struct AnimateEvent {
    std::string targetId;
    PropertyValue value;
    float duration = 0.0f;
    Easing easing = Easing::Linear;

    TweenProperty property() const { return propertyOf(value); }
};

/**
 * @brief Bind an input event on a drawable
 *
 * Firing the binding sends (targetId, eventName) back to the runtime and
 * applies any attached reactions locally.
 */
struct RegisterHandlerEvent {
    std::string targetId;
    std::string eventName;
    std::vector<AnimateEvent> reactions;
};

/// A line without a recognised tag; kept for logging, ignored by the store
struct UnparsedEvent {
    std::string raw;
};

using Event = std::variant<DrawEvent, AnimateEvent, RegisterHandlerEvent, UnparsedEvent>;

/// Synthetic input event routed back to the runtime
struct OutboundEvent {
    std::string drawableId;
    std::string eventName;

    bool operator==(const OutboundEvent& o) const {
        return drawableId == o.drawableId && eventName == o.eventName;
    }
};

/// Wire form of an outbound event: "[Event] <id> <name>"
std::string encodeOutbound(const OutboundEvent& event);

} // namespace glint
