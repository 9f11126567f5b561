#pragma once
#include <optional>
#include <string>

namespace proctor::vision {

// Labels the decoder is allowed to emit. Class names from the model config are mapped
// onto these at the decode boundary; anything unrecognised becomes OTHER.
enum class ObjectLabel {
    PERSON = 0,
    PHONE,
    BOOK,
    PAPER,
    OTHER
};

inline std::string toString(ObjectLabel l) {
    switch (l) {
        case ObjectLabel::PERSON: return "person";
        case ObjectLabel::PHONE:  return "phone";
        case ObjectLabel::BOOK:   return "book";
        case ObjectLabel::PAPER:  return "paper";
        default:                  return "other";
    }
}

// "cell phone" / "mobile phone" are the COCO-style spellings
inline ObjectLabel labelFromClassName(const std::string& name) {
    if (name == "person")                                               return ObjectLabel::PERSON;
    if (name == "phone" || name == "cell phone" || name == "mobile phone") return ObjectLabel::PHONE;
    if (name == "book")                                                 return ObjectLabel::BOOK;
    if (name == "paper")                                                return ObjectLabel::PAPER;
    return ObjectLabel::OTHER;
}

// Coarse gaze zones, highest classification priority is PHONE.
enum class GazeZoneKind {
    SCREEN = 0,
    KEYBOARD,
    PHONE,
    AWAY_HORIZONTAL,
    CEILING
};

inline std::string toString(GazeZoneKind z) {
    switch (z) {
        case GazeZoneKind::SCREEN:          return "screen";
        case GazeZoneKind::KEYBOARD:        return "keyboard";
        case GazeZoneKind::PHONE:           return "phone";
        case GazeZoneKind::AWAY_HORIZONTAL: return "away-horizontal";
        case GazeZoneKind::CEILING:         return "ceiling";
    }
    return "screen";
}

// Where a HeadPose came from. Consumers must not branch on this.
enum class PoseSource {
    MODEL = 0,
    LANDMARKS
};

enum class Severity {
    LOW = 0,
    MEDIUM,
    HIGH
};

inline std::string toString(Severity s) {
    switch (s) {
        case Severity::LOW:    return "low";
        case Severity::MEDIUM: return "medium";
        case Severity::HIGH:   return "high";
    }
    return "low";
}

enum class ViolationKind {
    MULTIPLE_PERSONS = 0,
    ABSENCE,
    FORBIDDEN_OBJECT,
    GAZE_DEVIATION,
    TAB_SWITCH,
    FULLSCREEN_EXIT,
    LOCKDOWN_BREACH
};

// wire names understood by the monitoring backend
inline std::string toString(ViolationKind k) {
    switch (k) {
        case ViolationKind::MULTIPLE_PERSONS:    return "multiple-faces";
        case ViolationKind::ABSENCE:             return "no-face";
        case ViolationKind::FORBIDDEN_OBJECT:    return "forbidden-object";
        case ViolationKind::GAZE_DEVIATION:      return "look-away";
        case ViolationKind::TAB_SWITCH:          return "tab-switch";
        case ViolationKind::FULLSCREEN_EXIT:     return "fullscreen-exit";
        case ViolationKind::LOCKDOWN_BREACH:     return "lockdown-breach";
    }
    return "unknown";
}

// Browser-side events delivered outside the frame cadence.
enum class DiscreteEventKind {
    TAB_HIDDEN = 0,
    FULLSCREEN_EXITED,
    WINDOW_BLUR,
    CLIPBOARD_ATTEMPT,
    DEVTOOLS_ATTEMPT,
    PRINT_ATTEMPT,
    SCREENSHOT_ATTEMPT,
    CONTEXT_MENU
};

inline std::string toString(DiscreteEventKind e) {
    switch (e) {
        case DiscreteEventKind::TAB_HIDDEN:         return "tab-hidden";
        case DiscreteEventKind::FULLSCREEN_EXITED:  return "fullscreen-exited";
        case DiscreteEventKind::WINDOW_BLUR:        return "window-blur";
        case DiscreteEventKind::CLIPBOARD_ATTEMPT:  return "clipboard-attempt";
        case DiscreteEventKind::DEVTOOLS_ATTEMPT:   return "devtools-attempt";
        case DiscreteEventKind::PRINT_ATTEMPT:      return "print-attempt";
        case DiscreteEventKind::SCREENSHOT_ATTEMPT: return "screenshot-attempt";
        case DiscreteEventKind::CONTEXT_MENU:       return "context-menu";
    }
    return "unknown";
}

inline std::optional<DiscreteEventKind> discreteEventFromString(const std::string& s) {
    if (s == "tab-hidden")         return DiscreteEventKind::TAB_HIDDEN;
    if (s == "fullscreen-exited")  return DiscreteEventKind::FULLSCREEN_EXITED;
    if (s == "window-blur")        return DiscreteEventKind::WINDOW_BLUR;
    if (s == "clipboard-attempt")  return DiscreteEventKind::CLIPBOARD_ATTEMPT;
    if (s == "devtools-attempt")   return DiscreteEventKind::DEVTOOLS_ATTEMPT;
    if (s == "print-attempt")      return DiscreteEventKind::PRINT_ATTEMPT;
    if (s == "screenshot-attempt") return DiscreteEventKind::SCREENSHOT_ATTEMPT;
    if (s == "context-menu")       return DiscreteEventKind::CONTEXT_MENU;
    return std::nullopt;
}

} // namespace proctor::vision
