#include "gt/interaction/Gesture.hpp"

namespace gt {

struct GestureName {
  Gesture gesture;
  const char* name;
};

static const GestureName kGestureNames[] = {
  {Gesture::Unknown, "unknown"},       {Gesture::OpenPalm, "open_palm"},
  {Gesture::ClosedFist, "closed_fist"}, {Gesture::Pinch, "pinch"},
  {Gesture::Pointing, "pointing"},     {Gesture::ThumbsUp, "thumbs_up"},
  {Gesture::ThumbsDown, "thumbs_down"}, {Gesture::Peace, "peace_sign"},
  {Gesture::OkSign, "ok_sign"},        {Gesture::CallMe, "call_me"},
  {Gesture::Rock, "rock"},             {Gesture::Four, "four"},
  {Gesture::Three, "three"},           {Gesture::Love, "love"},
  {Gesture::Spiderman, "spiderman"},   {Gesture::Gun, "gun"},
};

static std::string lowerCase(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out += static_cast<char>((c >= 'A' && c <= 'Z') ? c + 32 : c);
  return out;
}

const char* gestureName(Gesture g) {
  for (const auto& gn : kGestureNames) {
    if (gn.gesture == g) return gn.name;
  }
  return "unknown";
}

Gesture parseGesture(const std::string& s) {
  std::string key = lowerCase(s);
  // Recognizer aliases.
  if (key == "fist" || key == "grab") return Gesture::ClosedFist;
  if (key == "palm" || key == "open") return Gesture::OpenPalm;
  if (key == "peace") return Gesture::Peace;
  if (key == "ok") return Gesture::OkSign;
  for (const auto& gn : kGestureNames) {
    if (key == gn.name) return gn.gesture;
  }
  return Gesture::Unknown;
}

const char* gestureModeName(GestureMode m) {
  return m == GestureMode::Stable ? "stable" : "extended";
}

bool parseGestureMode(const std::string& s, GestureMode& out) {
  if (s == "stable")   { out = GestureMode::Stable;   return true; }
  if (s == "extended") { out = GestureMode::Extended; return true; }
  return false;
}

const char* intentName(Intent i) {
  switch (i) {
    case Intent::Release: return "release";
    case Intent::Grab:    return "grab";
    case Intent::Rotate:  return "rotate";
    case Intent::Scale:   return "scale";
    case Intent::Menu:    return "menu";
  }
  return "release";
}

bool isAmbiguous(Gesture g) {
  return g == Gesture::Pointing || g == Gesture::Gun || g == Gesture::Unknown;
}

Intent normalizeGesture(Gesture raw, GestureMode mode, Intent previous) {
  if (mode == GestureMode::Extended) {
    switch (raw) {
      case Gesture::Pinch:  return Intent::Rotate;
      case Gesture::OkSign: return Intent::Scale;
      case Gesture::CallMe: return Intent::Menu;
      default: break;
    }
  }

  switch (raw) {
    case Gesture::ClosedFist:
    case Gesture::Pinch:
    case Gesture::ThumbsUp:
    case Gesture::ThumbsDown:
      return Intent::Grab;

    case Gesture::OpenPalm:
    case Gesture::Four:
    case Gesture::Three:
    case Gesture::OkSign:
    case Gesture::Peace:
    case Gesture::Love:
    case Gesture::Rock:
    case Gesture::CallMe:
    case Gesture::Spiderman:
      return Intent::Release;

    case Gesture::Pointing:
    case Gesture::Gun:
    case Gesture::Unknown:
    default:
      break;
  }

  // Ambiguous: hold whatever the hand was doing.
  return previous;
}

} // namespace gt
