#pragma once
#include <cstdint>
#include <string>

namespace gt {

// Gesture symbols produced by the external recognizer.
enum class Gesture : std::uint8_t {
  Unknown = 0,
  OpenPalm,
  ClosedFist,
  Pinch,
  Pointing,
  ThumbsUp,
  ThumbsDown,
  Peace,
  OkSign,
  CallMe,
  Rock,
  Four,
  Three,
  Love,
  Spiderman,
  Gun
};

enum class GestureMode : std::uint8_t {
  Stable,  // everything collapses onto open palm / closed fist
  Extended // pinch, ok sign and call-me drive rotate, scale and menu
};

// Gestures the state machine acts on after normalization.
enum class Intent : std::uint8_t { Release, Grab, Rotate, Scale, Menu };

const char* gestureName(Gesture g);
// Accepts recognizer names ("closed_fist", "Closed_Fist", "none", ...).
// Unrecognized names map to Unknown.
Gesture parseGesture(const std::string& s);

const char* gestureModeName(GestureMode m);
bool parseGestureMode(const std::string& s, GestureMode& out);

const char* intentName(Intent i);

// True for symbols with no stable meaning (pointing, gun, unknown).
bool isAmbiguous(Gesture g);

// Maps a raw symbol to an intent. Ambiguous symbols keep `previous`
// (Release for a hand with no history).
Intent normalizeGesture(Gesture raw, GestureMode mode, Intent previous);

} // namespace gt
