#include "input.hpp"

static constexpr int CTRL_C = 'C' - 64;
static constexpr int ESC = 27;

KeyAction Input::consume(int ch) {
  switch (ch) {
    case 'p': case 'P': case ' ': return KeyAction::TogglePause;
    case 'r': case 'R': return KeyAction::Reset;
    case 's': case 'S': return KeyAction::Start;
    case 'q': case 'Q': case CTRL_C: case ESC: return KeyAction::Quit;
    default: return KeyAction::None;
  }
}
