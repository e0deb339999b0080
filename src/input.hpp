#pragma once
/*
 * Input
 *
 * Purpose: map key codes to miner actions.
 * Note: terminal runs in raw mode, so Ctrl-C arrives as a key and quits.
 */

enum class KeyAction { None, TogglePause, Reset, Start, Quit };

class Input {
public:
  KeyAction consume(int ch);
};
