#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "demo_config.hpp"

// Per-frame mutable state, carried from one tick to the next
struct AnimationState
{
    std::size_t scrollOffset = 0;
    std::size_t colorIndex = 0;
};

// Where the logo and scroller land for a given viewport
struct FrameLayout
{
    int topPadding;
    int leftPadding;
    int fillLines;
};

// Number of characters a UTF-8 string occupies on screen (one per code point)
std::size_t displayWidth(const std::string &text);

int logoWidth(const std::vector<std::string> &logo);

FrameLayout computeLayout(const Viewport &viewport, int logoColumns, int logoRows);

// Visible slice of a circularly repeating text. The text is extended with
// its own first `width` characters so the slice never needs to wrap.
std::string scrollWindow(const std::string &text, std::size_t offset, int width);

// Right-pads with spaces or truncates so the result is exactly `width` long
std::string fitToWidth(const std::string &text, int width);

std::string renderFrame(const DemoConfig &config, const AnimationState &state, const Viewport &viewport);

AnimationState advanceState(const AnimationState &state, const DemoConfig &config);
