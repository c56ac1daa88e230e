#pragma once

#include <chrono>
#include <string>
#include <vector>

// Terminal size in character cells
struct Viewport
{
    int width;
    int height;
};

// Everything the demo needs, fixed at startup
struct DemoConfig
{
    std::vector<std::string> logo;
    std::string scrollText;
    std::vector<std::string> palette;
    std::chrono::milliseconds frameDelay;
    Viewport fallbackViewport;
    std::string farewell;
};

DemoConfig defaultConfig();
