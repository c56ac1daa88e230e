#include "frame.hpp"

#include <algorithm>

#include "ansi.hpp"

std::size_t displayWidth(const std::string &text)
{
    std::size_t width = 0;
    for (unsigned char ch : text)
    {
        // continuation bytes look like 10xxxxxx
        if ((ch & 0xC0) != 0x80)
            ++width;
    }
    return width;
}

int logoWidth(const std::vector<std::string> &logo)
{
    std::size_t widest = 0;
    for (const auto &line : logo)
        widest = std::max(widest, displayWidth(line));
    return static_cast<int>(widest);
}

FrameLayout computeLayout(const Viewport &viewport, int logoColumns, int logoRows)
{
    FrameLayout layout;

    // Leave two rows under the logo: one for the scroller, one spare
    layout.topPadding = std::max(0, (viewport.height - logoRows - 2) / 2);

    // Narrower than the logo: no indent, the terminal wraps the lines
    layout.leftPadding = std::max(0, (viewport.width - logoColumns) / 2);

    layout.fillLines = std::max(0, viewport.height - layout.topPadding - logoRows - 1);

    return layout;
}

std::string scrollWindow(const std::string &text, std::size_t offset, int width)
{
    if (width <= 0 || text.empty())
        return "";

    std::string looped = text + text.substr(0, static_cast<std::size_t>(width));
    if (offset >= text.size())
        offset %= text.size();

    return looped.substr(offset, static_cast<std::size_t>(width));
}

std::string fitToWidth(const std::string &text, int width)
{
    if (width <= 0)
        return "";

    std::string fitted = text.substr(0, static_cast<std::size_t>(width));
    fitted.resize(static_cast<std::size_t>(width), ' ');
    return fitted;
}

std::string renderFrame(const DemoConfig &config, const AnimationState &state, const Viewport &viewport)
{
    int logoHeight = static_cast<int>(config.logo.size());
    FrameLayout layout = computeLayout(viewport, logoWidth(config.logo), logoHeight);

    std::string buffer = ANSI_CURSOR_HOME;

    buffer.append(static_cast<std::size_t>(layout.topPadding), '\n');

    std::string color = config.palette.empty() ? "" : config.palette[state.colorIndex % config.palette.size()];
    std::string indent(static_cast<std::size_t>(layout.leftPadding), ' ');
    for (const auto &line : config.logo)
    {
        buffer += indent;
        buffer += color;
        buffer += line;
        buffer += ANSI_RESET;
        buffer += '\n';
    }

    buffer.append(static_cast<std::size_t>(layout.fillLines), '\n');

    buffer += ANSI_BOLD;
    buffer += ANSI_YELLOW;
    buffer += fitToWidth(scrollWindow(config.scrollText, state.scrollOffset, viewport.width), viewport.width);
    buffer += ANSI_RESET;

    return buffer;
}

AnimationState advanceState(const AnimationState &state, const DemoConfig &config)
{
    AnimationState next = state;

    if (!config.palette.empty())
        next.colorIndex = (state.colorIndex + 1) % config.palette.size();

    if (!config.scrollText.empty())
        next.scrollOffset = (state.scrollOffset + 1) % config.scrollText.size();

    return next;
}
