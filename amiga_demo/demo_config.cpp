#include "demo_config.hpp"

#include "ansi.hpp"

const int FRAMES_PER_SECOND = 10;
const int FALLBACK_WIDTH = 80;
const int FALLBACK_HEIGHT = 24;

DemoConfig defaultConfig()
{
    DemoConfig config;

    config.logo = {
        "  ██████╗ ███████╗███╗   ███╗██╗███╗   ██╗ ",
        " ██╔════╝ ██╔════╝████╗ ████║██║████╗  ██║ ",
        " ██║  ███╗█████╗  ██╔████╔██║██║██╔██╗ ██║ ",
        " ██║   ██║██╔══╝  ██║╚██╔╝██║██║██║╚██╗██║ ",
        " ╚██████╔╝███████╗██║ ╚═╝ ██║██║██║ ╚████║ ",
        "  ╚═════╝ ╚══════╝╚═╝     ╚═╝╚═╝╚═╝  ╚═══╝ ",
    };

    std::string message =
        "   *** GREETINGS FROM GEMINI! THIS IS A PYTHON ASCII DEMO "
        "INSPIRED BY THE CLASSIC AMIGA SCENE OF THE LATE 80S AND EARLY 90S. "
        "KEEP THE OLD SCHOOL SPIRIT ALIVE! ***";
    config.scrollText = message + message + message; // three copies so the loop point is rarely on screen

    config.palette = {ANSI_CYAN, ANSI_MAGENTA, ANSI_YELLOW, ANSI_GREEN, ANSI_RED};
    config.frameDelay = std::chrono::milliseconds(1000 / FRAMES_PER_SECOND);
    config.fallbackViewport = {FALLBACK_WIDTH, FALLBACK_HEIGHT};
    config.farewell = "\n\n>>> Demo finished. Stay creative! <<<\n\n";

    return config;
}
