#pragma once

// Escape sequences understood by any ANSI/VT100 terminal
const char *const ANSI_RESET = "\033[0m";
const char *const ANSI_BOLD = "\033[1m";
const char *const ANSI_RED = "\033[91m";
const char *const ANSI_GREEN = "\033[92m";
const char *const ANSI_YELLOW = "\033[93m";
const char *const ANSI_MAGENTA = "\033[95m";
const char *const ANSI_CYAN = "\033[96m";

const char *const ANSI_CURSOR_HOME = "\033[H";
const char *const ANSI_CURSOR_HIDE = "\033[?25l";
const char *const ANSI_CURSOR_SHOW = "\033[?25h";
