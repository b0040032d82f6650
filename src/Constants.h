#pragma once

#include <SDL2/SDL.h>
#include <cstddef>

constexpr int LOG_CATEGORY_SEMANTIC = SDL_LOG_CATEGORY_CUSTOM;

constexpr const char* HLGROUP_PREFIX = "Sem";
constexpr const char* HIGHLIGHT_NAMESPACE = "semanticTokens";
constexpr const char* CONFIG_SECTION = "semanticTokens";

// Decoder hands control back to the scheduler after this much wall-clock work.
constexpr Uint32 YIELD_EVERY_MS = 15;

constexpr Uint32 HIGHLIGHT_DEBOUNCE_MS = 100;
constexpr Uint32 REQUEST_RETRY_DELAY_MS = 500;
constexpr Uint32 WAIT_REFRESH_TIMEOUT_MS = 500;
constexpr Uint32 STATUS_HIDE_DELAY_MS = 500;

// Below this many spans the whole document is diffed in one pass.
constexpr size_t FULL_APPLY_SPAN_THRESHOLD = 200;

// Visible ranges grow by these multiples of the screen height before painting.
constexpr double VIEWPORT_EXPAND_ABOVE = 1.5;
constexpr double VIEWPORT_EXPAND_BELOW = 1.5;
constexpr double VIEWPORT_EXPAND_LIMIT = 2.0;

constexpr int RANGE_REQUEST_HEIGHT_FACTOR = 2;

constexpr int DEFAULT_HIGHLIGHT_PRIORITY = 2048;
constexpr int DEFAULT_SCREEN_LINES = 40;

constexpr Uint32 TOAST_INFO_MS = 3000;
constexpr Uint32 TOAST_WARNING_MS = 4000;
constexpr Uint32 TOAST_ERROR_MS = 5000;
