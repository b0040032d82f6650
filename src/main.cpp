#include "HighlightService.h"
#include "HighlightStore.h"
#include "ProviderRegistry.h"
#include "SyntaxTokenProvider.h"
#include "TextDocument.h"
#include "Viewport.h"
#include "Toast.h"
#include "Utils.h"
#include <SDL2/SDL.h>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

namespace {

constexpr Uint32 DUMP_TIMEOUT_MS = 10000;

struct DumpOptions {
    std::string file;
    std::optional<std::string> config_path;
    int screen_lines = DEFAULT_SCREEN_LINES;
    int top = 0;
    bool verbose = false;
};

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <file> [--config path] [--lines N] [--top N] [--verbose]\n";
}

std::optional<DumpOptions> parse_args(int argc, char* argv[]) {
    DumpOptions opts;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if (arg == "--config" && has_value) {
            opts.config_path = argv[++i];
        } else if (arg == "--lines" && has_value) {
            opts.screen_lines = std::max(1, safe_stoi(argv[++i], DEFAULT_SCREEN_LINES));
        } else if (arg == "--top" && has_value) {
            opts.top = std::max(0, safe_stoi(argv[++i], 0));
        } else if (arg == "--verbose") {
            opts.verbose = true;
        } else if (!arg.starts_with("--") && opts.file.empty()) {
            opts.file = arg;
        } else {
            return std::nullopt;
        }
    }
    if (opts.file.empty()) return std::nullopt;
    return opts;
}

// There is no window to draw toasts in, so they go to stderr once per frame.
void flush_toasts(ToastQueue& toasts) {
    while (!toasts.empty()) {
        const Toast& toast = toasts.toasts().front();
        std::cerr << toast.title << ": " << toast.message << "\n";
        toasts.dismiss(toast.id);
    }
}

int run(const DumpOptions& opts) {
    ConfigStore config;
    if (opts.config_path) {
        if (auto loaded = config.load_from_file(*opts.config_path); !loaded) {
            std::cerr << loaded.error() << "\n";
            return EXIT_FAILURE;
        }
    }
    if (!config.has(CONFIG_SECTION, "", "enable")) {
        config.set(CONFIG_SECTION, "enable", "true");
    }

    TextDocument doc(1);
    if (auto loaded = doc.load(opts.file); !loaded) {
        std::cerr << loaded.error() << "\n";
        return EXIT_FAILURE;
    }

    Scheduler scheduler;
    register_all_languages();
    auto provider = std::make_shared<SyntaxTokenProvider>(scheduler);
    ProviderRegistry providers;
    providers.register_provider({"c", "cpp"}, provider);

    HighlightStore store;
    FixedViewport viewport(opts.screen_lines);
    LineIdx top = std::min<LineIdx>(opts.top, std::max<LineIdx>(doc.line_count() - 1, 0));
    viewport.show(doc.id(), {{top, std::min<LineIdx>(top + opts.screen_lines, doc.line_count())}});

    ToastQueue toasts(scheduler.clock());
    HighlightService service(scheduler, providers, store, viewport, config, &toasts);
    DocumentHighlighter& highlighter = service.attach(doc);

    bool refreshed = false;
    highlighter.on_did_refresh([&refreshed]() { refreshed = true; });

    if (auto started = service.highlight_current(doc.id()); !started) {
        flush_toasts(toasts);
        return EXIT_FAILURE;
    }

    Uint32 deadline = scheduler.now() + DUMP_TIMEOUT_MS;
    while (!refreshed && static_cast<int32_t>(deadline - scheduler.now()) > 0) {
        scheduler.run_pending();
        flush_toasts(toasts);
        if (refreshed) break;
        auto due = scheduler.next_due();
        if (!due) break;
        int32_t wait = static_cast<int32_t>(*due - scheduler.now());
        if (wait > 0) SDL_Delay(static_cast<Uint32>(wait));
    }

    if (!refreshed) {
        SDL_LogError(LOG_CATEGORY_SEMANTIC, "no highlights for %s", opts.file.c_str());
        return EXIT_FAILURE;
    }

    for (const auto& item : store.items(doc.id(), HIGHLIGHT_NAMESPACE)) {
        std::printf("%d:%d-%d %s\n", item.line + 1, item.col_start, item.col_end, item.group.c_str());
    }
    return EXIT_SUCCESS;
}

}

int main(int argc, char* argv[]) {
    auto opts = parse_args(argc, argv);
    if (!opts) {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    SDL_Init(SDL_INIT_TIMER);
    SDL_LogSetPriority(LOG_CATEGORY_SEMANTIC, opts->verbose ? SDL_LOG_PRIORITY_DEBUG : SDL_LOG_PRIORITY_WARN);

    int status = EXIT_FAILURE;
    try {
        status = run(*opts);
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
    }

    SDL_Quit();
    return status;
}
