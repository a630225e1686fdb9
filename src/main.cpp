#include "app.hpp"
#include "config.hpp"
#include "paths.hpp"
#include "settings_store.hpp"

#include <iostream>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string>

static voxchord::App* g_app = nullptr;

void signal_handler(int signum) {
    (void)signum;
    if (g_app) {
        g_app->quit();
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "\nOptions:\n"
              << "  -m, --model-dir DIR   Directory containing Whisper models (default: models)\n"
              << "      --model SIZE      Whisper model size: tiny, base, small, medium, large-v3\n"
              << "  -t, --threads N       Number of CPU threads (default: 4)\n"
              << "  -l, --language LANG   Language code or 'auto' (default: auto)\n"
              << "      --provider NAME   LLM provider: openrouter or ollama\n"
              << "      --no-tts          Disable reading the clipboard aloud\n"
              << "      --auto-paste      Paste results into the focused window\n"
              << "      --settings FILE   Settings file (default: ~/.config/voxchord/settings.json)\n"
              << "      --list-models     Print the OpenRouter model list and exit\n"
              << "      --refresh         With --list-models, bypass the model cache\n"
              << "      --list-voices     Print the available text-to-speech voices and exit\n"
              << "  -h, --help            Show this help\n"
              << "\nDefault chords (hold to record, release to run):\n"
              << "  F1        Transcribe to clipboard\n"
              << "  Shift+F2  Ask the LLM\n"
              << "  Ctrl+F2   Ask the LLM about the clipboard\n"
              << "  Shift+F3  Describe a screen region\n"
              << "  Ctrl+F3   Ask about a screen region\n"
              << "  Ctrl+F1   Read the clipboard aloud\n"
              << "\nThe OpenRouter key is read from OPENROUTER_API_KEY or the settings file.\n"
              << "Keyboard access needs membership in the 'input' group.\n"
              << std::endl;
}

static int list_models(const voxchord::Config& config, bool refresh) {
    voxchord::OpenRouterClient client(config.llm.openrouter);
    voxchord::ModelCache cache(voxchord::cache_dir());
    voxchord::ModelDiscovery discovery(client, cache);

    const std::string& key = config.llm.openrouter.api_key;
    auto models = discovery.get_models(key, refresh);

    std::cout << "Models (" << discovery.last_source() << "): "
              << cache.info(voxchord::ModelCache::credential_hash(key)).status_text() << "\n" << std::endl;
    for (const auto& model : models) {
        std::cout << "  " << model.id;
        if (model.name != model.id) std::cout << "  " << model.name;
        std::cout << "  (" << model.context_length << " tokens)" << std::endl;
    }
    return 0;
}

static int list_voices(const voxchord::Config& config) {
    voxchord::CapabilityProcessManager::Options bridge_options;
    bridge_options.interpreter = config.tts.python_executable;
    bridge_options.app_dir = voxchord::executable_dir();
    bridge_options.scripts_dir = config.tts.scripts_dir;
    voxchord::CapabilityProcessManager bridge(bridge_options);

    voxchord::KittenTtsEngine kitten(bridge);
    voxchord::EspeakTtsEngine espeak;
    voxchord::TtsFallbackChain chain(kitten, espeak);

    voxchord::TtsEngine& engine = config.tts.native_fallback
        ? static_cast<voxchord::TtsEngine&>(chain)
        : static_cast<voxchord::TtsEngine&>(kitten);

    std::cout << engine.engine_info() << "\n" << std::endl;
    for (const auto& voice : engine.voices()) {
        std::cout << "  " << voice.id << "  " << voice.description << " [" << voice.language << "]"
                  << (voice.id == config.tts.voice ? "  (selected)" : "") << std::endl;
    }
    return 0;
}

static bool has_value(int i, int argc, const char* option) {
    if (i + 1 < argc) return true;
    std::cerr << "Missing value for " << option << std::endl;
    return false;
}

int main(int argc, char* argv[]) {
    // Settings file first; command-line options override it
    std::string settings_path;
    for (int i = 1; i + 1 < argc; ++i) {
        if (strcmp(argv[i], "--settings") == 0) {
            settings_path = argv[i + 1];
        }
    }

    voxchord::SettingsStore store(settings_path);
    if (!store.exists() && settings_path.empty()) {
        // First run: leave an editable file with the defaults
        if (store.save(voxchord::Config())) {
            std::cout << "Wrote default settings to " << store.path() << std::endl;
        }
    }
    voxchord::Config config = store.load();

    bool do_list_models = false;
    bool do_list_voices = false;
    bool refresh = false;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        }
        else if (strcmp(argv[i], "-m") == 0 || strcmp(argv[i], "--model-dir") == 0) {
            if (!has_value(i, argc, argv[i])) return 1;
            config.whisper.model_dir = argv[++i];
        }
        else if (strcmp(argv[i], "--model") == 0) {
            if (!has_value(i, argc, argv[i])) return 1;
            config.whisper.model_size = argv[++i];
        }
        else if (strcmp(argv[i], "-t") == 0 || strcmp(argv[i], "--threads") == 0) {
            if (!has_value(i, argc, argv[i])) return 1;
            config.whisper.n_threads = std::atoi(argv[++i]);
            if (config.whisper.n_threads <= 0) {
                std::cerr << "Thread count must be positive" << std::endl;
                return 1;
            }
        }
        else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--language") == 0) {
            if (!has_value(i, argc, argv[i])) return 1;
            config.whisper.language = argv[++i];
        }
        else if (strcmp(argv[i], "--provider") == 0) {
            if (!has_value(i, argc, argv[i])) return 1;
            auto provider = voxchord::parse_llm_provider(argv[++i]);
            if (!provider) {
                std::cerr << "Unknown provider: " << argv[i] << std::endl;
                print_usage(argv[0]);
                return 1;
            }
            config.llm.provider = *provider;
        }
        else if (strcmp(argv[i], "--settings") == 0) {
            ++i;    // Already handled
        }
        else if (strcmp(argv[i], "--no-tts") == 0) {
            config.tts.enabled = false;
        }
        else if (strcmp(argv[i], "--auto-paste") == 0) {
            config.auto_paste = true;
        }
        else if (strcmp(argv[i], "--list-models") == 0) {
            do_list_models = true;
        }
        else if (strcmp(argv[i], "--refresh") == 0) {
            refresh = true;
        }
        else if (strcmp(argv[i], "--list-voices") == 0) {
            do_list_voices = true;
        }
        else {
            std::cerr << "Unknown option: " << argv[i] << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    if (do_list_models) return list_models(config, refresh);
    if (do_list_voices) return list_voices(config);

    // Setup signal handlers
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    // Create and initialize app
    voxchord::App app;
    g_app = &app;

    std::cout << "VoxChord - Voice Chords for Linux\n" << std::endl;
    std::cout << "Model: " << config.whisper.model_path() << std::endl;
    std::cout << "Threads: " << config.whisper.n_threads << std::endl;
    std::cout << "Language: " << config.whisper.language << std::endl;
    std::cout << "LLM provider: " << voxchord::to_string(config.llm.provider) << std::endl;
    std::cout << "Auto-paste: " << (config.auto_paste ? "yes" : "no") << std::endl;
    std::cout << "Text-to-speech: " << (config.tts.enabled ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    if (!app.initialize(config)) {
        std::cerr << "Failed to initialize application" << std::endl;
        g_app = nullptr;
        return 1;
    }

    int result = app.run();

    std::cout << "\nShutting down..." << std::endl;
    app.shutdown();

    g_app = nullptr;
    return result;
}
