#include "action_surface.hpp"
#include "agent.hpp"
#include "classifier.hpp"
#include "config.hpp"
#include "embedder.hpp"
#include "guardrail.hpp"
#include "http.hpp"
#include "memory.hpp"
#include "plugin.hpp"
#include "provider.hpp"
#include "scanner.hpp"
#include "scar_ledger.hpp"
#include "util.hpp"
#include "vault.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

static std::string provider_list() {
    std::string out;
    for (const auto& name : vigil::PluginRegistry::instance().provider_names()) {
        if (!out.empty()) out += ", ";
        out += name;
    }
    return out;
}

static void print_usage() {
    std::cout << "Usage: vigil [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Send a single request and exit\n"
              << "  --provider NAME      Use specific provider (" << provider_list() << ")\n"
              << "  --model NAME         Use specific model\n"
              << "  --config PATH        Read configuration from PATH\n"
              << "  --scan-once          Run one sensitivity sweep and exit\n"
              << "  --no-scanner         Do not start the background scanner\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /report              Health report (memories, scars, budget)\n"
              << "  /scan                Run a sensitivity sweep now\n"
              << "  /forget KEYWORD      Delete memories containing KEYWORD\n"
              << "  /model NAME          Switch model\n"
              << "  /status              Show provider and model\n"
              << "  /help                Show available commands\n"
              << "  /quit, /exit         Exit the REPL\n"
              << "\n"
              << "Environment variables:\n"
              << "  OPENAI_API_KEY       API key for OpenAI\n"
              << "  GROQ_API_KEY         API key for the compatible provider\n"
              << "  OLLAMA_BASE_URL      Base URL for Ollama (default: http://localhost:11434)\n"
              << "  VIGIL_PROVIDER       Provider override\n"
              << "  VIGIL_MODEL          Model override\n"
              << "  VIGIL_DB_PATH        Database path override\n";
}

static void print_scan_report(const vigil::ScanReport& r) {
    std::cout << "Sweep: " << r.discovered << " candidates, "
              << r.quarantined << " quarantined, "
              << r.cleared << " cleared, "
              << r.unchanged << " unchanged, "
              << r.denied << " denied, "
              << r.failed + r.unreadable << " failed\n";
}

static bool asks_for_feedback(vigil::ReplyKind kind) {
    return kind == vigil::ReplyKind::Answer || kind == vigil::ReplyKind::Action ||
           kind == vigil::ReplyKind::Ranking || kind == vigil::ReplyKind::Fallback;
}

static void collect_feedback(vigil::Agent& agent, const std::string& request,
                             const std::string& reply) {
    std::cout << "[?] Was this outcome successful? (yes/no/skip): " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) return;
    answer = vigil::to_lower(vigil::trim(answer));

    if (answer == "no") {
        std::cout << "[!] What went wrong? " << std::flush;
        std::string lesson;
        std::getline(std::cin, lesson);
        agent.record_feedback(request, reply, vigil::Outcome::Failure, lesson);
        std::cout << "Lesson recorded. Similar requests will be checked against it.\n";
    } else if (answer == "yes") {
        agent.record_feedback(request, reply, vigil::Outcome::Success);
        std::cout << "Outcome recorded.\n";
    } else {
        agent.record_feedback(request, reply, vigil::Outcome::Neutral);
    }
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string provider_name;
    std::string model_name;
    std::string config_path;
    bool scan_once = false;
    bool no_scanner = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--scan-once") == 0) {
            scan_once = true;
        } else if (std::strcmp(argv[i], "--no-scanner") == 0) {
            no_scanner = true;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    vigil::http_init();
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    vigil::http_set_abort_flag(&g_shutdown);

    auto config = config_path.empty() ? vigil::Config::load()
                                      : vigil::Config::load_from(vigil::expand_home(config_path));
    if (!provider_name.empty()) config.provider = provider_name;
    if (!model_name.empty()) config.model = model_name;

    vigil::CurlHttpClient http_client;

    std::unique_ptr<vigil::Provider> provider;
    std::unique_ptr<vigil::Provider> classifier_provider;
    try {
        provider = vigil::create_provider(config, http_client);
        classifier_provider = vigil::create_provider(
            config.provider, config.api_key_for(config.provider), http_client,
            config.base_url_for(config.provider), config.scanner.classify_timeout);
    } catch (const std::exception& e) {
        std::cerr << "Error creating provider: " << e.what() << "\n";
        vigil::http_cleanup();
        return 1;
    }

    auto store = vigil::create_record_store(config);
    vigil::ScarLedger scars(config.database_path());
    vigil::Guardrail guardrail(config.guardrail);
    auto embedder = vigil::create_embedder(config, http_client);
    vigil::CommandActionSurface actions(config.actions);

    vigil::LlmClassifier classifier(*classifier_provider, config.model);
    vigil::QuarantineVault vault(config.scanner.vault_dir);
    vigil::SensitivityScanner scanner(*store, embedder.get(), classifier, guardrail,
                                      vault, config.scanner);

    if (scan_once) {
        print_scan_report(scanner.sweep());
        vigil::http_cleanup();
        return 0;
    }

    vigil::Agent agent(std::move(provider), *store, scars, guardrail, embedder.get(),
                       &actions, config);

    if (!message.empty()) {
        auto reply = agent.process(message);
        std::cout << reply.text << '\n';
        vigil::http_cleanup();
        return 0;
    }

    if (config.scanner.enabled && !no_scanner) {
        scanner.start();
    }

    std::cout << "vigil\n"
              << "Provider: " << agent.provider_name()
              << " | Model: " << agent.model()
              << " | Embeddings: " << vigil::describe_embedder(embedder.get()) << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "vigil> " << std::flush;

        if (!std::getline(std::cin, line)) {
            std::cout << "\n";
            break;
        }

        line = vigil::trim(line);
        if (line.empty()) continue;

        if (line[0] == '/') {
            if (line == "/quit" || line == "/exit") {
                break;
            } else if (line == "/report") {
                std::cout << vigil::format_health_report(agent.health_report());
            } else if (line == "/scan") {
                print_scan_report(scanner.sweep());
            } else if (line.rfind("/forget ", 0) == 0) {
                std::string kw = vigil::trim(line.substr(8));
                std::cout << "Removed " << store->delete_matching(kw) << " memories.\n";
            } else if (line == "/status") {
                std::cout << "Provider: " << agent.provider_name() << "\n"
                          << "Model: " << agent.model() << "\n"
                          << "Scanner: " << (scanner.running() ? "running" : "stopped") << "\n";
            } else if (line.rfind("/model ", 0) == 0) {
                std::string new_model = vigil::trim(line.substr(7));
                agent.set_model(new_model);
                std::cout << "Model set to: " << new_model << "\n";
            } else if (line == "/help") {
                print_usage();
            } else {
                std::cout << "Unknown command: " << line << "\n";
            }
            continue;
        }

        auto reply = agent.process(line);
        std::cout << "\n" << reply.text << "\n\n";
        if (asks_for_feedback(reply.kind)) {
            collect_feedback(agent, line, reply.text);
        }
    }

    scanner.stop();
    vigil::http_cleanup();
    return 0;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
