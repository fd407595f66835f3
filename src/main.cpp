#include "core/http_client.h"
#include "core/discovery_pipeline.h"
#include "core/login_locator.h"
#include "core/network_capture.h"
#include "core/request_scorer.h"
#include "core/token_extractor.h"
#include "core/webdriver_browser.h"
#include "logging/chain.h"
#include "config/settings.h"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>

namespace {

CancellationToken g_cancel;

void on_interrupt(int) {
    g_cancel.cancel();
}

/// Value following a flag, advancing i; empty if the flag is last.
std::string flag_value(int argc, char** argv, int& i) {
    if (i + 1 < argc) return argv[++i];
    return "";
}

/**
 * @brief Write a JSON document to a file, or stdout when path is empty
 * @return true on success
 */
bool write_json(const nlohmann::json& doc, const std::string& path) {
    if (path.empty()) {
        std::cout << dump_json(doc) << "\n";
        return true;
    }
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        std::cerr << "Error: cannot write " << path << "\n";
        return false;
    }
    ofs << dump_json(doc) << "\n";
    return ofs.good();
}

void print_usage() {
    std::cerr << "Usage:\n";
    std::cerr << "  authtrace discover --target URL [--email E] [--password P] [--config FILE]\n";
    std::cerr << "                     [--webdriver URL] [--out FILE] [--log FILE] [--workers N]\n";
    std::cerr << "                     [--timeout SEC] [--api-subdomain] [--no-headless]\n";
    std::cerr << "  authtrace locate --target URL [--config FILE]\n";
    std::cerr << "  authtrace score <capture.json>\n";
    std::cerr << "  authtrace verify <log-file.jsonl>\n";
}

} // namespace

/**
 * @brief Full pipeline: locate, scripted login, capture, probe
 * @return 0 on success (including empty outcomes), 1 on browser failure, 2 on usage error
 */
int cmd_discover(int argc, char** argv) {
    std::string target;
    std::string config_path;
    std::string out_path;
    std::map<std::string, std::string> overrides;

    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--target") {
            target = flag_value(argc, argv, i);
        } else if (a == "--config") {
            config_path = flag_value(argc, argv, i);
        } else if (a == "--out") {
            out_path = flag_value(argc, argv, i);
        } else if (a == "--email") {
            overrides["login.email"] = flag_value(argc, argv, i);
        } else if (a == "--password") {
            overrides["login.password"] = flag_value(argc, argv, i);
        } else if (a == "--webdriver") {
            overrides["browser.webdriver_url"] = flag_value(argc, argv, i);
        } else if (a == "--log") {
            overrides["audit.log_path"] = flag_value(argc, argv, i);
        } else if (a == "--workers") {
            overrides["probe.workers"] = flag_value(argc, argv, i);
        } else if (a == "--timeout") {
            overrides["probe.timeout_seconds"] = flag_value(argc, argv, i);
        } else if (a == "--api-subdomain") {
            overrides["probe.include_api_subdomain"] = "true";
        } else if (a == "--no-headless") {
            overrides["browser.headless"] = "false";
        } else {
            std::cerr << "Error: unknown option " << a << "\n";
            return 2;
        }
    }

    if (target.empty()) {
        std::cerr << "Error: --target required\n";
        return 2;
    }

    config::Settings settings = config_path.empty()
        ? config::Settings::get_default()
        : config::Settings::load(config_path);
    auto rejected = settings.apply(overrides);
    for (const auto& problem : rejected) {
        std::cerr << "Error: " << problem << "\n";
    }
    if (!rejected.empty()) {
        return 2;
    }

    HttpClient client(settings.http);

    WebDriverBrowser::Options wopts;
    wopts.webdriver_url = settings.webdriver_url;
    wopts.headless = settings.headless;
    WebDriverBrowser browser(client, wopts);

    DiscoveryPipeline::Options popts;
    popts.email = settings.login_email;
    popts.password = settings.login_password;
    popts.settle_ms = settings.settle_ms;
    popts.locator.probe_timeout_seconds = settings.probe_timeout_seconds;
    popts.prober.timeout_seconds = settings.probe_timeout_seconds;
    popts.prober.workers = settings.probe_workers;
    popts.prober.include_api_subdomain = settings.include_api_subdomain;
    DiscoveryPipeline pipeline(client, browser, popts);

    DedupEngine dedup(settings.dedup);

    std::unique_ptr<logging::ChainLogger> audit;
    std::string run_id = logging::ChainLogger::new_run_id();
    if (!settings.audit_log_path.empty()) {
        std::filesystem::path p(settings.audit_log_path);
        if (p.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(p.parent_path(), ec);
        }
        audit = std::make_unique<logging::ChainLogger>(settings.audit_log_path, run_id, target);
        if (!audit->is_open()) {
            std::cerr << "Warning: cannot open audit log " << settings.audit_log_path << "\n";
            audit.reset();
        }
    }

    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    std::cout << "Starting discovery: " << run_id << "\n";
    std::cout << "Target: " << target << "\n";

    DiscoveryResult result;
    try {
        result = pipeline.run(target, dedup, &g_cancel, audit.get());
    } catch (const BrowserError& e) {
        std::cerr << "Error: browser unavailable: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Login page: " << result.login_page.url
              << " (" << locator_strategy_name(result.login_page.strategy) << ")\n";
    std::cout << "Login form: " << form_source_name(result.form_source) << "\n";
    if (result.login_captured) {
        std::cout << "Login call: " << result.capture->selected_request.method << " "
                  << result.capture->selected_request.url
                  << " (score " << result.capture->score << ", "
                  << result.capture->tokens.size() << " token(s))\n";
    } else {
        std::cout << "Login call: not captured (" << result.captured_requests << " requests seen)\n";
    }
    std::cout << "Endpoints found: " << result.endpoints_found
              << " of " << result.probes_attempted << " probes\n";
    if (result.cancelled) {
        std::cout << "Run cancelled\n";
    }

    nlohmann::json doc = result.to_json();
    doc["run_id"] = run_id;
    auto stats = dedup.stats();
    doc["dedup"] = {
        {"processed", stats.total_processed},
        {"unique", stats.unique_items},
        {"duplicates", stats.duplicates_found},
        {"duplicate_ratio", stats.duplicate_ratio()},
        {"memory_bytes", dedup.memory_usage_bytes()}
    };
    if (out_path.empty()) {
        out_path = "./out/discovery_" + run_id + ".json";
    }
    if (!write_json(doc, out_path)) {
        return 1;
    }
    std::cout << "Wrote " << out_path << "\n";
    return 0;
}

/**
 * @brief Locator and static form classification only (no browser)
 * @return 0 on success, 2 on usage error
 */
int cmd_locate(int argc, char** argv) {
    std::string target;
    std::string config_path;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--target") {
            target = flag_value(argc, argv, i);
        } else if (a == "--config") {
            config_path = flag_value(argc, argv, i);
        }
    }
    if (target.empty()) {
        std::cerr << "Usage: authtrace locate --target URL [--config FILE]\n";
        return 2;
    }

    config::Settings settings = config_path.empty()
        ? config::Settings::get_default()
        : config::Settings::load(config_path);
    HttpClient client(settings.http);

    LoginLocator::Options lopts;
    lopts.probe_timeout_seconds = settings.probe_timeout_seconds;
    LoginLocator locator(client, lopts);
    LocatorResult located = locator.locate(target);

    FieldClassifier classifier;
    nlohmann::json doc;
    doc["target"] = target;
    doc["login_page"] = {
        {"url", located.url},
        {"strategy", locator_strategy_name(located.strategy)},
        {"found", located.found},
        {"evidence", located.evidence}
    };

    HttpRequest req;
    req.url = located.url;
    HttpResponse resp;
    doc["form"] = nullptr;
    doc["forms_on_page"] = 0;
    if (client.perform(req, resp) && !resp.body.empty()) {
        const std::string page = resp.effective_url.empty() ? located.url : resp.effective_url;
        auto forms = classifier.find_forms(resp.body, page);
        doc["forms_on_page"] = forms.size();
        if (auto form = classifier.classify_page(resp.body, page)) {
            doc["form"] = login_form_to_json(*form);
        }
    } else {
        std::cerr << "Warning: could not fetch " << located.url << ": " << resp.error << "\n";
    }

    return write_json(doc, "") ? 0 : 1;
}

/**
 * @brief Score a saved capture log offline
 * @return 0 on success (including "no login call"), 2 on usage or input error
 */
int cmd_score(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: authtrace score <capture.json>\n";
        return 2;
    }
    std::ifstream in(argv[2]);
    if (!in.is_open()) {
        std::cerr << "Error: cannot open " << argv[2] << "\n";
        return 2;
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    nlohmann::json events = nlohmann::json::parse(content, nullptr, false);
    if (events.is_discarded()) {
        std::cerr << "Error: " << argv[2] << " is not valid JSON\n";
        return 2;
    }

    CaptureLog log = NetworkCapture::parse_json(events);
    RequestScorer scorer;
    auto ranked = scorer.rank(log);

    nlohmann::json doc;
    doc["requests"] = log.requests.size();
    doc["responses"] = log.responses.size();
    doc["candidates"] = nlohmann::json::array();
    for (const auto& c : ranked) {
        doc["candidates"].push_back({
            {"method", c.request.method},
            {"url", c.request.url},
            {"score", c.score},
            {"reasons", c.reasons}
        });
    }

    auto selected = scorer.select(log);
    doc["login_captured"] = selected.has_value();
    doc["login_capture"] = selected
        ? login_capture_to_json(TokenExtractor::capture(*selected, log))
        : nlohmann::json();

    return write_json(doc, "") ? 0 : 1;
}

/**
 * @brief Verify the hash chain of an audit log
 * @return 0 if intact, 1 if broken, 2 on usage error
 */
int cmd_verify(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: authtrace verify <log-file.jsonl>\n";
        return 2;
    }

    std::string log_path = argv[2];
    std::cout << "Verifying log: " << log_path << "\n";

    std::string error;
    if (logging::ChainLogger::verify(log_path, &error)) {
        std::cout << "Log verified: " << logging::ChainLogger::load(log_path).size()
                  << " entries, chain intact\n";
        return 0;
    }
    std::cerr << "Verification failed: " << error << "\n";
    return 1;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    std::string command = argv[1];

    if (command == "discover") {
        return cmd_discover(argc, argv);
    } else if (command == "locate") {
        return cmd_locate(argc, argv);
    } else if (command == "score") {
        return cmd_score(argc, argv);
    } else if (command == "verify") {
        return cmd_verify(argc, argv);
    } else {
        std::cerr << "Unknown command: " << command << "\n";
        print_usage();
        return 2;
    }
}
