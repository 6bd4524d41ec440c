#include "relay_cli/cli_handler.hpp"
#include <iostream>
#include <iomanip> // Required for std::fixed and std::setprecision
#include <memory>
#include <stdexcept>
#include <string>

namespace relay_cli {

namespace {

struct SlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

long long parse_number(const std::string& flag, const std::string& value) {
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw CliError("Invalid value for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw CliError("Invalid value for " + flag + ": " + value);
    }
}

std::string error_text(const nlohmann::json& body) {
    if (body.is_object() && body.contains("error") && body["error"].is_object()) {
        const auto& error = body["error"];
        return error.value("code", std::string("ERROR")) + ": " + error.value("message", std::string());
    }
    return body.dump();
}

} // namespace

CliHandler::CliHandler(const std::string& api_base_url)
    : api_base_url_(api_base_url), curl_handle_(nullptr) {
    setup_curl_handle();
}

CliHandler::~CliHandler() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

CliHandler::CliHandler(CliHandler&& other) noexcept
    : api_base_url_(std::move(other.api_base_url_))
    , curl_handle_(other.curl_handle_) {
    other.curl_handle_ = nullptr;
}

CliHandler& CliHandler::operator=(CliHandler&& other) noexcept {
    if (this != &other) {
        if (curl_handle_) {
            curl_easy_cleanup(curl_handle_);
        }
        api_base_url_ = std::move(other.api_base_url_);
        curl_handle_ = other.curl_handle_;
        other.curl_handle_ = nullptr;
    }
    return *this;
}

void CliHandler::setup_curl_handle() {
    curl_handle_ = curl_easy_init();
    if (!curl_handle_) {
        throw CliError("Failed to initialize CURL");
    }
}

size_t CliHandler::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    userp->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];

    if (command == "ask" || command == "a" || command == "submit" || command == "s") {
        const bool ask = command == "ask" || command == "a";
        options.command = ask ? Command::Ask : Command::Submit;
        const std::string usage = ask ? "Usage: ask --query <query>" : "Usage: submit --query <query>";
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) {
                throw CliError(std::string("Missing value for ") + argv[i] + ". " + usage);
            }
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--query" || flag == "-q") {
                options.query = value;
            } else if (flag == "--user" || flag == "-u") {
                options.user_id = value;
            } else if (flag == "--session" || flag == "-s") {
                options.session_id = value;
            } else if (flag == "--priority" || flag == "-p") {
                options.priority = static_cast<int>(parse_number(flag, value));
            } else if (ask && (flag == "--timeout" || flag == "-t")) {
                options.timeout_ms = parse_number(flag, value);
            } else {
                throw CliError("Unknown option: " + flag + ". " + usage);
            }
        }
        if (options.query.empty()) {
            throw CliError("Command requires a query. " + usage);
        }
    } else if (command == "job" || command == "j") {
        options.command = Command::Job;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--id" || flag == "-i") {
                options.job_id = value;
            }
        }
        if (options.job_id.empty()) {
            throw CliError("Job command requires a job ID. Usage: job --id <job_id>");
        }
    } else if (command == "stats") {
        options.command = Command::Stats;
    } else if (command == "health") {
        options.command = Command::Health;
    } else if (command == "clear-cache" || command == "cc") {
        options.command = Command::ClearCache;
    } else if (command == "clean-queue" || command == "cq") {
        options.command = Command::CleanQueue;
        for (int i = 2; i < argc; i += 2) {
            if (i + 1 >= argc) break;
            std::string flag = argv[i];
            std::string value = argv[i + 1];

            if (flag == "--completed-hours") {
                options.completed_grace_ms = parse_number(flag, value) * 60 * 60 * 1000;
            } else if (flag == "--failed-hours") {
                options.failed_grace_ms = parse_number(flag, value) * 60 * 60 * 1000;
            }
        }
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
    } else {
        throw CliError("Unknown command: " + command);
    }

    return options;
}

int CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Ask:
            return handle_ask_command(options);
        case Command::Submit:
            return handle_submit_command(options);
        case Command::Job:
            return handle_job_command(options);
        case Command::Stats:
            return handle_stats_command(options);
        case Command::Health:
            return handle_health_command(options);
        case Command::ClearCache:
            return handle_clear_cache_command(options);
        case Command::CleanQueue:
            return handle_clean_queue_command(options);
        case Command::Help:
            print_help();
            return 0;
    }
    return 1;
}

nlohmann::json CliHandler::build_query_body(const CliOptions& options) {
    nlohmann::json body = {{"query", options.query}};
    if (!options.user_id.empty()) {
        body["userId"] = options.user_id;
    }
    if (!options.session_id.empty()) {
        body["sessionId"] = options.session_id;
    }
    if (options.priority >= 0) {
        body["priority"] = options.priority;
    }
    if (options.timeout_ms > 0) {
        body["timeoutMs"] = options.timeout_ms;
    }
    return body;
}

int CliHandler::handle_ask_command(const CliOptions& options) {
    std::cout << "Asking: " << options.query << std::endl;

    try {
        nlohmann::json response = make_post_request("/chat", build_query_body(options));
        print_answer_response(response);
        return 0;
    } catch (const HttpError& e) {
        print_http_error(e);
    } catch (const std::exception& e) {
        print_error("Failed to ask: " + std::string(e.what()));
    }
    return 1;
}

int CliHandler::handle_submit_command(const CliOptions& options) {
    std::cout << "Submitting job for: " << options.query << std::endl;

    try {
        nlohmann::json response = make_post_request("/jobs", build_query_body(options));
        const auto& data = response["data"];
        std::cout << "Job queued with ID: " << data["jobId"].get<long long>() << std::endl;
        std::cout << "Check it with: relay_cli job --id " << data["jobId"].get<long long>() << std::endl;
        return 0;
    } catch (const HttpError& e) {
        print_http_error(e);
    } catch (const std::exception& e) {
        print_error("Failed to submit job: " + std::string(e.what()));
    }
    return 1;
}

int CliHandler::handle_job_command(const CliOptions& options) {
    std::cout << "Getting job ID: " << options.job_id << std::endl;

    try {
        nlohmann::json response = make_get_request("/jobs/" + options.job_id);
        print_job_response(response);
        return 0;
    } catch (const HttpError& e) {
        print_http_error(e);
    } catch (const std::exception& e) {
        print_error("Failed to get job: " + std::string(e.what()));
    }
    return 1;
}

int CliHandler::handle_stats_command(const CliOptions&) {
    try {
        nlohmann::json response = make_get_request("/stats");
        print_json_response(response["data"]);
        return 0;
    } catch (const HttpError& e) {
        print_http_error(e);
    } catch (const std::exception& e) {
        print_error("Failed to get stats: " + std::string(e.what()));
    }
    return 1;
}

int CliHandler::handle_health_command(const CliOptions&) {
    try {
        print_health_response(make_get_request("/health"));
        return 0;
    } catch (const HttpError& e) {
        // 503 still carries the component breakdown.
        if (e.status() == 503 && e.body().contains("data")) {
            print_health_response(e.body());
        } else {
            print_http_error(e);
        }
    } catch (const std::exception& e) {
        print_error("Failed to check health: " + std::string(e.what()));
    }
    return 1;
}

int CliHandler::handle_clear_cache_command(const CliOptions&) {
    try {
        nlohmann::json response = make_post_request("/cache/clear", nlohmann::json::object());
        std::cout << "Cleared " << response["data"]["cleared"].get<long long>() << " cached answer(s)"
                  << std::endl;
        return 0;
    } catch (const HttpError& e) {
        print_http_error(e);
    } catch (const std::exception& e) {
        print_error("Failed to clear cache: " + std::string(e.what()));
    }
    return 1;
}

int CliHandler::handle_clean_queue_command(const CliOptions& options) {
    nlohmann::json request_data = nlohmann::json::object();
    if (options.completed_grace_ms >= 0) {
        request_data["completed_grace_ms"] = options.completed_grace_ms;
    }
    if (options.failed_grace_ms >= 0) {
        request_data["failed_grace_ms"] = options.failed_grace_ms;
    }

    try {
        nlohmann::json response = make_post_request("/queue/clean", request_data);
        std::cout << "Purged " << response["data"]["purged"].get<long long>() << " finished job(s)"
                  << std::endl;
        return 0;
    } catch (const HttpError& e) {
        print_http_error(e);
    } catch (const std::exception& e) {
        print_error("Failed to clean queue: " + std::string(e.what()));
    }
    return 1;
}

nlohmann::json CliHandler::make_get_request(const std::string& endpoint) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    curl_easy_reset(curl_handle_);
    return perform_request(url);
}

nlohmann::json CliHandler::make_post_request(const std::string& endpoint, const nlohmann::json& data) {
    if (!curl_handle_) {
        throw CliError("CURL handle not initialized");
    }

    std::string url = build_url(endpoint);
    std::string request_json = data.dump();
    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"));

    curl_easy_reset(curl_handle_);
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request_json.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers.get());
    return perform_request(url);
}

nlohmann::json CliHandler::perform_request(const std::string& url) {
    std::string response_buffer;

    curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response_buffer);

    CURLcode res = curl_easy_perform(curl_handle_);
    if (res != CURLE_OK) {
        throw CliError("CURL request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &http_code);

    nlohmann::json body = nlohmann::json::parse(response_buffer, nullptr, false);
    if (http_code < 200 || http_code >= 300) {
        throw HttpError(http_code, body.is_discarded() ? nlohmann::json(response_buffer) : body);
    }
    if (body.is_discarded()) {
        throw CliError("Server returned invalid JSON");
    }
    return body;
}

void CliHandler::set_api_base_url(const std::string& url) {
    api_base_url_ = url;
}

std::string CliHandler::get_api_base_url() const {
    return api_base_url_;
}

void CliHandler::print_json_response(const nlohmann::json& response) {
    std::cout << response.dump(2) << std::endl;
}

void CliHandler::print_answer_response(const nlohmann::json& response) {
    const auto& data = response["data"];

    std::cout << "\n" << std::string(80, '=') << std::endl;
    std::cout << data.value("answer", std::string()) << std::endl;
    std::cout << std::string(80, '=') << std::endl;

    if (data.contains("sources") && data["sources"].is_array() && !data["sources"].empty()) {
        std::cout << "Sources:" << std::endl;
        for (const auto& source : data["sources"]) {
            std::cout << "  - " << (source.is_string() ? source.get<std::string>() : source.dump())
                      << std::endl;
        }
    }

    std::cout << "Job " << data.value("jobId", 0LL)
              << (data.value("cached", false) ? " (cached)" : "")
              << " | " << std::fixed << std::setprecision(2)
              << data.value("elapsedMs", 0LL) / 1000.0 << "s" << std::endl;
}

void CliHandler::print_job_response(const nlohmann::json& response) {
    std::cout << "\n=== Job Status ===" << std::endl;

    if (!response.contains("data")) {
        std::cout << "Unexpected response format." << std::endl;
        return;
    }
    const auto& job = response["data"];

    std::cout << "Job ID: " << job["jobId"].get<long long>() << std::endl;
    std::cout << "State: " << job["state"].get<std::string>() << std::endl;

    if (job.contains("progress")) {
        const int percent = job["progress"].value("percent", 0);
        int bar_width = 40;
        int filled = percent * bar_width / 100;
        std::cout << "Progress: [";
        for (int i = 0; i < bar_width; ++i) {
            if (i < filled) {
                std::cout << "=";
            } else if (i == filled && percent > 0) {
                std::cout << ">";
            } else {
                std::cout << " ";
            }
        }
        std::cout << "] " << percent << "%";
        const std::string message = job["progress"].value("message", std::string());
        if (!message.empty()) {
            std::cout << " " << message;
        }
        std::cout << std::endl;
    }

    if (job.contains("result") && !job["result"].is_null()) {
        std::cout << "Answer: " << job["result"].value("answer", std::string()) << std::endl;
    }
    if (job.contains("error") && !job["error"].is_null()) {
        std::cout << "Error: " << error_text(job) << std::endl;
    }
    if (job.contains("createdAt")) {
        std::cout << "Created: " << job["createdAt"].dump() << std::endl;
    }
}

void CliHandler::print_health_response(const nlohmann::json& response) {
    const auto& data = response["data"];
    std::cout << "Status: " << data.value("status", std::string("unknown")) << std::endl;
    if (data.contains("worker")) {
        std::cout << "  Worker: " << (data["worker"].value("healthy", false) ? "healthy" : "unhealthy")
                  << " (" << data["worker"].value("state", std::string()) << ")" << std::endl;
    }
    if (data.contains("cache")) {
        std::cout << "  Cache:  " << (data["cache"].value("healthy", false) ? "healthy" : "unhealthy")
                  << std::endl;
    }
    if (data.contains("queue")) {
        const auto& queue = data["queue"];
        std::cout << "  Queue:  " << queue.value("health", std::string()) << " (waiting "
                  << queue.value("waiting", 0LL) << ", active " << queue.value("active", 0LL)
                  << ", failed " << queue.value("failed", 0LL) << ")" << std::endl;
    }
}

void CliHandler::print_error(const std::string& error) {
    std::cerr << "Error: " << error << std::endl;
}

void CliHandler::print_http_error(const HttpError& error) {
    std::cerr << "Error (HTTP " << error.status() << "): " << error_text(error.body()) << std::endl;
}

void CliHandler::print_help() {
    std::cout << R"(
query-relay CLI - Client for the query-relay API

Usage: relay_cli <command> [options]

Query Commands:
  ask, a        Submit a query and wait for the answer
    --query, -q <query>     Query text
    --user, -u <id>         Caller ID (default: anonymous)
    --session, -s <id>      Session ID
    --priority, -p <num>    Job priority, lower runs first (default: 10)
    --timeout, -t <ms>      How long the server waits for the answer

  submit, s     Queue a query and return its job ID immediately
    --query, -q <query>     Query text
    --user, -u <id>         Caller ID
    --session, -s <id>      Session ID
    --priority, -p <num>    Job priority

  job, j        Show state, progress and outcome of a job
    --id, -i <job_id>       Job ID to check

Operations:
  stats         Show worker, cache and queue statistics
  health        Show the health of each component
  clear-cache, cc   Remove all cached answers
  clean-queue, cq   Purge finished jobs
    --completed-hours <n>   Keep completed jobs newer than n hours (default: 1)
    --failed-hours <n>      Keep failed jobs newer than n hours (default: 24)

General:
  help, h       Show this help message

Environment Variables:
  API_BASE_URL  Base URL for the query-relay API (default: http://127.0.0.1:3030)

Examples:
  relay_cli ask --query "What is retrieval augmented generation?"
  relay_cli submit --query "Summarize the onboarding guide" --priority 1
  relay_cli job --id 42
  relay_cli clean-queue --failed-hours 48
)" << std::endl;
}

std::string CliHandler::build_url(const std::string& endpoint) {
    return api_base_url_ + endpoint;
}

} // namespace relay_cli
