#pragma once

#include <string>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

namespace relay_cli
{

  enum class Command
  {
    Ask,
    Submit,
    Job,
    Stats,
    Health,
    ClearCache,
    CleanQueue,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string query;
    std::string user_id;
    std::string session_id;
    std::string job_id;
    int priority = -1;       // -1 leaves the server default
    long long timeout_ms = 0; // 0 leaves the server default
    long long completed_grace_ms = -1;
    long long failed_grace_ms = -1;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  // Raised when the server answered with a non-2xx status. Carries the body
  // so the error code the server reported can still be shown.
  class HttpError : public CliError
  {
  public:
    HttpError(long status, nlohmann::json body)
        : CliError("HTTP request failed with status code: " + std::to_string(status)),
          status_(status), body_(std::move(body)) {}

    long status() const { return status_; }
    const nlohmann::json &body() const { return body_; }

  private:
    long status_;
    nlohmann::json body_;
  };

  class CliHandler
  {
  public:
    explicit CliHandler(const std::string &api_base_url);
    ~CliHandler();

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Allow move constructor and assignment
    CliHandler(CliHandler &&) noexcept;
    CliHandler &operator=(CliHandler &&) noexcept;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command. Returns the process exit code.
    int execute_command(const CliOptions &options);

    void set_api_base_url(const std::string &url);
    std::string get_api_base_url() const;

    // Builds the JSON body for /chat and /jobs from parsed options.
    static nlohmann::json build_query_body(const CliOptions &options);

  private:
    std::string api_base_url_;
    CURL *curl_handle_;

    // Command handlers
    int handle_ask_command(const CliOptions &options);
    int handle_submit_command(const CliOptions &options);
    int handle_job_command(const CliOptions &options);
    int handle_stats_command(const CliOptions &options);
    int handle_health_command(const CliOptions &options);
    int handle_clear_cache_command(const CliOptions &options);
    int handle_clean_queue_command(const CliOptions &options);

    // HTTP methods
    nlohmann::json make_get_request(const std::string &endpoint);
    nlohmann::json make_post_request(const std::string &endpoint, const nlohmann::json &data);
    nlohmann::json perform_request(const std::string &url);

    // Helper methods
    void setup_curl_handle();
    static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
    void print_json_response(const nlohmann::json &response);
    void print_answer_response(const nlohmann::json &response);
    void print_job_response(const nlohmann::json &response);
    void print_health_response(const nlohmann::json &response);
    void print_error(const std::string &error);
    void print_http_error(const HttpError &error);
    void print_help();
    std::string build_url(const std::string &endpoint);
  };

}
