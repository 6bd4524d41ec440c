#pragma once
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>

#include "server.hpp"

namespace relay_core {
class ChatService;
class JobQueue;
class ResponseCache;
class RelayError;
class WorkerBridge;
}  // namespace relay_core

namespace relay_api {

class Routes {
 public:
  Routes(std::shared_ptr<relay_core::ChatService> chat_service,
         std::shared_ptr<relay_core::JobQueue> job_queue,
         std::shared_ptr<relay_core::WorkerBridge> worker_bridge,
         std::shared_ptr<relay_core::ResponseCache> response_cache,
         std::chrono::milliseconds await_timeout);
  ~Routes() = default;

  Routes(const Routes &) = delete;
  Routes &operator=(const Routes &) = delete;

  // Register all routes with the server
  void register_routes(Server &server);

 private:
  std::shared_ptr<relay_core::ChatService> chat_service_;
  std::shared_ptr<relay_core::JobQueue> job_queue_;
  std::shared_ptr<relay_core::WorkerBridge> worker_bridge_;
  std::shared_ptr<relay_core::ResponseCache> response_cache_;
  std::chrono::milliseconds await_timeout_;

  // Route handlers
  crow::response handle_health_check(const crow::request &req);
  crow::response handle_chat(const crow::request &req);
  crow::response handle_submit_job(const crow::request &req);
  crow::response handle_get_job(const crow::request &req, const std::string &job_id);
  crow::response handle_stats(const crow::request &req);
  crow::response handle_clear_cache(const crow::request &req);
  crow::response handle_clean_queue(const crow::request &req);

  // Helper methods
  nlohmann::json parse_json_body(const std::string &body);
  nlohmann::json create_success_response(const std::string &message,
                                         const nlohmann::json &data = nlohmann::json{});
  nlohmann::json create_error_response(const std::string &code, const std::string &message);
  crow::response error_response_for(const relay_core::RelayError &error);
  crow::response create_json_response(const nlohmann::json &json_data, int status_code = 200);
};

}  // namespace relay_api
