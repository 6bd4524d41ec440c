#pragma once

#include "relay_core/types/query.hpp"

namespace relay_core {

// Seam between the job queue and whatever answers queries.
class IQueryExecutor {
 public:
  virtual ~IQueryExecutor() = default;

  // Returns the answer or throws RelayError.
  virtual WorkerAnswer execute_query(const QueryRequest &request) = 0;
};

}  // namespace relay_core
