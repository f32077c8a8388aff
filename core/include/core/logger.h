#pragma once

#include <string>

namespace dsa::core {

/// Logger interface used by the scheduler engine and the name service.
/// Concrete implementations live in infra; tests inject a recording one.
///
/// Every line carries a trace id (one per task firing, "engine" for
/// lifecycle events), the emitting component and a short event key.
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace dsa::core
