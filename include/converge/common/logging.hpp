#pragma once

#include <optional>
#include <string>

namespace converge::common {

struct logging_options final {
  std::string logger_name{"converge"};
  bool verbose{false};
  std::optional<std::string> log_file;
};

/// Install the process-wide async logger (colored stdout plus optional file).
void configure_logging(const logging_options& options);

}  // namespace converge::common
