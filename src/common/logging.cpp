#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <converge/common/logging.hpp>

#include <memory>
#include <vector>

namespace converge::common {

void configure_logging(const logging_options& options) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (options.log_file.has_value()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
        *options.log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      options.logger_name, std::begin(sinks), std::end(sinks),
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(options.verbose ? spdlog::level::debug
                                    : spdlog::level::info);
}

}  // namespace converge::common
