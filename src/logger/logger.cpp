#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace quloud::logging {

namespace expr = boost::log::expressions;

//==============================================
// INITIALIZATION
//==============================================

void init_logging(const std::string& log_file, severity_level min_level) {
  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << expr::attr<boost::log::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage;

    boost::log::add_console_log(std::clog, boost::log::keywords::format = formatter,
                                boost::log::keywords::auto_flush = true);

    if (!log_file.empty()) {
      auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

      // Convert to absolute path
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }
      backend->set_file_name_pattern(log_path.string());
      backend->set_open_mode(std::ios::out | std::ios::app);
      backend->auto_flush(true);

      using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
      auto sink = boost::make_shared<text_sink>(backend);
      sink->set_formatter(formatter);
      boost::log::core::get()->add_sink(sink);
    }

    boost::log::add_common_attributes();
    set_log_level(min_level);
    enable_logging();

    BOOST_LOG_TRIVIAL(debug) << "Logger: Initialized"
                             << (log_file.empty() ? std::string() : " with file: " + log_file);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

//==============================================
// RUNTIME CONTROL
//==============================================

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->set_logging_enabled(false);
}

severity_level parse_log_level(const std::string& text) {
  std::string lowered = text;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (lowered == "trace") return boost::log::trivial::trace;
  if (lowered == "debug") return boost::log::trivial::debug;
  if (lowered == "info") return boost::log::trivial::info;
  if (lowered == "warning" || lowered == "warn") return boost::log::trivial::warning;
  if (lowered == "error") return boost::log::trivial::error;
  if (lowered == "fatal") return boost::log::trivial::fatal;

  throw std::invalid_argument("Unknown log level: " + text);
}

} // namespace quloud::logging
