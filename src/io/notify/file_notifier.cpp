#include "file_notifier.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <string>

FileNotifier::FileNotifier(const std::string &file_path)
    : output_path_(file_path) {
  if (!output_path_.empty()) {
    Utils::create_directory_for_file(output_path_);
    output_stream_.open(output_path_, std::ios::app);
    if (!output_stream_.is_open())
      LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
          "FileNotifier could not open output file: " << output_path_);
  }
}

FileNotifier::~FileNotifier() {
  if (output_stream_.is_open()) {
    output_stream_.flush();
    output_stream_.close();
    LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
        "FileNotifier closed output file: " << output_path_);
  }
}

bool FileNotifier::notify(const std::string &user_id,
                          const std::string &subject,
                          const std::string &body) {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (!output_stream_.is_open())
    return false;

  try {
    std::string json_output = JsonFormatter::format_notification_to_json(
        user_id, subject, body, Utils::get_current_time_ms());
    output_stream_ << json_output << std::endl; // endl also flushes

    if (output_stream_.good()) {
      LOG(LogLevel::TRACE, LogComponent::IO_NOTIFY,
          "Notification for " << user_id << " written to " << output_path_);
      return true;
    }
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Failed to write notification to file: " << output_path_);
    return false;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_NOTIFY,
        "Exception while writing notification to file: " << e.what());
    return false;
  }
}
