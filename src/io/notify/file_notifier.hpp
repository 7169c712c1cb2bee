#ifndef FILE_NOTIFIER_HPP
#define FILE_NOTIFIER_HPP

#include "base_notifier.hpp"

#include <fstream>
#include <mutex>
#include <string>

// Appends one JSON object per notification to a file
class FileNotifier : public INotifier {
public:
  explicit FileNotifier(const std::string &file_path);
  ~FileNotifier() override;

  bool notify(const std::string &user_id, const std::string &subject,
              const std::string &body) override;
  const char *get_name() const override { return "FileNotifier"; }
  std::string get_notifier_type() const override { return "file"; }

  bool is_open() const { return output_stream_.is_open(); }

private:
  std::string output_path_;
  std::ofstream output_stream_;
  std::mutex stream_mutex_;
};

#endif // FILE_NOTIFIER_HPP
