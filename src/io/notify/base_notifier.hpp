#ifndef BASE_NOTIFIER_HPP
#define BASE_NOTIFIER_HPP

#include <string>

class INotifier {
public:
  virtual ~INotifier() = default;
  // Returns false when the notification could not be delivered
  virtual bool notify(const std::string &user_id, const std::string &subject,
                      const std::string &body) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_notifier_type() const = 0;
};

#endif // BASE_NOTIFIER_HPP
