#pragma once

#include <functional>
#include <string>

namespace flipbook::status {

enum class Kind {
    Progress,
    Ready,
    Failure,
};

using Notifier = std::function<void(Kind, const std::string&)>;

void set_notifier(Notifier notifier);
void clear_notifier();

// Logs the message (failures as errors) and forwards it to the installed notifier, if any.
void notify(Kind kind, const std::string& message);

inline void progress(const std::string& message) { notify(Kind::Progress, message); }
inline void ready(const std::string& message) { notify(Kind::Ready, message); }
inline void failure(const std::string& message) { notify(Kind::Failure, message); }

class ScopedNotifier {
public:
    explicit ScopedNotifier(Notifier notifier);
    ~ScopedNotifier();

    ScopedNotifier(const ScopedNotifier&) = delete;
    ScopedNotifier& operator=(const ScopedNotifier&) = delete;

private:
    Notifier previous_{};
};

}
