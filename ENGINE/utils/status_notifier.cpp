#include "status_notifier.hpp"

#include <mutex>
#include <string>
#include <utility>

#include "log.hpp"

namespace {
std::mutex& notifier_mutex() {
    static std::mutex m;
    return m;
}

flipbook::status::Notifier& notifier_slot() {
    static flipbook::status::Notifier notifier;
    return notifier;
}
}

namespace flipbook::status {

void set_notifier(Notifier notifier) {
    std::lock_guard<std::mutex> lock(notifier_mutex());
    notifier_slot() = std::move(notifier);
}

void clear_notifier() {
    set_notifier(nullptr);
}

void notify(Kind kind, const std::string& message) {
    Notifier copy;
    {
        std::lock_guard<std::mutex> lock(notifier_mutex());
        copy = notifier_slot();
    }
    if (!message.empty()) {
        if (kind == Kind::Failure) {
            flipbook::log::error(std::string("[Status] ") + message);
        } else {
            flipbook::log::info(std::string("[Status] ") + message);
        }
    }
    if (copy) {
        copy(kind, message);
    }
}

ScopedNotifier::ScopedNotifier(Notifier notifier) {
    std::lock_guard<std::mutex> lock(notifier_mutex());
    previous_ = notifier_slot();
    notifier_slot() = std::move(notifier);
}

ScopedNotifier::~ScopedNotifier() {
    std::lock_guard<std::mutex> lock(notifier_mutex());
    notifier_slot() = std::move(previous_);
}

}
