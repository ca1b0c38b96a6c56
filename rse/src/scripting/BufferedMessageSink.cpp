#include "scripting/BufferedMessageSink.h"
#include "common/LogUtils.h"
#include "common/Logger.h"

namespace RSE {

BufferedMessageSink::BufferedMessageSink(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void BufferedMessageSink::write(const std::string &message) {
    if (messages_.size() >= capacity_) {
        messages_.pop_front();
        dropped_++;
    }
    messages_.push_back(message);
}

std::vector<std::string> BufferedMessageSink::messages() const {
    return std::vector<std::string>(messages_.begin(), messages_.end());
}

void BufferedMessageSink::flushToLogger(const std::string &runId) const {
    for (const auto &message : messages_) {
        LOG_INFO("[{}] {}", runId, Log::sanitize(message));
    }
    if (dropped_ > 0) {
        LOG_WARN("[{}] {} rule message(s) dropped, buffer capacity is {}", runId, dropped_, capacity_);
    }
}

}  // namespace RSE
