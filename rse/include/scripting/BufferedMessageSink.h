#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <vector>

namespace RSE {

/**
 * @brief Bounded in-memory message buffer behind log_message() and print()
 *
 * Writes never block and never fail: when the buffer is full the oldest
 * message is dropped and counted. One sink per run.
 */
class BufferedMessageSink {
public:
    explicit BufferedMessageSink(size_t capacity = 1000);

    void write(const std::string &message);

    std::vector<std::string> messages() const;

    size_t size() const {
        return messages_.size();
    }

    size_t capacity() const {
        return capacity_;
    }

    size_t droppedCount() const {
        return dropped_;
    }

    /**
     * @brief Forward buffered messages to the logger at info level
     *
     * The buffer keeps its content so the result can still carry it.
     */
    void flushToLogger(const std::string &runId) const;

private:
    size_t capacity_;
    size_t dropped_ = 0;
    std::deque<std::string> messages_;
};

}  // namespace RSE
