//
// Created by Giuseppe Francione on 11/10/26.
//

#ifndef SUBSMITH_COMPLETION_QUEUE_HPP
#define SUBSMITH_COMPLETION_QUEUE_HPP

#include <condition_variable>
#include <deque>
#include <mutex>

namespace subsmith {

    /**
     * @brief Multi-producer, single-consumer message queue.
     *
     * @details Workers push their results; the scheduling thread blocks in
     * pop() until one is available. This is the only channel through which
     * workers talk to the scheduler.
     */
    template <typename Message>
    class CompletionQueue {
    public:
        void push(Message message) {
            {
                std::lock_guard lock(mutex_);
                messages_.push_back(std::move(message));
            }
            cv_.notify_one();
        }

        /// @brief Blocks until a message is available and removes it.
        Message pop() {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return !messages_.empty(); });
            Message message = std::move(messages_.front());
            messages_.pop_front();
            return message;
        }

        [[nodiscard]] bool empty() const {
            std::lock_guard lock(mutex_);
            return messages_.empty();
        }

    private:
        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<Message> messages_;
    };

} // namespace subsmith

#endif // SUBSMITH_COMPLETION_QUEUE_HPP
