#pragma once

#include <core/model/feedback.h>
#include <deque>
#include <optional>

namespace landrop::service {

// FIFO of notifications for the front end. Everything runs on one io_context thread, so no lock.
class EventStream {
    using Feedback = core::Feedback;

public:
    void PostFeedback(Feedback&& feedback);
    void PostFeedback(const Feedback& feedback);

    std::optional<Feedback> PollFeedback();

    bool empty() const { return feedbacks_.empty(); }
    std::size_t size() const { return feedbacks_.size(); }

private:
    std::deque<Feedback> feedbacks_;
};

} // namespace landrop::service
