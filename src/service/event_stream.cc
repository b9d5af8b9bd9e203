#include <service/event_stream.h>

namespace landrop::service {

using Feedback = core::Feedback;

void EventStream::PostFeedback(Feedback&& feedback) {
    feedbacks_.emplace_back(std::move(feedback));
}

void EventStream::PostFeedback(const Feedback& feedback) {
    feedbacks_.emplace_back(feedback);
}

std::optional<Feedback> EventStream::PollFeedback() {
    if (feedbacks_.empty()) {
        return std::nullopt;
    }
    Feedback feedback = std::move(feedbacks_.front());
    feedbacks_.pop_front();
    return feedback;
}

} // namespace landrop::service
