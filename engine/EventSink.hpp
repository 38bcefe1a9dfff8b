#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace net_survey::engine
{
    // Fire-and-forget notification channel. Implementations may throw;
    // publishers catch, log and carry on.
    class EventSink
    {
    public:
        virtual ~EventSink() = default;
        virtual void Publish(const std::string &type, const nlohmann::json &payload) = 0;
    };

    class LogEventSink : public EventSink
    {
    public:
        void Publish(const std::string &type, const nlohmann::json &payload) override;
    };

    // Publishes through `sink`, logging instead of propagating failures.
    void PublishSafely(EventSink *sink, const std::string &type, const nlohmann::json &payload);
}
