#include "EventSink.hpp"

#include <iostream>

namespace net_survey::engine
{
    void LogEventSink::Publish(const std::string &type, const nlohmann::json &payload)
    {
        std::cout << "[Events] " << type << " " << payload.dump() << "\n";
    }

    void PublishSafely(EventSink *sink, const std::string &type, const nlohmann::json &payload)
    {
        if (!sink)
            return;

        try
        {
            sink->Publish(type, payload);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Events] Failed to publish " << type << ": " << e.what() << "\n";
        }
    }
}
