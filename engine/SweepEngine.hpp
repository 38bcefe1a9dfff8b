#pragma once

#include "DeviceClassifier.hpp"
#include "EventSink.hpp"
#include "HostProber.hpp"
#include "Ipv4Range.hpp"
#include "Types.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace net_survey::engine
{
    class Semaphore;

    // The job-side state a sweep streams into.
    class SweepSink
    {
    public:
        virtual ~SweepSink() = default;

        virtual bool StopRequested() const = 0;
        virtual void SetTotal(uint32_t total) = 0;
        // Online devices of one finished batch plus the running scanned count.
        virtual void RecordBatch(const std::vector<DiscoveredDevice> &online, uint32_t scanned) = 0;
    };

    struct SweepOptions
    {
        RangePolicy policy;
        std::size_t batch_size = 40;
        std::size_t concurrency = 80;
        int notify_threshold = 25;
    };

    enum class SweepOutcome
    {
        Completed,
        Stopped
    };

    struct SweepReport
    {
        SweepOutcome outcome = SweepOutcome::Completed;
        uint32_t scanned = 0;
        uint32_t total = 0;
        std::vector<DiscoveredDevice> devices;
    };

    class SweepEngine
    {
    public:
        SweepEngine(HostProber &prober, const DeviceClassifier &classifier, SweepOptions options,
                    EventSink *events = nullptr);

        // Expands `range` under the policy (RangeError on rejection) and runs it.
        SweepReport Sweep(const std::string &range, SweepSink &sink);

        // Processes an already expanded host list in batches. The stop flag
        // is read before every batch, never inside one.
        SweepReport Run(const std::vector<std::string> &hosts, SweepSink &sink);

        const SweepOptions &Options() const { return m_options; }

        virtual ~SweepEngine() = default;

    protected:
        // One thread per host in a batch.
        virtual std::thread StartWorker(std::function<void()> task);

    private:
        std::vector<DiscoveredDevice> ScanBatch(const std::vector<std::string> &batch, Semaphore &permits);
        void Classify(DiscoveredDevice &device);

        HostProber &m_prober;
        const DeviceClassifier &m_classifier;
        SweepOptions m_options;
        EventSink *m_events;
    };

    ClassificationSignals SignalsFor(const DiscoveredDevice &device);
}
