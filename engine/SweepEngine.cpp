#include "SweepEngine.hpp"
#include "JsonView.hpp"
#include "Semaphore.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <system_error>
#include <thread>

namespace net_survey::engine
{
    ClassificationSignals SignalsFor(const DiscoveredDevice &device)
    {
        ClassificationSignals signals;
        signals.address = device.address;
        signals.mac = device.mac.value_or("");
        signals.hostname = device.hostname;
        signals.vendor = device.vendor;
        for (const auto &p : device.open_ports)
        {
            if (p.open)
                signals.open_ports.push_back(p.port);
        }
        return signals;
    }

    SweepEngine::SweepEngine(HostProber &prober, const DeviceClassifier &classifier, SweepOptions options,
                             EventSink *events)
        : m_prober(prober), m_classifier(classifier), m_options(std::move(options)), m_events(events)
    {
        if (m_options.batch_size == 0)
            m_options.batch_size = 1;
        if (m_options.concurrency == 0)
            m_options.concurrency = 1;
    }

    SweepReport SweepEngine::Sweep(const std::string &range, SweepSink &sink)
    {
        std::vector<std::string> hosts = ExpandSweepRange(range, m_options.policy);
        std::cout << "[Sweep] Starting sweep of " << range << " (" << hosts.size() << " hosts)\n";
        return Run(hosts, sink);
    }

    std::thread SweepEngine::StartWorker(std::function<void()> task)
    {
        return std::thread(std::move(task));
    }

    std::vector<DiscoveredDevice> SweepEngine::ScanBatch(const std::vector<std::string> &batch, Semaphore &permits)
    {
        std::vector<DiscoveredDevice> results(batch.size());
        std::vector<std::thread> workers;
        workers.reserve(batch.size());

        auto join_all = [&workers]()
        {
            for (auto &t : workers)
            {
                if (t.joinable())
                    t.join();
            }
        };

        try
        {
            for (size_t i = 0; i < batch.size(); ++i)
            {
                workers.push_back(StartWorker([this, &batch, &results, &permits, i]()
                                              {
                    SemaphoreGuard permit(permits);
                    try
                    {
                        results[i] = m_prober.ScanHost(batch[i]);
                    }
                    catch (const std::exception &e)
                    {
                        results[i].address = batch[i];
                        results[i].liveness = Liveness::Error;
                        results[i].error = e.what();
                    } }));
            }
        }
        catch (const std::system_error &e)
        {
            std::cerr << "[Sweep] Could not start scan thread " << workers.size() + 1 << "/" << batch.size()
                      << ": " << e.what() << "\n";
            join_all();
            throw;
        }

        join_all();
        return results;
    }

    void SweepEngine::Classify(DiscoveredDevice &device)
    {
        ClassificationResult result = m_classifier.Classify(SignalsFor(device));
        device.classification = result;

        if (result.score >= m_options.notify_threshold)
        {
            PublishSafely(m_events, "classification_update",
                          {{"ip_address", device.address},
                           {"classification", ToJson(result)},
                           {"device", ToJson(device)}});
        }
    }

    SweepReport SweepEngine::Run(const std::vector<std::string> &hosts, SweepSink &sink)
    {
        SweepReport report;
        report.total = static_cast<uint32_t>(hosts.size());
        sink.SetTotal(report.total);

        Semaphore permits(m_options.concurrency);

        for (size_t start = 0; start < hosts.size(); start += m_options.batch_size)
        {
            if (sink.StopRequested())
            {
                std::cout << "[Sweep] Stop requested, " << report.scanned << "/" << report.total << " hosts scanned\n";
                report.outcome = SweepOutcome::Stopped;
                return report;
            }

            size_t end = std::min(hosts.size(), start + m_options.batch_size);
            std::vector<std::string> batch(hosts.begin() + start, hosts.begin() + end);

            std::vector<DiscoveredDevice> online;
            for (auto &device : ScanBatch(batch, permits))
            {
                if (device.liveness != Liveness::Online)
                    continue;
                // Agent-reported identity is trusted as is.
                if (!device.agent)
                    Classify(device);
                online.push_back(std::move(device));
            }

            report.scanned += static_cast<uint32_t>(batch.size());
            report.devices.insert(report.devices.end(), online.begin(), online.end());
            sink.RecordBatch(online, report.scanned);

            double pct = report.total ? 100.0 * report.scanned / report.total : 100.0;
            std::cout << "[Sweep] Progress: " << report.scanned << "/" << report.total << " ("
                      << std::fixed << std::setprecision(1) << pct << "%) - Online: " << report.devices.size() << "\n";
        }

        std::cout << "[Sweep] Completed. Found " << report.devices.size() << " online devices\n";
        return report;
    }
}
