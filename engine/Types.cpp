#include "Types.hpp"

namespace net_survey::engine
{
    const char *ToString(Liveness liveness)
    {
        switch (liveness)
        {
        case Liveness::Online:
            return "Online";
        case Liveness::Offline:
            return "Offline";
        case Liveness::Error:
            return "Error";
        }
        return "Error";
    }

    const char *ToString(DeviceType type)
    {
        switch (type)
        {
        case DeviceType::Firewall:
            return "Firewall";
        case DeviceType::Router:
            return "Router";
        case DeviceType::Switch:
            return "Switch";
        case DeviceType::AccessPoint:
            return "Access Point";
        case DeviceType::Server:
            return "Server";
        case DeviceType::Workstation:
            return "Workstation";
        case DeviceType::Printer:
            return "Printer";
        case DeviceType::CameraIoT:
            return "Camera/IoT";
        case DeviceType::Mobile:
            return "Mobile Device";
        case DeviceType::Unknown:
            return "Unknown";
        }
        return "Unknown";
    }

    const char *ToString(Confidence confidence)
    {
        switch (confidence)
        {
        case Confidence::High:
            return "High";
        case Confidence::Medium:
            return "Medium";
        case Confidence::Low:
            return "Low";
        }
        return "Low";
    }

    const char *ToString(ScanStatus status)
    {
        switch (status)
        {
        case ScanStatus::Scanning:
            return "scanning";
        case ScanStatus::Completed:
            return "completed";
        case ScanStatus::Stopped:
            return "stopped";
        case ScanStatus::Error:
            return "error";
        }
        return "error";
    }

    const char *ToString(WalkStatus status)
    {
        switch (status)
        {
        case WalkStatus::Running:
            return "running";
        case WalkStatus::Completed:
            return "completed";
        case WalkStatus::Error:
            return "error";
        }
        return "error";
    }
}
