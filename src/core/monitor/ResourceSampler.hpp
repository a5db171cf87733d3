#pragma once

#include <QtCore/QMutex>
#include <QtCore/QString>
#include "../common/Expected.hpp"

namespace Sluice {

enum class ResourceError {
    Unavailable,
    ParseFailed,
    NotSupported
};

QString toString(ResourceError error);

struct ResourceUsage {
    double cpuPercent = 0.0;
    double memoryPercent = 0.0;
};

class ResourceSampler {
public:
    virtual ~ResourceSampler() = default;
    virtual Expected<ResourceUsage, ResourceError> sample() = 0;
};

// Host-wide usage from /proc. CPU is measured between consecutive calls,
// so the first call reports 0%.
class SystemResourceSampler : public ResourceSampler {
public:
    Expected<ResourceUsage, ResourceError> sample() override;

private:
    Expected<double, ResourceError> readCpuPercent();
    Expected<double, ResourceError> readMemoryPercent() const;

    QMutex mutex_;
    unsigned long long lastTotalTime_ = 0;
    unsigned long long lastIdleTime_ = 0;
    double lastCpuPercent_ = 0.0;
    bool primed_ = false;
};

} // namespace Sluice
