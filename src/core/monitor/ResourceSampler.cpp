#include "ResourceSampler.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QFile>
#include <QtCore/QMutexLocker>
#include <QtCore/QRegularExpression>
#include <QtCore/QStringList>

namespace Sluice {

QString toString(ResourceError error) {
    switch (error) {
        case ResourceError::Unavailable: return QStringLiteral("resource statistics unavailable");
        case ResourceError::ParseFailed: return QStringLiteral("could not parse resource statistics");
        case ResourceError::NotSupported: return QStringLiteral("resource sampling not supported on this platform");
    }
    return QStringLiteral("unknown resource error");
}

Expected<ResourceUsage, ResourceError> SystemResourceSampler::sample() {
#if defined(Q_OS_LINUX)
    auto cpu = readCpuPercent();
    if (cpu.hasError()) {
        return makeUnexpected(cpu.error());
    }
    auto memory = readMemoryPercent();
    if (memory.hasError()) {
        return makeUnexpected(memory.error());
    }

    ResourceUsage usage;
    usage.cpuPercent = cpu.value();
    usage.memoryPercent = memory.value();
    SLUICE_TRACE("Resource usage: cpu {:.1f}% memory {:.1f}%", usage.cpuPercent, usage.memoryPercent);
    return usage;
#else
    return makeUnexpected(ResourceError::NotSupported);
#endif
}

Expected<double, ResourceError> SystemResourceSampler::readCpuPercent() {
    QFile statFile("/proc/stat");
    if (!statFile.open(QIODevice::ReadOnly)) {
        return makeUnexpected(ResourceError::Unavailable);
    }

    const QString line = QString::fromLatin1(statFile.readLine()).trimmed();
    if (!line.startsWith("cpu ")) {
        return makeUnexpected(ResourceError::ParseFailed);
    }

    const QStringList fields = line.mid(4).split(' ', Qt::SkipEmptyParts);
    if (fields.size() < 8) {
        return makeUnexpected(ResourceError::ParseFailed);
    }

    // user nice system idle iowait irq softirq steal
    unsigned long long values[8] = {};
    for (int i = 0; i < 8; ++i) {
        bool ok = false;
        values[i] = fields.at(i).toULongLong(&ok);
        if (!ok) {
            return makeUnexpected(ResourceError::ParseFailed);
        }
    }

    unsigned long long currentTotalTime = 0;
    for (unsigned long long value : values) {
        currentTotalTime += value;
    }
    const unsigned long long currentIdleTime = values[3] + values[4];

    QMutexLocker locker(&mutex_);
    if (primed_ && currentTotalTime > lastTotalTime_) {
        const unsigned long long totalDiff = currentTotalTime - lastTotalTime_;
        const unsigned long long idleDiff = currentIdleTime - lastIdleTime_;
        lastCpuPercent_ = 100.0 * static_cast<double>(totalDiff - idleDiff) / static_cast<double>(totalDiff);
    }
    lastTotalTime_ = currentTotalTime;
    lastIdleTime_ = currentIdleTime;
    primed_ = true;
    return lastCpuPercent_;
}

Expected<double, ResourceError> SystemResourceSampler::readMemoryPercent() const {
    QFile meminfo("/proc/meminfo");
    if (!meminfo.open(QIODevice::ReadOnly)) {
        return makeUnexpected(ResourceError::Unavailable);
    }

    const QString content = QString::fromLatin1(meminfo.readAll());
    static const QRegularExpression totalRegex("MemTotal:\\s+(\\d+)\\s+kB");
    static const QRegularExpression availableRegex("MemAvailable:\\s+(\\d+)\\s+kB");
    const auto total = totalRegex.match(content);
    const auto available = availableRegex.match(content);
    if (!total.hasMatch() || !available.hasMatch()) {
        return makeUnexpected(ResourceError::ParseFailed);
    }

    const double totalKb = total.captured(1).toDouble();
    const double availableKb = available.captured(1).toDouble();
    if (totalKb <= 0.0) {
        return makeUnexpected(ResourceError::ParseFailed);
    }
    return 100.0 * (1.0 - availableKb / totalKb);
}

} // namespace Sluice
