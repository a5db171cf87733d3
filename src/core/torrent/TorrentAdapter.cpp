#include "TorrentAdapter.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <QtCore/QReadLocker>
#include <QtCore/QWriteLocker>
#include <libtorrent/alert_types.hpp>
#include <libtorrent/error_code.hpp>
#include <libtorrent/settings_pack.hpp>
#include <libtorrent/sha1_hash.hpp>
#include <libtorrent/torrent_info.hpp>
#include <libtorrent/torrent_status.hpp>
#include <iomanip>
#include <sstream>
#include <vector>

namespace Sluice {

static std::string to_hex_str(const libtorrent::sha1_hash& hash) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned char i : hash) {
        oss << std::setw(2) << static_cast<int>(i);
    }
    return oss.str();
}

TorrentAdapter::TorrentAdapter(const Config::TorrentSettings& settings)
    : settings_(settings) {
    initializeSession();
}

TorrentAdapter::~TorrentAdapter() {
    QWriteLocker locker(&torrentsLock_);
    torrents_.clear();
    session_.reset();
    SLUICE_INFO("Torrent session closed");
}

void TorrentAdapter::initializeSession() {
    try {
        libtorrent::settings_pack pack;
        pack.set_str(libtorrent::settings_pack::user_agent, "Sluice/1.0");
        pack.set_bool(libtorrent::settings_pack::enable_dht, settings_.enableDHT);
        pack.set_bool(libtorrent::settings_pack::enable_lsd, settings_.enableDHT);
        pack.set_int(libtorrent::settings_pack::connections_limit, settings_.maxConnections);
        pack.set_int(libtorrent::settings_pack::upload_rate_limit,
                     settings_.uploadRateLimit > 0 ? settings_.uploadRateLimit * 1024 : 0);
        pack.set_int(libtorrent::settings_pack::download_rate_limit,
                     settings_.downloadRateLimit > 0 ? settings_.downloadRateLimit * 1024 : 0);
        pack.set_int(libtorrent::settings_pack::alert_mask,
                     libtorrent::alert_category::error | libtorrent::alert_category::status);

        session_ = std::make_unique<libtorrent::session>(pack);
        SLUICE_INFO("LibTorrent session initialized, DHT {}", settings_.enableDHT ? "on" : "off");
    } catch (const std::exception& e) {
        SLUICE_ERROR("Failed to initialize session: {}", e.what());
        session_.reset();
    }
}

bool TorrentAdapter::isSessionActive() const {
    return session_ != nullptr;
}

int TorrentAdapter::torrentCount() const {
    QReadLocker locker(&torrentsLock_);
    return static_cast<int>(torrents_.size());
}

Expected<libtorrent::add_torrent_params, EngineError> TorrentAdapter::paramsFor(const TaskSpec& spec) const {
    libtorrent::error_code ec;
    libtorrent::add_torrent_params params;

    if (spec.source.startsWith("magnet:", Qt::CaseInsensitive)) {
        params = libtorrent::parse_magnet_uri(spec.source.toStdString(), ec);
        if (ec) {
            SLUICE_WARN("Failed to parse magnet URI: {}", ec.message());
            return makeUnexpected(EngineError::InvalidSpec);
        }
    } else {
        const QFileInfo file(spec.source);
        if (!file.isFile()) {
            SLUICE_WARN("Torrent source is neither a magnet URI nor a file: {}", spec.source.toStdString());
            return makeUnexpected(EngineError::InvalidSpec);
        }
        auto info = std::make_shared<libtorrent::torrent_info>(file.absoluteFilePath().toStdString(), ec);
        if (ec) {
            SLUICE_WARN("Failed to load torrent file {}: {}", spec.source.toStdString(), ec.message());
            return makeUnexpected(EngineError::InvalidSpec);
        }
        params.ti = info;
    }

    const QString savePath = spec.destination.isEmpty() ? settings_.downloadPath : spec.destination;
    if (!QDir().mkpath(savePath)) {
        SLUICE_WARN("Failed to create save path: {}", savePath.toStdString());
    }
    params.save_path = savePath.toStdString();
    params.flags |= libtorrent::torrent_flags::duplicate_is_error;
    params.flags &= ~libtorrent::torrent_flags::auto_managed;
    params.flags &= ~libtorrent::torrent_flags::paused;
    return params;
}

Expected<EngineHandle, EngineError> TorrentAdapter::start(const TaskSpec& spec) {
    if (!session_) {
        return makeUnexpected(EngineError::Unreachable);
    }

    auto params = paramsFor(spec);
    if (params.hasError()) {
        return makeUnexpected(params.error());
    }

    try {
        libtorrent::error_code ec;
        libtorrent::torrent_handle handle = session_->add_torrent(std::move(params).value(), ec);
        if (ec) {
            SLUICE_ERROR("Failed to add torrent: {}", ec.message());
            return makeUnexpected(mapLibtorrentError(ec));
        }

        const QString infoHash = QString::fromStdString(to_hex_str(handle.info_hashes().get_best()));
        {
            QWriteLocker locker(&torrentsLock_);
            torrents_.insert(infoHash, handle);
        }
        SLUICE_INFO("Torrent added: {} -> {}", spec.name.toStdString(), infoHash.toStdString());
        return infoHash;

    } catch (const std::exception& e) {
        SLUICE_ERROR("Exception adding torrent: {}", e.what());
        return makeUnexpected(EngineError::Internal);
    }
}

Expected<EngineProgress, EngineError> TorrentAdapter::progress(const EngineHandle& handle) {
    libtorrent::torrent_handle torrent;
    {
        QReadLocker locker(&torrentsLock_);
        auto it = torrents_.constFind(handle);
        if (it == torrents_.constEnd()) {
            return makeUnexpected(EngineError::HandleNotFound);
        }
        torrent = it.value();
    }

    drainAlerts();

    try {
        if (!torrent.is_valid()) {
            return makeUnexpected(EngineError::HandleNotFound);
        }
        const libtorrent::torrent_status status = torrent.status();
        if (status.errc) {
            SLUICE_WARN("Torrent {} reports error: {}", handle.toStdString(), status.errc.message());
            return makeUnexpected(mapLibtorrentError(status.errc));
        }

        EngineProgress progress;
        progress.transferredBytes = status.total_wanted_done;
        if (status.has_metadata) {
            progress.sizeBytes = status.total_wanted;
        }
        progress.speedBps = status.download_payload_rate;
        if (progress.sizeBytes && progress.speedBps > 0) {
            progress.etaSeconds = (*progress.sizeBytes - progress.transferredBytes) / progress.speedBps;
        }
        progress.finished = status.is_finished || status.state == libtorrent::torrent_status::seeding;
        return progress;

    } catch (const std::exception& e) {
        SLUICE_ERROR("Exception reading torrent status: {}", e.what());
        return makeUnexpected(EngineError::Internal);
    }
}

Expected<void, EngineError> TorrentAdapter::cancel(const EngineHandle& handle) {
    libtorrent::torrent_handle torrent;
    {
        QWriteLocker locker(&torrentsLock_);
        auto it = torrents_.find(handle);
        if (it == torrents_.end()) {
            return makeUnexpected(EngineError::HandleNotFound);
        }
        torrent = it.value();
        torrents_.erase(it);
    }

    if (!session_) {
        return makeUnexpected(EngineError::Unreachable);
    }

    try {
        session_->remove_torrent(torrent);
        SLUICE_INFO("Torrent removed: {}", handle.toStdString());
        return {};
    } catch (const std::exception& e) {
        SLUICE_ERROR("Exception removing torrent: {}", e.what());
        return makeUnexpected(EngineError::Internal);
    }
}

EngineError TorrentAdapter::mapLibtorrentError(const libtorrent::error_code& ec) const {
    if (ec == libtorrent::errors::invalid_torrent_handle) {
        return EngineError::HandleNotFound;
    } else if (ec == libtorrent::errors::duplicate_torrent) {
        return EngineError::Rejected;
    } else if (ec.category() == libtorrent::system_category()) {
        return EngineError::Unreachable;
    } else {
        return EngineError::Internal;
    }
}

void TorrentAdapter::drainAlerts() {
    if (!session_) {
        return;
    }
    // Alert pointers stay valid only until the next pop_alerts()
    QMutexLocker locker(&alertsMutex_);
    std::vector<libtorrent::alert*> alerts;
    session_->pop_alerts(&alerts);
    for (libtorrent::alert* alert : alerts) {
        if (alert->category() & libtorrent::alert_category::error) {
            SLUICE_WARN("libtorrent: {}", alert->message());
        } else {
            SLUICE_TRACE("libtorrent: {}", alert->message());
        }
    }
}

} // namespace Sluice
