#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QReadWriteLock>
#include <QtCore/QString>
#include <libtorrent/session.hpp>
#include <libtorrent/torrent_handle.hpp>
#include <libtorrent/add_torrent_params.hpp>
#include <libtorrent/magnet_uri.hpp>
#include <memory>
#include "../common/Config.hpp"
#include "../tasks/EngineAdapter.hpp"

namespace Sluice {

/**
 * @brief Engine adapter for BitTorrent downloads over one libtorrent session
 *
 * The task source is a magnet URI or a path to a .torrent file; the
 * handle is the hex info-hash.
 */
class TorrentAdapter : public EngineAdapter {
public:
    explicit TorrentAdapter(const Config::TorrentSettings& settings);
    ~TorrentAdapter() override;

    QString kind() const override { return QStringLiteral("torrent"); }
    Expected<EngineHandle, EngineError> start(const TaskSpec& spec) override;
    Expected<EngineProgress, EngineError> progress(const EngineHandle& handle) override;
    Expected<void, EngineError> cancel(const EngineHandle& handle) override;

    bool isSessionActive() const;
    int torrentCount() const;

private:
    void initializeSession();
    Expected<libtorrent::add_torrent_params, EngineError> paramsFor(const TaskSpec& spec) const;
    EngineError mapLibtorrentError(const libtorrent::error_code& ec) const;
    void drainAlerts();

    Config::TorrentSettings settings_;
    std::unique_ptr<libtorrent::session> session_;
    QMutex alertsMutex_;
    mutable QReadWriteLock torrentsLock_;
    QHash<QString, libtorrent::torrent_handle> torrents_;
};

} // namespace Sluice
