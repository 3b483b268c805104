#include "daemon/notifier.hpp"

#include <QDebug>
#include <QProcess>
#include <QStringList>

#include "common/logging.hpp"
#include "daemon/config_store.hpp"

namespace timekeep {

DesktopNotifier::DesktopNotifier(const ConfigStore &config)
    : m_config(config)
{
}

void DesktopNotifier::notify(const std::string &title, const std::string &message)
{
    if (!m_config.config().notificationsEnabled) {
        return;
    }

    const bool started = QProcess::startDetached(
        QStringLiteral("notify-send"),
        {QStringLiteral("--app-name=Timekeep"),
         QString::fromStdString(title),
         QString::fromStdString(message)});

    if (!started) {
        // Fall back to the console so the message is not lost entirely.
        qInfo().noquote() << QString::fromStdString(title) << ":"
                          << QString::fromStdString(message);
        TKLOG_DEBUG(QStringLiteral("DesktopNotifier"),
                    QStringLiteral("notify"),
                    QStringLiteral("notification_failed"),
                    QStringLiteral("notify_send_unavailable"),
                    QStringLiteral("qprocess"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"title", title}}));
    }
}

} // namespace timekeep
