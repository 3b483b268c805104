#include "daemon/probes.hpp"

#include <QProcess>
#include <QStringList>

#include "common/models.hpp"

namespace timekeep {

namespace {

constexpr int kProbeTimeoutMs = 1000;

// Runs a probe helper and returns its trimmed stdout, or the failure reason.
ProbeResult<QString> runProbeCommand(const QString &program, const QStringList &args)
{
    QProcess process;
    process.start(program, args);

    if (!process.waitForStarted(kProbeTimeoutMs)) {
        return ProbeResult<QString>::unavailable(
            program.toStdString() + " could not be started");
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(kProbeTimeoutMs)) {
        process.kill();
        process.waitForFinished(kProbeTimeoutMs);
        return ProbeResult<QString>::unavailable(program.toStdString() + " timed out");
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        return ProbeResult<QString>::unavailable(
            program.toStdString() + " exited with code "
            + std::to_string(process.exitCode()));
    }

    return ProbeResult<QString>::known(
        QString::fromUtf8(process.readAllStandardOutput()).trimmed());
}

} // namespace

ProbeResult<std::string> XdotoolWindowProbe::activeWindow()
{
    const auto output = runProbeCommand(QStringLiteral("xdotool"),
                                        {QStringLiteral("getactivewindow"),
                                         QStringLiteral("getwindowname")});
    if (!output.isKnown()) {
        return ProbeResult<std::string>::unavailable(output.reason());
    }

    const std::string title = output.value().toStdString();
    if (title.empty() || title == kUnknownApp) {
        return ProbeResult<std::string>::unavailable("no foreground window");
    }
    return ProbeResult<std::string>::known(title);
}

ProbeResult<double> XprintidleProbe::idleSeconds()
{
    const auto output = runProbeCommand(QStringLiteral("xprintidle"), {});
    if (!output.isKnown()) {
        return ProbeResult<double>::unavailable(output.reason());
    }

    bool ok = false;
    const qulonglong millis = output.value().toULongLong(&ok);
    if (!ok) {
        return ProbeResult<double>::unavailable("xprintidle printed a non-number");
    }
    return ProbeResult<double>::known(static_cast<double>(millis) / 1000.0);
}

} // namespace timekeep
