#include "common/autostart.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTextStream>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace bluemeter {

namespace {

QString executablePath()
{
    if (QCoreApplication::instance()) {
        return QCoreApplication::applicationFilePath();
    }
    return QStringLiteral("bluemeter-tray");
}

QString execLineFor(const QString &binary)
{
    return QStringLiteral("Exec=") + binary;
}

} // namespace

QString autostartEntryPath()
{
    QString base = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (base.isEmpty()) {
        const QString home = qEnvironmentVariable("HOME");
        base = home.isEmpty() ? QStringLiteral(".config")
                              : home + QStringLiteral("/.config");
    }
    return base + QStringLiteral("/autostart/bluemeter.desktop");
}

bool isAutostartEnabled()
{
    QFile file(autostartEntryPath());
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return false;
    }

    const QString expected = execLineFor(executablePath());
    QTextStream in(&file);
    while (!in.atEnd()) {
        if (in.readLine().trimmed() == expected) {
            return true;
        }
    }
    return false;
}

bool setAutostartEnabled(bool enabled)
{
    const QString path = autostartEntryPath();
    BMLOG_INFO(QStringLiteral("Autostart"),
               QStringLiteral("setAutostartEnabled"),
               enabled ? QStringLiteral("autostart_enable") : QStringLiteral("autostart_disable"),
               QStringLiteral("user_action"),
               QStringLiteral("xdg_autostart"),
               logging::defaultWho(),
               QString(),
               nlohmann::json{{"path", path.toStdString()}});

    if (!enabled) {
        if (!QFileInfo::exists(path)) {
            return true;
        }
        return QFile::remove(path);
    }

    QDir().mkpath(QFileInfo(path).absolutePath());
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        BMLOG_WARN(QStringLiteral("Autostart"),
                   QStringLiteral("setAutostartEnabled"),
                   QStringLiteral("autostart_write_failed"),
                   QStringLiteral("open_failed"),
                   QStringLiteral("qsavefile"),
                   logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", file.errorString().toStdString()}});
        return false;
    }

    QTextStream out(&file);
    out << "[Desktop Entry]\n"
        << "Type=Application\n"
        << "Name=BlueMeter\n"
        << "Comment=Bluetooth battery monitor\n"
        << execLineFor(executablePath()) << "\n"
        << "Icon=bluetooth\n"
        << "X-GNOME-Autostart-enabled=true\n";
    out.flush();
    return file.commit();
}

} // namespace bluemeter
