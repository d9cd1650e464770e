#pragma once

#include <QString>

namespace platform {
// Routes Qt messages to stderr and a per-session log file as "[UTC] [LEVEL] message".
// Directory: MOBYPORT_LOG_DIR, else |preferred_dir|, else the app-local data location.
// MOBYPORT_DISABLE_QT_MESSAGE_HOOK=1 keeps Qt's default handler. Safe to call twice.
void install_session_log(const QString& preferred_dir = {});

QString session_log_path();
}  // namespace platform
