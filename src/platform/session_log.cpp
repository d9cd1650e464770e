#include "platform/session_log.h"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMessageLogContext>
#include <QMutex>
#include <QMutexLocker>
#include <QStandardPaths>
#include <QTextStream>

#include <atomic>
#include <cstdio>
#include <cstdlib>

namespace {
QMutex g_log_mutex;
QString g_log_dir;
QString g_session_log_path;
std::atomic<bool> g_installed = false;

QString level_name(QtMsgType type) {
	switch (type) {
		case QtDebugMsg:
			return "DEBUG";
		case QtInfoMsg:
			return "INFO";
		case QtWarningMsg:
			return "WARN";
		case QtCriticalMsg:
			return "ERROR";
		case QtFatalMsg:
			return "FATAL";
	}
	return "LOG";
}

bool env_flag_set(const char* name) {
	const QString v = qEnvironmentVariable(name).trimmed().toLower();
	return v == "1" || v == "true" || v == "yes" || v == "on";
}

QString resolve_log_dir(const QString& preferred_dir) {
	QString dir = qEnvironmentVariable("MOBYPORT_LOG_DIR").trimmed();
	if (dir.isEmpty()) {
		dir = preferred_dir.trimmed();
	}
	if (dir.isEmpty()) {
		QString base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
		if (base.isEmpty()) {
			base = QCoreApplication::applicationDirPath();
		}
		dir = QDir(base).filePath("logs");
	}
	return QDir::cleanPath(QFileInfo(dir).absoluteFilePath());
}

void append_to_session_log(const QByteArray& bytes) {
	if (g_session_log_path.isEmpty()) {
		return;
	}
	QFile out(g_session_log_path);
	if (!out.open(QIODevice::WriteOnly | QIODevice::Append)) {
		return;
	}
	out.write(bytes);
	out.flush();
}

void message_handler(QtMsgType type, const QMessageLogContext&, const QString& message) {
	static thread_local bool in_handler = false;
	if (in_handler) {
		const QByteArray fallback = message.toLocal8Bit();
		std::fwrite(fallback.constData(), 1, static_cast<size_t>(fallback.size()), stderr);
		std::fwrite("\n", 1, 1, stderr);
		return;
	}
	in_handler = true;

	const QString line = QString("[%1] [%2] %3")
	                       .arg(QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs))
	                       .arg(level_name(type))
	                       .arg(message);
	QByteArray bytes = line.toUtf8();
	bytes.append('\n');

	{
		QMutexLocker lock(&g_log_mutex);
		append_to_session_log(bytes);
	}
	std::fwrite(bytes.constData(), 1, static_cast<size_t>(bytes.size()), stderr);
	std::fflush(stderr);
	if (type == QtFatalMsg) {
		std::abort();
	}
	in_handler = false;
}
}  // namespace

namespace platform {
void install_session_log(const QString& preferred_dir) {
	if (g_installed.exchange(true)) {
		return;
	}
	if (env_flag_set("MOBYPORT_DISABLE_QT_MESSAGE_HOOK")) {
		return;
	}

	g_log_dir = resolve_log_dir(preferred_dir);
	if (QDir().mkpath(g_log_dir)) {
		const QString stamp = QDateTime::currentDateTimeUtc().toString("yyyyMMdd-HHmmss-zzz");
		const qint64 pid = QCoreApplication::applicationPid();
		g_session_log_path = QDir(g_log_dir).filePath(QString("mobyport-session-%1-p%2.log").arg(stamp).arg(pid));

		QMutexLocker lock(&g_log_mutex);
		QFile out(g_session_log_path);
		if (out.open(QIODevice::WriteOnly | QIODevice::Append)) {
			QTextStream ts(&out);
			ts << "mobyport session log\n";
			ts << "Started (UTC): " << QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs) << "\n";
			ts << "PID: " << pid << "\n\n";
		} else {
			g_session_log_path.clear();
		}
	}

	qInstallMessageHandler(message_handler);
	if (g_session_log_path.isEmpty()) {
		qWarning().noquote() << QString("Log: unable to open a session log under %1; logging to stderr only.")
		                          .arg(QDir::toNativeSeparators(g_log_dir));
	}
}

QString session_log_path() {
	return g_session_log_path;
}
}  // namespace platform
