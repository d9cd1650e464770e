#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QTextStream>

#include "cli/cli.h"
#include "config/tool_settings.h"
#include "mobyport_config.h"
#include "platform/session_log.h"

namespace {
void set_app_metadata(QCoreApplication& app) {
  app.setApplicationName("mobyport");
  app.setOrganizationName("mobyport");
  app.setApplicationVersion(MOBYPORT_VERSION);
}
}  // namespace

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  set_app_metadata(app);

  CliOptions options;
  QString output;
  const CliParseResult result = parse_cli(app, options, &output);
  if (result == CliParseResult::ExitOk) {
    if (!output.isEmpty()) {
      QTextStream(stdout) << output;
    }
    return 0;
  }
  if (result == CliParseResult::ExitError) {
    if (!output.isEmpty()) {
      QTextStream(stderr) << output;
    }
    return 1;
  }

  QString settings_error;
  const ToolSettings settings = load_tool_settings(&settings_error);
  platform::install_session_log(settings.log_dir);
  if (!platform::session_log_path().isEmpty()) {
    qInfo().noquote() << QString("Log: %1").arg(QDir::toNativeSeparators(platform::session_log_path()));
  }
  if (!settings_error.isEmpty()) {
    qWarning().noquote() << QString("Settings: %1; using defaults.").arg(settings_error);
  }

  return run_cli(options, settings);
}
