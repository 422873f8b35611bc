#include "app_settings.h"
#include "firmware_catalog.h"
#include "port_registry.h"
#include "session_controller.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>

#include <memory>

namespace {
constexpr auto kBrandOrg = "SignalFlasher";
constexpr auto kBrandApp = "Signal Flasher";

constexpr int kExitOk = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

QtMessageHandler g_prevMessageHandler = nullptr;
bool g_verbose = false;

void flasherMessageHandler(QtMsgType type,
                           const QMessageLogContext& context,
                           const QString& msg) {
  // Operation output already goes to stdout; keep stderr for problems.
  if (!g_verbose && (type == QtInfoMsg || type == QtDebugMsg)) {
    return;
  }
  if (g_prevMessageHandler) {
    g_prevMessageHandler(type, context, msg);
  }
}

QTextStream& out() {
  static QTextStream stream(stdout);
  return stream;
}

QTextStream& err() {
  static QTextStream stream(stderr);
  return stream;
}

void printPorts(const QVector<SerialPortInfo>& ports) {
  if (ports.isEmpty()) {
    out() << "No serial ports found." << Qt::endl;
    return;
  }
  for (const SerialPortInfo& port : ports) {
    out() << port.displayName() << Qt::endl;
  }
}

int listVersions(const QString& root) {
  const QVector<FirmwareVersion> versions = FirmwareCatalog::listVersions(root);
  if (versions.isEmpty()) {
    out() << "No firmware versions in " << root << Qt::endl;
    return kExitOk;
  }
  for (const FirmwareVersion& v : versions) {
    const FirmwareFileSet files = FirmwareCatalog::resolveFiles(v);
    if (files.isComplete()) {
      out() << v.name << "\tflashable" << Qt::endl;
    } else {
      out() << v.name << "\tmissing: "
            << FirmwareCatalog::roleNames(files.missingRoles()).join(", ") << Qt::endl;
    }
  }
  return kExitOk;
}

QString firstDetectedPort() {
  PortMonitor monitor(std::make_unique<SystemPortEnumerator>());
  const QVector<SerialPortInfo> ports = monitor.poll();
  return ports.isEmpty() ? QString{} : ports.front().deviceId;
}
}  // namespace

int main(int argc, char* argv[]) {
  g_prevMessageHandler = qInstallMessageHandler(flasherMessageHandler);
  qSetMessagePattern(QStringLiteral("%{category}: %{message}"));

  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName(kBrandApp);
  QCoreApplication::setOrganizationName(kBrandOrg);
  QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

  QCommandLineParser parser;
  parser.setApplicationDescription(
      QStringLiteral("Flashes signal processor firmware and sets the device name and ID."));
  parser.addHelpOption();
  parser.addVersionOption();
  parser.addPositionalArgument(
      "command", "One of: ports, versions, flash, configure, watch.", "<command>");

  QCommandLineOption firmwareDirOption("firmware-dir", "Firmware root directory.", "dir");
  QCommandLineOption esptoolOption("esptool", "Path to the esptool executable.", "path");
  QCommandLineOption portOption("port", "Serial port of the device.", "port");
  QCommandLineOption firmwareOption("firmware", "Firmware version folder name.", "version");
  QCommandLineOption chipOption("chip", "Target chip family passed to esptool.", "chip");
  QCommandLineOption baudOption("baud", "Baud rate for esptool.", "rate");
  QCommandLineOption nameOption("name", "Signal name to store on the device.", "name");
  QCommandLineOption idOption("id", "Signal ID (up to 3 digits).", "id");
  QCommandLineOption saveOption("save", "Remember the given directories and tool path.");
  QCommandLineOption verboseOption("verbose", "Print debug logging.");
  parser.addOption(firmwareDirOption);
  parser.addOption(esptoolOption);
  parser.addOption(portOption);
  parser.addOption(firmwareOption);
  parser.addOption(chipOption);
  parser.addOption(baudOption);
  parser.addOption(nameOption);
  parser.addOption(idOption);
  parser.addOption(saveOption);
  parser.addOption(verboseOption);

  parser.process(app);

  g_verbose = parser.isSet(verboseOption);
  QLoggingCategory::setFilterRules(g_verbose
                                       ? QStringLiteral("flasher.*.debug=true")
                                       : QStringLiteral("flasher.*.debug=false"));

  const QStringList positional = parser.positionalArguments();
  if (positional.size() != 1) {
    err() << parser.helpText();
    return kExitUsage;
  }
  const QString command = positional.front();

  AppSettings::Settings settings = AppSettings::load();
  if (parser.isSet(firmwareDirOption)) {
    settings.firmwareDir = parser.value(firmwareDirOption);
  }
  if (parser.isSet(esptoolOption)) {
    settings.esptoolPath = parser.value(esptoolOption);
  }
  if (parser.isSet(chipOption)) {
    settings.chip = parser.value(chipOption);
  }
  if (parser.isSet(baudOption)) {
    bool ok = false;
    const int baud = parser.value(baudOption).toInt(&ok);
    if (!ok || baud <= 0) {
      err() << "Invalid baud rate: " << parser.value(baudOption) << Qt::endl;
      return kExitUsage;
    }
    settings.baudRate = baud;
  }
  if (parser.isSet(saveOption)) {
    AppSettings::save(settings);
  }

  if (command == QStringLiteral("ports")) {
    PortMonitor monitor(std::make_unique<SystemPortEnumerator>());
    printPorts(monitor.poll());
    return kExitOk;
  }
  if (command == QStringLiteral("versions")) {
    return listVersions(settings.firmwareDir);
  }

  const bool isFlash = command == QStringLiteral("flash");
  const bool isConfigure = command == QStringLiteral("configure");
  const bool isWatch = command == QStringLiteral("watch");
  if (!isFlash && !isConfigure && !isWatch) {
    err() << "Unknown command: " << command << Qt::endl;
    return kExitUsage;
  }

  SessionController::Options options;
  options.firmwareRoot = settings.firmwareDir;
  options.toolPath = settings.esptoolPath;
  options.chip = settings.chip;
  options.baudRate = settings.baudRate;
  SessionController session(options, std::make_unique<SystemPortEnumerator>());

  QObject::connect(&session, &SessionController::operationOutput, &app,
                   [](const QString& line) { out() << line << Qt::endl; });
  QObject::connect(&session, &SessionController::statusChanged, &app,
                   [](const QString& status) { err() << status << Qt::endl; });
  QObject::connect(&session, &SessionController::validationError, &app,
                   [](const QString& message) {
                     err() << "Error: " << message << Qt::endl;
                     QCoreApplication::exit(kExitUsage);
                   });

  if (isWatch) {
    QObject::connect(&session, &SessionController::portsChanged, &app,
                     [](const QVector<SerialPortInfo>& ports) {
                       out() << "-- ports changed --" << Qt::endl;
                       printPorts(ports);
                     });
    session.start();
    return app.exec();
  }

  QString port = parser.value(portOption);
  if (port.isEmpty()) {
    port = settings.lastPort;
  }
  if (port.isEmpty()) {
    port = firstDetectedPort();
  }
  if (port.isEmpty()) {
    err() << "Error: no serial port given and none detected." << Qt::endl;
    return kExitUsage;
  }

  // The tool can fail to start before the event loop runs; remember the result.
  int finishedWith = -1;
  QObject::connect(&session, &SessionController::operationFinished, &app,
                   [&finishedWith](int exitStatus) {
                     finishedWith = exitStatus == 0 ? kExitOk : kExitFailed;
                     QCoreApplication::exit(finishedWith);
                   });

  session.start();
  session.selectPort(port);

  if (isFlash) {
    QString version = parser.value(firmwareOption);
    if (version.isEmpty()) {
      version = settings.lastVersion;
    }
    if (!version.isEmpty() && !session.selectVersion(version)) {
      err() << "Error: unknown firmware version " << version << Qt::endl;
      return kExitUsage;
    }
    if (!session.startFlash()) {
      return kExitUsage;
    }
  } else {
    if (!parser.isSet(nameOption) || !parser.isSet(idOption)) {
      err() << "Error: configure needs --name and --id." << Qt::endl;
      return kExitUsage;
    }
    if (!session.startConfigure(parser.value(nameOption), parser.value(idOption))) {
      return kExitUsage;
    }
  }

  AppSettings::saveSelection(session.currentPort(), session.currentVersion());
  if (finishedWith >= 0) {
    return finishedWith;
  }
  return app.exec();
}
