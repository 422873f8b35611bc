#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "fake_serial_device.h"
#include "flash_orchestrator.h"
#include "scripted_port_enumerator.h"
#include "session_controller.h"

class TestSessionController final : public QObject {
  Q_OBJECT

 private slots:
  void startSelectsFirstVersionAndPort();
  void flashRequiresPortAndVersion();
  void flashRejectsIncompleteVersion();
  void flashRunsToolAndRefreshes();
  void flashFailureReportsExitStatus();
  void secondOperationIsRejectedWhileFlashing();
  void portSelectionFollowsRegistry();
  void selectVersionRescansRoot();
  void configureRejectsInvalidId();
  void configureSucceedsOverSerial();
  void configureUsesSessionBaudForChipId();
  void configureChipIdFailureKeepsSelection();
  void configureOpenFailureIsTransportError();
  void stopDuringConfigureSkipsChipId();
};

namespace {
const SerialPortInfo kPortA = makePort("/dev/ttyUSB0", "CP2102 USB to UART");
const SerialPortInfo kPortB = makePort("/dev/ttyUSB1", "CH340");
const SerialPortInfo kPortC = makePort("/dev/ttyUSB2", "FT232R");

bool makeExecutable(const QString& path) {
  QFile f(path);
  QFile::Permissions p = f.permissions();
  p |= QFile::ExeOwner | QFile::ExeGroup | QFile::ExeOther;
  return f.setPermissions(p);
}

QString writeFakeTool(const QString& dir, int exitCode, const QByteArray& body = {}) {
  const QString script = QDir(dir).filePath(QString("fake-esptool-%1.sh").arg(exitCode));
  QFile f(script);
  if (!f.open(QIODevice::WriteOnly | QIODevice::Text)) {
    return {};
  }
  f.write("#!/usr/bin/env bash\n");
  f.write("echo \"$@\"\n");
  f.write(body);
  f.write(QString("exit %1\n").arg(exitCode).toUtf8());
  f.close();
  if (!makeExecutable(script)) {
    return {};
  }
  return script;
}

bool writeVersion(const QString& root, const QString& name, const QStringList& files) {
  if (!QDir(root).mkpath(name)) {
    return false;
  }
  for (const QString& file : files) {
    QFile f(QDir(root).filePath(name + "/" + file));
    if (!f.open(QIODevice::WriteOnly)) {
      return false;
    }
    f.write("bin");
  }
  return true;
}

const QStringList kCompleteSet = {"bootloader.bin", "partitions.bin", "boot_app0.bin",
                                  "firmware.bin"};

// Firmware root with a flashable v1 and an application-only v2, plus a tool
// directory kept apart from the root.
struct Fixture final {
  QTemporaryDir root;
  QTemporaryDir tools;
  std::shared_ptr<ScriptedPortEnumerator::Script> ports =
      std::make_shared<ScriptedPortEnumerator::Script>();

  bool init() {
    return root.isValid() && tools.isValid() && writeVersion(root.path(), "v1", kCompleteSet) &&
           writeVersion(root.path(), "v2", {"firmware.bin"});
  }

  SessionController::Options options(const QString& tool) const {
    SessionController::Options o;
    o.firmwareRoot = root.path();
    o.toolPath = tool;
    o.pollIntervalMs = 20;
    return o;
  }

  std::unique_ptr<PortEnumerator> enumerator() const {
    return std::make_unique<ScriptedPortEnumerator>(ports);
  }
};
}  // namespace

void TestSessionController::startSelectsFirstVersionAndPort() {
  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{kPortA, kPortB});

  SessionController session(fx.options("/bin/true"), fx.enumerator());
  QSignalSpy portsSpy(&session, &SessionController::portsChanged);
  session.start();

  QCOMPARE(session.versions().size(), 2);
  QCOMPARE(session.currentVersion(), QStringLiteral("v1"));
  QVERIFY(session.currentFiles().isComplete());

  QVERIFY(portsSpy.wait(2000));
  QCOMPARE(session.ports().size(), 2);
  QCOMPARE(session.currentPort(), kPortA.deviceId);
}

void TestSessionController::flashRequiresPortAndVersion() {
  QTemporaryDir emptyRoot;
  QVERIFY(emptyRoot.isValid());
  SessionController::Options options;
  options.firmwareRoot = emptyRoot.path();
  options.toolPath = "/bin/true";

  auto script = std::make_shared<ScriptedPortEnumerator::Script>();
  SessionController session(options, std::make_unique<ScriptedPortEnumerator>(script));
  QSignalSpy errorSpy(&session, &SessionController::validationError);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);
  session.start();

  QVERIFY(!session.startFlash());
  QCOMPARE(errorSpy.count(), 1);
  QCOMPARE(errorSpy.at(0).at(0).toString(),
           QStringLiteral("A COM port and firmware version must be selected."));

  session.selectPort(kPortA.displayName());
  QCOMPARE(session.currentPort(), kPortA.deviceId);
  QVERIFY(!session.startFlash());
  QCOMPARE(errorSpy.count(), 2);
  QCOMPARE(errorSpy.at(1).at(0).toString(), QStringLiteral("Please select a firmware version."));

  QVERIFY(!session.isBusy());
  QCOMPARE(finishedSpy.count(), 0);
}

void TestSessionController::flashRejectsIncompleteVersion() {
  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{kPortA});

  SessionController session(fx.options("/bin/true"), fx.enumerator());
  QSignalSpy errorSpy(&session, &SessionController::validationError);
  QSignalSpy clearedSpy(&session, &SessionController::outputCleared);
  session.start();
  session.selectPort(kPortA.deviceId);
  QVERIFY(session.selectVersion("v2"));
  QVERIFY(!session.currentFiles().isComplete());

  QVERIFY(!session.startFlash());
  QCOMPARE(errorSpy.count(), 1);
  QCOMPARE(errorSpy.at(0).at(0).toString(),
           QStringLiteral("Missing required files in v2 folder: bootloader, partition_table, "
                          "ota_selector"));
  QCOMPARE(clearedSpy.count(), 0);
  QVERIFY(!session.isBusy());
}

void TestSessionController::flashRunsToolAndRefreshes() {
#if defined(Q_OS_WIN)
  QSKIP("Uses a bash script as the flashing tool");
#endif
  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{kPortA});
  const QString tool = writeFakeTool(fx.tools.path(), 0, "sleep 0.2\necho 'Leaving...'\n");
  QVERIFY(!tool.isEmpty());

  // Only the initial poll and the post-operation refresh query the ports.
  SessionController::Options options = fx.options(tool);
  options.pollIntervalMs = 60000;
  SessionController session(options, fx.enumerator());
  session.start();
  session.selectPort(kPortA.deviceId);
  QCOMPARE(session.currentVersion(), QStringLiteral("v1"));
  QTRY_VERIFY(fx.ports->callCount() >= 1);
  const int pollsBefore = fx.ports->callCount();

  QStringList output;
  QStringList statuses;
  connect(&session, &SessionController::operationOutput, this,
          [&output](const QString& line) { output << line; });
  connect(&session, &SessionController::statusChanged, this,
          [&statuses](const QString& status) { statuses << status; });
  QSignalSpy clearedSpy(&session, &SessionController::outputCleared);
  QSignalSpy busySpy(&session, &SessionController::busyChanged);
  QSignalSpy versionsSpy(&session, &SessionController::versionsChanged);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);
  QSignalSpy resultSpy(&session, &SessionController::operationResult);

  QVERIFY(session.startFlash());
  QVERIFY(session.isBusy());
  QVERIFY(session.currentOperation() == SessionController::Operation::Flash);
  QCOMPARE(clearedSpy.count(), 1);
  QCOMPARE(statuses.back(), QStringLiteral("Flashing in progress..."));

  // Appears while the tool runs; only the post-operation refresh picks it up.
  QVERIFY(writeVersion(fx.root.path(), "v3", kCompleteSet));

  QVERIFY(finishedSpy.wait(5000));
  QCOMPARE(finishedSpy.at(0).at(0).toInt(), 0);
  QVERIFY(qvariant_cast<OperationResult>(resultSpy.at(0).at(0)).ok());
  QVERIFY(!session.isBusy());
  QVERIFY(statuses.contains("Flashing completed successfully!"));

  QCOMPARE(busySpy.count(), 2);
  QCOMPARE(busySpy.at(0).at(0).toBool(), true);
  QCOMPARE(busySpy.at(1).at(0).toBool(), false);

  QVERIFY(versionsSpy.count() >= 1);
  QCOMPARE(session.versions().size(), 3);
  QCOMPARE(session.currentVersion(), QStringLiteral("v1"));
  QTRY_VERIFY(fx.ports->callCount() > pollsBefore);

  const QString log = output.join('\n');
  QVERIFY(log.contains("write_flash"));
  QVERIFY(log.contains("0x10000 " + QDir(fx.root.path()).filePath("v1/firmware.bin")));
  QVERIFY(log.contains("Leaving..."));
}

void TestSessionController::flashFailureReportsExitStatus() {
#if defined(Q_OS_WIN)
  QSKIP("Uses a bash script as the flashing tool");
#endif
  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{kPortA});
  const QString tool =
      writeFakeTool(fx.tools.path(), 4, "echo 'A fatal error occurred: Failed to connect'\n");
  QVERIFY(!tool.isEmpty());

  SessionController session(fx.options(tool), fx.enumerator());
  session.start();
  session.selectPort(kPortA.deviceId);

  QSignalSpy statusSpy(&session, &SessionController::statusChanged);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);
  QSignalSpy resultSpy(&session, &SessionController::operationResult);

  QVERIFY(session.startFlash());
  QVERIFY(finishedSpy.wait(5000));
  QCOMPARE(finishedSpy.at(0).at(0).toInt(), 4);

  const OperationResult result = qvariant_cast<OperationResult>(resultSpy.at(0).at(0));
  QVERIFY(result.kind == OperationResult::Kind::ExternalTool);
  QCOMPARE(result.exitCode, 4);
  QCOMPARE(statusSpy.back().at(0).toString(), QStringLiteral("Flashing failed!"));
  QVERIFY(!session.isBusy());
}

void TestSessionController::secondOperationIsRejectedWhileFlashing() {
#if defined(Q_OS_WIN)
  QSKIP("Uses a bash script as the flashing tool");
#endif
  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{kPortA});
  const QString tool = writeFakeTool(fx.tools.path(), 0, "sleep 1\n");
  QVERIFY(!tool.isEmpty());

  SessionController session(fx.options(tool), fx.enumerator());
  session.start();
  session.selectPort(kPortA.deviceId);

  QSignalSpy errorSpy(&session, &SessionController::validationError);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);

  QVERIFY(session.startFlash());
  QVERIFY(!session.startFlash());
  QVERIFY(!session.startConfigure("Sensor-A", "7"));
  QCOMPARE(errorSpy.count(), 2);
  QCOMPARE(errorSpy.at(0).at(0).toString(), QStringLiteral("An operation is already running."));
  QVERIFY(session.isBusy());

  QVERIFY(finishedSpy.wait(5000));
  QCOMPARE(finishedSpy.count(), 1);
  QCOMPARE(finishedSpy.at(0).at(0).toInt(), 0);
}

void TestSessionController::portSelectionFollowsRegistry() {
  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{kPortA, kPortB});

  SessionController session(fx.options("/bin/true"), fx.enumerator());
  QSignalSpy portsSpy(&session, &SessionController::portsChanged);
  session.start();
  QVERIFY(portsSpy.wait(2000));
  QCOMPARE(session.currentPort(), kPortA.deviceId);

  session.selectPort(kPortB.displayName());
  QCOMPARE(session.currentPort(), kPortB.deviceId);

  fx.ports->replace({kPortA, kPortB, kPortC});
  QVERIFY(portsSpy.wait(2000));
  QCOMPARE(session.ports().size(), 3);
  QCOMPARE(session.currentPort(), kPortB.deviceId);

  // The selected port went away: fall back to the first one listed.
  fx.ports->replace({kPortA});
  QVERIFY(portsSpy.wait(2000));
  QCOMPARE(session.currentPort(), kPortA.deviceId);

  fx.ports->replace({});
  QVERIFY(portsSpy.wait(2000));
  QVERIFY(session.currentPort().isEmpty());
}

void TestSessionController::selectVersionRescansRoot() {
  Fixture fx;
  QVERIFY(fx.init());

  SessionController session(fx.options("/bin/true"), fx.enumerator());
  session.start();
  QCOMPARE(session.versions().size(), 2);

  QVERIFY(writeVersion(fx.root.path(), "v9", kCompleteSet));
  QVERIFY(session.selectVersion("v9"));
  QCOMPARE(session.currentVersion(), QStringLiteral("v9"));
  QVERIFY(session.currentFiles().isComplete());

  QVERIFY(!session.selectVersion("missing"));
  QCOMPARE(session.currentVersion(), QStringLiteral("v9"));
}

void TestSessionController::configureRejectsInvalidId() {
  Fixture fx;
  QVERIFY(fx.init());

  SessionController session(fx.options("/bin/true"), fx.enumerator());
  session.start();
  QSignalSpy errorSpy(&session, &SessionController::validationError);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);

  QVERIFY(!session.startConfigure("Sensor-A", "7"));
  QCOMPARE(errorSpy.at(0).at(0).toString(), QStringLiteral("Please select a COM port."));

  session.selectPort(kPortA.deviceId);
  QVERIFY(!session.startConfigure("Sensor-A", "1234"));
  QVERIFY(!session.startConfigure("", "7"));
  QCOMPARE(errorSpy.count(), 3);
  QCOMPARE(finishedSpy.count(), 0);
  QVERIFY(!session.isBusy());
}

void TestSessionController::configureSucceedsOverSerial() {
#if !defined(Q_OS_UNIX)
  QSKIP("Needs a pseudo-terminal");
#else
  FakeSerialDevice device;
  QVERIFY(device.isValid());

  Fixture fx;
  QVERIFY(fx.init());
  const SerialPortInfo devicePort = makePort(device.portPath(), "USB JTAG/serial debug unit");
  fx.ports->push(QVector<SerialPortInfo>{devicePort});
  const QString tool = writeFakeTool(fx.tools.path(), 0, "echo 'Chip ID: 0x00000000'\n");
  QVERIFY(!tool.isEmpty());

  SessionController session(fx.options(tool), fx.enumerator());
  QSignalSpy portsSpy(&session, &SessionController::portsChanged);
  session.start();
  QVERIFY(portsSpy.wait(2000));
  QCOMPARE(session.currentPort(), device.portPath());

  QStringList output;
  connect(&session, &SessionController::operationOutput, this,
          [&output](const QString& line) { output << line; });
  QSignalSpy statusSpy(&session, &SessionController::statusChanged);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);

  QVERIFY(session.startConfigure("Sensor-A", "7"));
  QVERIFY(session.currentOperation() == SessionController::Operation::Configure);
  QVERIFY(finishedSpy.wait(10000));
  QCOMPARE(finishedSpy.at(0).at(0).toInt(), 0);
  QCOMPARE(statusSpy.back().at(0).toString(), QStringLiteral("Name and ID set successfully!"));

  const QStringList expectedSent = {"signal_id:7", "signal_name:Sensor-A"};
  QCOMPARE(device.receivedLines(), expectedSent);
  QVERIFY(output.contains("Sending: signal_id:7"));
  QVERIFY(output.join('\n').contains("chip-id"));
#endif
}

void TestSessionController::configureUsesSessionBaudForChipId() {
#if !defined(Q_OS_UNIX)
  QSKIP("Needs a pseudo-terminal");
#else
  FakeSerialDevice device;
  QVERIFY(device.isValid());

  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{makePort(device.portPath(), "USB JTAG/serial debug unit")});
  const QString tool = writeFakeTool(fx.tools.path(), 0);
  QVERIFY(!tool.isEmpty());

  SessionController::Options options = fx.options(tool);
  options.baudRate = 460800;
  SessionController session(options, fx.enumerator());
  session.start();
  session.selectPort(device.portPath());

  QStringList output;
  connect(&session, &SessionController::operationOutput, this,
          [&output](const QString& line) { output << line; });
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);

  QVERIFY(session.startConfigure("Sensor-A", "7"));
  QVERIFY(finishedSpy.wait(10000));
  QCOMPARE(finishedSpy.at(0).at(0).toInt(), 0);

  const QString log = output.join('\n');
  QVERIFY(log.contains("chip-id"));
  QVERIFY(log.contains("--baud 460800"));
#endif
}

void TestSessionController::configureChipIdFailureKeepsSelection() {
#if !defined(Q_OS_UNIX)
  QSKIP("Needs a pseudo-terminal");
#else
  FakeSerialDevice device;
  QVERIFY(device.isValid());

  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{makePort(device.portPath(), "USB JTAG/serial debug unit")});
  const QString tool =
      writeFakeTool(fx.tools.path(), 2, "echo 'A fatal error occurred: No serial data received.'\n");
  QVERIFY(!tool.isEmpty());

  SessionController session(fx.options(tool), fx.enumerator());
  session.start();
  session.selectPort(device.portPath());
  QCOMPARE(session.currentVersion(), QStringLiteral("v1"));

  QSignalSpy busySpy(&session, &SessionController::busyChanged);
  QSignalSpy statusSpy(&session, &SessionController::statusChanged);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);
  QSignalSpy resultSpy(&session, &SessionController::operationResult);

  QVERIFY(session.startConfigure("Sensor-A", "7"));
  QVERIFY(finishedSpy.wait(10000));
  QCOMPARE(finishedSpy.count(), 1);
  QCOMPARE(finishedSpy.at(0).at(0).toInt(), 2);

  const OperationResult result = qvariant_cast<OperationResult>(resultSpy.at(0).at(0));
  QVERIFY(result.kind == OperationResult::Kind::ExternalTool);
  QCOMPARE(result.exitCode, 2);
  QCOMPARE(statusSpy.back().at(0).toString(),
           QStringLiteral("Failed to reset device after configuration."));

  QCOMPARE(busySpy.back().at(0).toBool(), false);
  QVERIFY(!session.isBusy());
  QCOMPARE(session.currentPort(), device.portPath());
  QCOMPARE(session.currentVersion(), QStringLiteral("v1"));
#endif
}

void TestSessionController::configureOpenFailureIsTransportError() {
#if defined(Q_OS_WIN)
  const QString invalidPath = "COM0";
#else
  const QString invalidPath = "/dev/does-not-exist";
#endif
  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{makePort(invalidPath, "Unplugged adapter")});

  SessionController session(fx.options("/bin/true"), fx.enumerator());
  QSignalSpy portsSpy(&session, &SessionController::portsChanged);
  session.start();
  QVERIFY(portsSpy.wait(2000));
  QCOMPARE(session.currentPort(), invalidPath);

  QSignalSpy busySpy(&session, &SessionController::busyChanged);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);
  QSignalSpy resultSpy(&session, &SessionController::operationResult);

  QVERIFY(session.startConfigure("Sensor-A", "7"));
  QVERIFY(finishedSpy.wait(5000));
  QCOMPARE(finishedSpy.at(0).at(0).toInt(), 1);

  const OperationResult result = qvariant_cast<OperationResult>(resultSpy.at(0).at(0));
  QVERIFY(result.kind == OperationResult::Kind::Transport);
  QVERIFY(result.message.startsWith("Failed to configure device: "));

  QCOMPARE(busySpy.back().at(0).toBool(), false);
  QVERIFY(!session.isBusy());
  QCOMPARE(session.currentPort(), invalidPath);
  QCOMPARE(session.currentVersion(), QStringLiteral("v1"));
}

void TestSessionController::stopDuringConfigureSkipsChipId() {
#if !defined(Q_OS_UNIX)
  QSKIP("Needs a pseudo-terminal");
#else
  FakeSerialDevice device;
  QVERIFY(device.isValid());

  Fixture fx;
  QVERIFY(fx.init());
  fx.ports->push(QVector<SerialPortInfo>{makePort(device.portPath(), "USB JTAG/serial debug unit")});
  const QString tool = writeFakeTool(fx.tools.path(), 0);
  QVERIFY(!tool.isEmpty());

  SessionController session(fx.options(tool), fx.enumerator());
  session.start();
  session.selectPort(device.portPath());

  QStringList output;
  QStringList statuses;
  connect(&session, &SessionController::operationOutput, this,
          [&output](const QString& line) { output << line; });
  connect(&session, &SessionController::statusChanged, this,
          [&statuses](const QString& status) { statuses << status; });
  QSignalSpy jobSpy(session.orchestrator(), &FlashOrchestrator::jobStarted);
  QSignalSpy finishedSpy(&session, &SessionController::operationFinished);
  QSignalSpy resultSpy(&session, &SessionController::operationResult);

  QVERIFY(session.startConfigure("Sensor-A", "7"));
  // The exchange result is delivered through the event loop, so the stop
  // lands before the chip-id check could start.
  session.requestStop();
  QCOMPARE(statuses.back(),
           QStringLiteral("Stop requested; the serial exchange will finish, but the chip-id check "
                          "will be skipped."));
  QVERIFY(session.isBusy());

  QVERIFY(finishedSpy.wait(10000));
  QCOMPARE(finishedSpy.at(0).at(0).toInt(), 1);
  const OperationResult result = qvariant_cast<OperationResult>(resultSpy.at(0).at(0));
  QVERIFY(result.kind == OperationResult::Kind::Stopped);
  QCOMPARE(statuses.back(), QStringLiteral("Stopped before the chip-id check."));
  QVERIFY(!session.isBusy());

  const QStringList expectedSent = {"signal_id:7", "signal_name:Sensor-A"};
  QCOMPARE(device.receivedLines(), expectedSent);
  QCOMPARE(jobSpy.count(), 0);
  QVERIFY(!output.join('\n').contains("chip-id"));
#endif
}

int main(int argc, char** argv) {
  QCoreApplication app(argc, argv);
  TestSessionController tc;
  return QTest::qExec(&tc, argc, argv);
}

#include "test_session_controller.moc"
