#include <QtTest/QtTest>

#include <QCoreApplication>
#include <QSettings>
#include <QStandardPaths>

#include "app_settings.h"
#include "firmware_catalog.h"

class TestAppSettings final : public QObject {
  Q_OBJECT

 private slots:
  void init();
  void loadsDefaultsWhenEmpty();
  void savedValuesRoundTrip();
  void emptyToolPathRemovesKey();
  void invalidBaudRateFallsBack();
  void saveSelectionKeepsPreferences();
};

void TestAppSettings::init() {
  QSettings settings;
  settings.clear();
}

void TestAppSettings::loadsDefaultsWhenEmpty() {
  const AppSettings::Settings s = AppSettings::load();
  QCOMPARE(s.firmwareDir, FirmwareCatalog::defaultRootDir());
  QCOMPARE(s.chip, QStringLiteral("esp32s3"));
  QCOMPARE(s.baudRate, 115200);
  QVERIFY(s.esptoolPath.isEmpty());
  QVERIFY(s.lastPort.isEmpty());
  QVERIFY(s.lastVersion.isEmpty());
}

void TestAppSettings::savedValuesRoundTrip() {
  AppSettings::Settings in = AppSettings::defaults();
  in.firmwareDir = "/opt/flasher/bin";
  in.esptoolPath = "/opt/flasher/esptool";
  in.chip = "esp32";
  in.baudRate = 460800;
  in.lastPort = "/dev/ttyUSB0";
  in.lastVersion = "v1";
  AppSettings::save(in);

  const AppSettings::Settings out = AppSettings::load();
  QCOMPARE(out.firmwareDir, in.firmwareDir);
  QCOMPARE(out.esptoolPath, in.esptoolPath);
  QCOMPARE(out.chip, in.chip);
  QCOMPARE(out.baudRate, in.baudRate);
  QCOMPARE(out.lastPort, in.lastPort);
  QCOMPARE(out.lastVersion, in.lastVersion);
}

void TestAppSettings::emptyToolPathRemovesKey() {
  AppSettings::Settings in = AppSettings::defaults();
  in.esptoolPath = "/opt/flasher/esptool";
  AppSettings::save(in);

  in.esptoolPath.clear();
  AppSettings::save(in);

  QSettings settings;
  QVERIFY(!settings.contains("Preferences/esptoolPath"));
  QVERIFY(AppSettings::load().esptoolPath.isEmpty());
}

void TestAppSettings::invalidBaudRateFallsBack() {
  {
    QSettings settings;
    settings.setValue("Preferences/baudRate", "fast");
    settings.setValue("Preferences/chip", "  ");
  }
  const AppSettings::Settings s = AppSettings::load();
  QCOMPARE(s.baudRate, 115200);
  QCOMPARE(s.chip, QStringLiteral("esp32s3"));
}

void TestAppSettings::saveSelectionKeepsPreferences() {
  AppSettings::Settings in = AppSettings::defaults();
  in.chip = "esp32c3";
  AppSettings::save(in);

  AppSettings::saveSelection("COM5", "v2");

  const AppSettings::Settings out = AppSettings::load();
  QCOMPARE(out.lastPort, QStringLiteral("COM5"));
  QCOMPARE(out.lastVersion, QStringLiteral("v2"));
  QCOMPARE(out.chip, QStringLiteral("esp32c3"));
}

int main(int argc, char** argv) {
  QStandardPaths::setTestModeEnabled(true);
  QCoreApplication app(argc, argv);
  QCoreApplication::setOrganizationName("SignalFlasherTests");
  QCoreApplication::setApplicationName("test_app_settings");
  TestAppSettings tc;
  return QTest::qExec(&tc, argc, argv);
}

#include "test_app_settings.moc"
