#include "app_settings.h"

#include "firmware_catalog.h"
#include "flash_orchestrator.h"

#include <QSettings>

namespace {
constexpr auto kPreferencesGroup = "Preferences";
constexpr auto kFirmwareDirKey = "firmwareDir";
constexpr auto kEsptoolPathKey = "esptoolPath";
constexpr auto kChipKey = "chip";
constexpr auto kBaudRateKey = "baudRate";
constexpr auto kLastPortKey = "lastPort";
constexpr auto kLastVersionKey = "lastVersion";
}  // namespace

AppSettings::Settings AppSettings::defaults() {
  Settings s;
  s.firmwareDir = FirmwareCatalog::defaultRootDir();
  s.chip = QString::fromLatin1(FlashOrchestrator::kDefaultChip);
  s.baudRate = FlashOrchestrator::kDefaultBaudRate;
  return s;
}

AppSettings::Settings AppSettings::load() {
  const Settings d = defaults();
  Settings out;

  QSettings settings;
  settings.beginGroup(kPreferencesGroup);
  out.firmwareDir = settings.value(kFirmwareDirKey, d.firmwareDir).toString().trimmed();
  out.esptoolPath = settings.value(kEsptoolPathKey).toString().trimmed();
  out.chip = settings.value(kChipKey, d.chip).toString().trimmed();
  bool ok = false;
  out.baudRate = settings.value(kBaudRateKey, d.baudRate).toInt(&ok);
  out.lastPort = settings.value(kLastPortKey).toString();
  out.lastVersion = settings.value(kLastVersionKey).toString();
  settings.endGroup();

  if (out.firmwareDir.isEmpty()) {
    out.firmwareDir = d.firmwareDir;
  }
  if (out.chip.isEmpty()) {
    out.chip = d.chip;
  }
  if (!ok || out.baudRate <= 0) {
    out.baudRate = d.baudRate;
  }
  return out;
}

void AppSettings::save(const Settings& in) {
  QSettings settings;
  settings.beginGroup(kPreferencesGroup);
  settings.setValue(kFirmwareDirKey, in.firmwareDir);
  if (in.esptoolPath.isEmpty()) {
    settings.remove(kEsptoolPathKey);
  } else {
    settings.setValue(kEsptoolPathKey, in.esptoolPath);
  }
  settings.setValue(kChipKey, in.chip);
  settings.setValue(kBaudRateKey, in.baudRate);
  settings.setValue(kLastPortKey, in.lastPort);
  settings.setValue(kLastVersionKey, in.lastVersion);
  settings.endGroup();
}

void AppSettings::saveSelection(const QString& port, const QString& version) {
  QSettings settings;
  settings.beginGroup(kPreferencesGroup);
  settings.setValue(kLastPortKey, port);
  settings.setValue(kLastVersionKey, version);
  settings.endGroup();
}
