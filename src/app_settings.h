#pragma once

#include <QString>

class AppSettings final {
 public:
  struct Settings final {
    QString firmwareDir;
    QString esptoolPath;
    QString chip;
    int baudRate = 0;
    QString lastPort;
    QString lastVersion;
  };

  // Missing keys come back as the built-in defaults, except esptoolPath which
  // stays empty so FlashOrchestrator resolves it.
  static Settings load();
  static void save(const Settings& settings);
  static void saveSelection(const QString& port, const QString& version);

  static Settings defaults();
};
