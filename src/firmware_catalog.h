#pragma once

#include <QList>
#include <QMap>
#include <QMetaType>
#include <QString>
#include <QStringList>
#include <QVector>

#include <optional>

enum class FirmwareRole {
  Bootloader,
  PartitionTable,
  OtaSelector,
  Application,
};

struct FirmwareVersion final {
  QString name;
  QString directoryPath;
};

class FirmwareFileSet final {
 public:
  // Every role, in flash address order.
  static const QList<FirmwareRole>& requiredRoles();

  void setPath(FirmwareRole role, QString path);
  QString path(FirmwareRole role) const;
  bool contains(FirmwareRole role) const;
  bool isEmpty() const;
  int size() const;
  void clear();

  bool isComplete() const;
  QList<FirmwareRole> missingRoles() const;

  const QMap<FirmwareRole, QString>& paths() const { return paths_; }

 private:
  QMap<FirmwareRole, QString> paths_;
};

class FirmwareCatalog final {
 public:
  static QString roleName(FirmwareRole role);
  static QStringList roleNames(const QList<FirmwareRole>& roles);

  // Role for a file name by substring, case-insensitive. Only "*.bin" files
  // are classified; anything else yields nullopt.
  static std::optional<FirmwareRole> classifyFileName(const QString& fileName);

  // "<applicationDir>/bin", or the folder holding the app bundle on macOS.
  static QString defaultRootDir();

  // Subdirectories of |rootDir| sorted by name. Creates |rootDir| when it is
  // missing; an unreadable root yields an empty list.
  static QVector<FirmwareVersion> listVersions(const QString& rootDir);

  static std::optional<FirmwareVersion> findVersion(const QString& rootDir, const QString& name);

  // Non-recursive scan of the version directory. When several files map to
  // the same role the last one listed wins (a warning is logged).
  static FirmwareFileSet resolveFiles(const FirmwareVersion& version);
};

Q_DECLARE_METATYPE(FirmwareVersion)
Q_DECLARE_METATYPE(QVector<FirmwareVersion>)
