#include "firmware_catalog.h"

#include "logging.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

namespace {
constexpr auto kBinarySuffix = ".bin";
constexpr auto kBootloaderMarker = "bootloader";
constexpr auto kPartitionMarker = "partition";
constexpr auto kOtaSelectorMarker = "boot_app0";
}  // namespace

const QList<FirmwareRole>& FirmwareFileSet::requiredRoles() {
  static const QList<FirmwareRole> kRoles = {
      FirmwareRole::Bootloader,
      FirmwareRole::PartitionTable,
      FirmwareRole::OtaSelector,
      FirmwareRole::Application,
  };
  return kRoles;
}

void FirmwareFileSet::setPath(FirmwareRole role, QString path) {
  paths_.insert(role, std::move(path));
}

QString FirmwareFileSet::path(FirmwareRole role) const {
  return paths_.value(role);
}

bool FirmwareFileSet::contains(FirmwareRole role) const {
  return paths_.contains(role);
}

bool FirmwareFileSet::isEmpty() const {
  return paths_.isEmpty();
}

int FirmwareFileSet::size() const {
  return static_cast<int>(paths_.size());
}

void FirmwareFileSet::clear() {
  paths_.clear();
}

bool FirmwareFileSet::isComplete() const {
  return missingRoles().isEmpty();
}

QList<FirmwareRole> FirmwareFileSet::missingRoles() const {
  QList<FirmwareRole> missing;
  for (const FirmwareRole role : requiredRoles()) {
    if (!paths_.contains(role)) {
      missing.push_back(role);
    }
  }
  return missing;
}

QString FirmwareCatalog::roleName(FirmwareRole role) {
  switch (role) {
    case FirmwareRole::Bootloader:
      return QStringLiteral("bootloader");
    case FirmwareRole::PartitionTable:
      return QStringLiteral("partition_table");
    case FirmwareRole::OtaSelector:
      return QStringLiteral("ota_selector");
    case FirmwareRole::Application:
      return QStringLiteral("application");
  }
  return {};
}

QStringList FirmwareCatalog::roleNames(const QList<FirmwareRole>& roles) {
  QStringList names;
  names.reserve(roles.size());
  for (const FirmwareRole role : roles) {
    names << roleName(role);
  }
  return names;
}

std::optional<FirmwareRole> FirmwareCatalog::classifyFileName(const QString& fileName) {
  if (!fileName.endsWith(QLatin1String(kBinarySuffix))) {
    return std::nullopt;
  }
  const QString lower = fileName.toLower();
  if (lower.contains(QLatin1String(kBootloaderMarker))) {
    return FirmwareRole::Bootloader;
  }
  if (lower.contains(QLatin1String(kPartitionMarker))) {
    return FirmwareRole::PartitionTable;
  }
  if (lower.contains(QLatin1String(kOtaSelectorMarker))) {
    return FirmwareRole::OtaSelector;
  }
  return FirmwareRole::Application;
}

QString FirmwareCatalog::defaultRootDir() {
  QString base = QCoreApplication::applicationDirPath();
#if defined(Q_OS_MACOS)
  // .../Flasher.app/Contents/MacOS -> directory holding Flasher.app
  if (base.endsWith(QStringLiteral(".app/Contents/MacOS"))) {
    base = QDir::cleanPath(base + QStringLiteral("/../../.."));
  }
#endif
  return QDir(base).absoluteFilePath(QStringLiteral("bin"));
}

QVector<FirmwareVersion> FirmwareCatalog::listVersions(const QString& rootDir) {
  QVector<FirmwareVersion> versions;
  if (rootDir.trimmed().isEmpty()) {
    return versions;
  }

  QDir root(rootDir);
  if (!root.exists()) {
    if (!QDir().mkpath(root.absolutePath())) {
      qCWarning(log_firmware) << "Could not create firmware directory" << root.absolutePath();
      return versions;
    }
    qCInfo(log_firmware) << "Created firmware directory" << root.absolutePath();
  }

  const QFileInfoList entries =
      root.entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
  versions.reserve(entries.size());
  for (const QFileInfo& entry : entries) {
    FirmwareVersion v;
    v.name = entry.fileName();
    v.directoryPath = entry.absoluteFilePath();
    versions.push_back(std::move(v));
  }
  qCDebug(log_firmware) << "Found" << versions.size() << "firmware versions in" << rootDir;
  return versions;
}

std::optional<FirmwareVersion> FirmwareCatalog::findVersion(const QString& rootDir,
                                                            const QString& name) {
  if (name.trimmed().isEmpty()) {
    return std::nullopt;
  }
  for (const FirmwareVersion& v : listVersions(rootDir)) {
    if (v.name == name) {
      return v;
    }
  }
  return std::nullopt;
}

FirmwareFileSet FirmwareCatalog::resolveFiles(const FirmwareVersion& version) {
  FirmwareFileSet files;
  if (version.directoryPath.isEmpty()) {
    return files;
  }

  const QDir dir(version.directoryPath);
  if (!dir.exists()) {
    qCDebug(log_firmware) << "Version directory does not exist:" << version.directoryPath;
    return files;
  }

  const QFileInfoList entries = dir.entryInfoList(QDir::Files, QDir::Name);
  for (const QFileInfo& entry : entries) {
    const std::optional<FirmwareRole> role = classifyFileName(entry.fileName());
    if (!role) {
      continue;
    }
    if (files.contains(*role)) {
      qCWarning(log_firmware).noquote()
          << QString("Version %1: %2 replaces %3 as %4")
                 .arg(version.name, entry.fileName(),
                      QFileInfo(files.path(*role)).fileName(), roleName(*role));
    }
    files.setPath(*role, entry.absoluteFilePath());
  }
  return files;
}
