#pragma once

#include <QMetaType>
#include <QString>

#include <utility>

struct OperationResult final {
  enum class Kind {
    None,
    Transport,
    Validation,
    DeviceProtocol,
    ExternalTool,
    Stopped,
  };

  Kind kind = Kind::None;
  QString message;
  // Exit status of the flashing tool when one ran, 0 otherwise.
  int exitCode = 0;

  bool ok() const { return kind == Kind::None; }

  static OperationResult success() { return {}; }
  static OperationResult failure(Kind kind, QString message, int exitCode = 0) {
    OperationResult r;
    r.kind = kind;
    r.message = std::move(message);
    r.exitCode = exitCode;
    return r;
  }

  static QString kindName(Kind kind) {
    switch (kind) {
      case Kind::None:
        return QStringLiteral("none");
      case Kind::Transport:
        return QStringLiteral("transport");
      case Kind::Validation:
        return QStringLiteral("validation");
      case Kind::DeviceProtocol:
        return QStringLiteral("device-protocol");
      case Kind::ExternalTool:
        return QStringLiteral("external-tool");
      case Kind::Stopped:
        return QStringLiteral("stopped");
    }
    return {};
  }
};

Q_DECLARE_METATYPE(OperationResult)
