#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(log_ports)
Q_DECLARE_LOGGING_CATEGORY(log_firmware)
Q_DECLARE_LOGGING_CATEGORY(log_config)
Q_DECLARE_LOGGING_CATEGORY(log_flash)
Q_DECLARE_LOGGING_CATEGORY(log_session)
