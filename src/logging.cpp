#include "logging.h"

Q_LOGGING_CATEGORY(log_ports, "flasher.ports")
Q_LOGGING_CATEGORY(log_firmware, "flasher.firmware")
Q_LOGGING_CATEGORY(log_config, "flasher.config")
Q_LOGGING_CATEGORY(log_flash, "flasher.flash")
Q_LOGGING_CATEGORY(log_session, "flasher.session")
