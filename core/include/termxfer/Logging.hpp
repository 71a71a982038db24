// Logging categories used across the core library.
// Enable debug output with QT_LOGGING_RULES="termxfer.*.debug=true".
#pragma once
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(txRegistry)
Q_DECLARE_LOGGING_CATEGORY(txBridge)
Q_DECLARE_LOGGING_CATEGORY(txProcess)
Q_DECLARE_LOGGING_CATEGORY(txSsh)
