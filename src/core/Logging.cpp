#include "saturn/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcParse, "saturn.parse", QtWarningMsg)
Q_LOGGING_CATEGORY(lcRecur, "saturn.recur", QtWarningMsg)
Q_LOGGING_CATEGORY(lcStorage, "saturn.storage", QtWarningMsg)
Q_LOGGING_CATEGORY(lcCommand, "saturn.command", QtWarningMsg)
