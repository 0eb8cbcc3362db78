#include "reminder/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcStore, "reminder.store")
Q_LOGGING_CATEGORY(lcMonitor, "reminder.monitor")
Q_LOGGING_CATEGORY(lcSupervisor, "reminder.supervisor")
Q_LOGGING_CATEGORY(lcDispatch, "reminder.dispatch")
Q_LOGGING_CATEGORY(lcPersistence, "reminder.persistence")
Q_LOGGING_CATEGORY(lcAudio, "reminder.audio")
Q_LOGGING_CATEGORY(lcUi, "reminder.ui")
