#include "corelog.h"

Q_LOGGING_CATEGORY(zwemoCoreLog, "phi-core.adapters.zwemo.core")
