#include "markslog.h"

// Se filtran con QT_LOGGING_RULES, p.ej. "marks.engine.debug=true"
Q_LOGGING_CATEGORY(lcStore,  "marks.store")
Q_LOGGING_CATEGORY(lcEngine, "marks.engine")
Q_LOGGING_CATEGORY(lcUi,     "marks.ui")
Q_LOGGING_CATEGORY(lcConfig, "marks.config")
