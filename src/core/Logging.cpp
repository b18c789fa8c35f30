#include "todo/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcTodoDomain, "todo.domain")
Q_LOGGING_CATEGORY(lcTodoData, "todo.data")
