#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTodoDomain)
Q_DECLARE_LOGGING_CATEGORY(lcTodoData)
