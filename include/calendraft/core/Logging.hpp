#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(CALENDRAFT_CODEC)
Q_DECLARE_LOGGING_CATEGORY(CALENDRAFT_PARSER)
Q_DECLARE_LOGGING_CATEGORY(CALENDRAFT_GENERATOR)
Q_DECLARE_LOGGING_CATEGORY(CALENDRAFT_STORE)
Q_DECLARE_LOGGING_CATEGORY(CALENDRAFT_TOOL)
