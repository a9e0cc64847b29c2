#include "calendraft/core/Logging.hpp"

Q_LOGGING_CATEGORY(CALENDRAFT_CODEC, "calendraft.codec", QtInfoMsg)
Q_LOGGING_CATEGORY(CALENDRAFT_PARSER, "calendraft.parser", QtInfoMsg)
Q_LOGGING_CATEGORY(CALENDRAFT_GENERATOR, "calendraft.generator", QtInfoMsg)
Q_LOGGING_CATEGORY(CALENDRAFT_STORE, "calendraft.store", QtInfoMsg)
Q_LOGGING_CATEGORY(CALENDRAFT_TOOL, "calendraft.tool", QtInfoMsg)
