#pragma once

#ifndef TIPFLOW_LOGGER_NAME
#define TIPFLOW_LOGGER_NAME "tipflow"
#endif
