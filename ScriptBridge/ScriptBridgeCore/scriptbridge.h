/**
 * @file scriptbridge.h
 * @brief Single include for the ScriptBridge C API.
 */
#pragma once

#include "include/core/defines.h"
#include "include/core/types.h"
#include "include/core/log.h"
#include "include/core/error.h"

#include "include/bridge/engine.h"
#include "include/bridge/navigator.h"
#include "include/bridge/extract.h"
#include "include/bridge/accessors.h"
#include "include/bridge/reference.h"
#include "include/bridge/call.h"

#include "include/config/config.h"
