// include/strata.h
#pragma once

#include "engine_config.h"
#include "storage_engine.h"
#include "storage_error/error_handler.h"
#include "storage_error/error_utils.h"
#include "storage_error/result.h"
#include "types.h"
