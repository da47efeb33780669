#pragma once

// Main include file for paramroute

// Utilities
#include "paramroute/util/bytes.hpp"
#include "paramroute/util/expected.hpp"
#include "paramroute/util/type_name.hpp"
#include "paramroute/util/uuid.hpp"

// Core
#include "paramroute/core/config.hpp"
#include "paramroute/core/error.hpp"
#include "paramroute/core/logging.hpp"
#include "paramroute/core/parameter.hpp"
#include "paramroute/core/parameters.hpp"
#include "paramroute/core/path_component.hpp"
