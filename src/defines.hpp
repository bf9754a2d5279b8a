#pragma once

#include "helpers/math/Math.hpp"
#include "helpers/memory/Memory.hpp"
#include "helpers/signal/Signal.hpp"
#include "debug/log/Logger.hpp"
#include "macros.hpp"
