// SPDX-License-Identifier: MIT

#pragma once
#include "types.hpp"
#include "errors.hpp"
#include "qarray.hpp"
#include "core.hpp"
#include "kron.hpp"
#include "subsystems.hpp"
#include "partial_trace.hpp"
#include "gen.hpp"
#include "random.hpp"
#include "config.hpp"
