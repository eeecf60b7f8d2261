// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of Xmliter, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <xmliter/config.hpp>
#include <xmliter/core/logger.hpp>
#include <xmliter/error.hpp>
#include <xmliter/options.hpp>
#include <xmliter/reduce/dict_reducer.hpp>
#include <xmliter/reduce/edge_counter.hpp>
#include <xmliter/reduce/json_output.hpp>
#include <xmliter/reduce/node.hpp>
#include <xmliter/reduce/path_counter.hpp>
#include <xmliter/stream/event.hpp>
#include <xmliter/stream/event_stream.hpp>
