// Copyright 2025 The Framewire Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

namespace framewire {

//! Logical message exchanged over a channel, e.g. a JSON-RPC request, response or notification
//! \remarks A null value is not a valid message
using Message = nlohmann::json;

}  // namespace framewire
