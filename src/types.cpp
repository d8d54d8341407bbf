/*
 * hostfan - Fleet Command Dispatcher
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hostfan/types.hpp"

namespace hostfan {

const char* outcomeToString(Outcome outcome) noexcept {
    switch (outcome) {
        case Outcome::Succeeded: return "succeeded";
        case Outcome::Exhausted: return "exhausted";
        case Outcome::Aborted:   return "aborted";
        default: return "unknown";
    }
}

}
