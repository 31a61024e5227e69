#pragma once

#include "alert/alert_kind.hpp"
#include "core/types.hpp"
#include <string>

namespace moverwatch {

/// An alert that passed its cooldown and was handed to the notifier
struct Alert {
    AlertKind kind;
    Symbol symbol;
    std::string message;
    WallTime fired_at;
    bool delivered{false};
};

}  // namespace moverwatch
