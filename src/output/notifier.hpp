#pragma once

#include <string>
#include <string_view>

namespace moverwatch::output {

/// What a message is, so sinks can treat routine notices differently
enum class MessageKind {
    Alert,     // rule firing
    Summary,   // periodic top movers list
    Notice,    // startup, shutdown, market open/close, heartbeat
    Error      // task failure report
};

[[nodiscard]] constexpr std::string_view to_string(MessageKind kind) noexcept {
    switch (kind) {
        case MessageKind::Alert:   return "alert";
        case MessageKind::Summary: return "summary";
        case MessageKind::Notice:  return "notice";
        case MessageKind::Error:   return "error";
    }
    return "unknown";
}

/// Outbound messaging sink. send() is a single best-effort attempt that
/// returns false on any failure instead of throwing.
class Notifier {
public:
    virtual ~Notifier() = default;

    /// Deliver formatted text
    /// @return true if the sink accepted the message
    virtual bool send(const std::string& text, MessageKind kind) = 0;
};

}  // namespace moverwatch::output
