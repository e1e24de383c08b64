#pragma once

#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include "core/concurrency/channel.hpp"
#include "core/errors/forge_errors.hpp"
#include "protocol/event_contract.hpp"

namespace forge::runtime {
class TaskEngine;
}

namespace forge::app {

// Line-oriented operator console. One thread renders engine events, another
// turns input lines into control events.
class ConsoleOperator {
public:
    ConsoleOperator(runtime::TaskEngine& engine,
                    core::concurrency::Channel<protocol::ControlEvent>& control,
                    std::istream& in, std::ostream& out);

    // Returns once the engine closes its event channel.
    void render_events();

    // Returns at /quit or end of input, after posting Shutdown.
    void read_commands();

    // "/approve", "/reject [reason]", "/pause", "/resume", "/cancel", "/quit";
    // anything else is a new instruction.
    static core::errors::Result<protocol::ControlEvent> parse_command(
        const std::string& line, const std::optional<std::string>& pending_call_id);

    static std::string render(const protocol::EngineEvent& event);

private:
    runtime::TaskEngine& engine_;
    core::concurrency::Channel<protocol::ControlEvent>& control_;
    std::istream& in_;
    std::ostream& out_;

    std::mutex mutex_;
    std::optional<std::string> pending_call_id_;
};

}  // namespace forge::app
