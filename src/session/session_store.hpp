#pragma once

#include <string>
#include <vector>
#include "core/errors/forge_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/task_state.hpp"

namespace forge::session {

// Receives conversation snapshots at pause and settle points.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual core::errors::Status save(const std::string& task_id,
                                      const std::vector<protocol::Turn>& turns,
                                      protocol::TaskState state) = 0;
};

}  // namespace forge::session
