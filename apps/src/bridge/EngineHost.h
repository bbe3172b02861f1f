#pragma once

#include "HostError.h"
#include "core/Result.h"
#include "protocol/ClientCommand.h"
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace StenoBridge {
namespace Bridge {

/**
 * @brief The narrow API the stenography engine exposes to the bridge.
 *
 * Every method is called on the host's own execution context, from inside
 * EngineBridge::processHostCalls(). Implementations are never called
 * concurrently and need no locking of their own for these calls.
 */
class EngineHost {
public:
    virtual ~EngineHost() = default;

    /**
     * @brief Mutates host state. Resulting state changes are reported back
     * through EngineBridge::publish() as ordinary events.
     */
    virtual Result<std::monostate, HostError> applyCommand(
        const Protocol::ClientCommand::Data& command) = 0;

    /**
     * @brief Every stroke sequence whose translation is exactly this text.
     */
    virtual std::vector<std::vector<std::string>> reverseLookup(
        const std::string& translation) const = 0;

    // Longest dictionary key, in strokes.
    virtual size_t longestKey() const = 0;
};

} // namespace Bridge
} // namespace StenoBridge
