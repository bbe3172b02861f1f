#pragma once

#include <functional>
#include <utility>

namespace StenoBridge {

/**
 * @brief A command bundled with the callback that receives its response.
 *
 * Lets a command cross a queue (and a thread) while its originator keeps
 * control over where the response goes.
 */
template <typename CommandT, typename ResponseT>
struct CommandWithCallback {
    using Command = CommandT;
    using Response = ResponseT;
    using Callback = std::function<void(Response&&)>;

    CommandWithCallback() = default;
    CommandWithCallback(Command cmd, Callback cb) : command(std::move(cmd)), callback(std::move(cb))
    {}

    Command command;
    Callback callback;

    void sendResponse(Response&& response) const
    {
        if (callback) {
            callback(std::move(response));
        }
    }
};

} // namespace StenoBridge
