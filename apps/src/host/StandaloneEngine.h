#pragma once

#include "StenoDictionary.h"
#include "bridge/EngineHost.h"
#include "core/Result.h"
#include "protocol/ConfigOptions.h"
#include "protocol/EngineEvent.h"
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace StenoBridge {
namespace Host {

/**
 * @brief Minimal stenography engine for running the bridge on its own.
 *
 * Owns the config option table and output state, answers reverse lookups from
 * its dictionaries, and reports every change it makes as an engine event.
 * Commands are applied on the engine's own thread, which pumps the bridge's
 * call queue every few milliseconds.
 */
class StandaloneEngine : public Bridge::EngineHost {
public:
    using Publish = std::function<void(Protocol::EngineEvent::Data)>;
    using CallPump = std::function<size_t(Bridge::EngineHost&)>;

    explicit StandaloneEngine(Publish publish);
    ~StandaloneEngine() override;

    StandaloneEngine(const StandaloneEngine&) = delete;
    StandaloneEngine& operator=(const StandaloneEngine&) = delete;

    // Earlier dictionaries take priority over later ones. Call before start().
    Result<std::monostate, std::string> loadDictionaries(
        const std::vector<std::filesystem::path>& paths);
    void addDictionary(StenoDictionary dictionary);

    void start(CallPump pump);
    void stop();
    bool isRunning() const { return running_.load(); }

    Result<std::monostate, Bridge::HostError> applyCommand(
        const Protocol::ClientCommand::Data& command) override;

    std::vector<std::vector<std::string>> reverseLookup(
        const std::string& translation) const override;

    size_t longestKey() const override;

    bool outputEnabled() const;
    std::optional<Protocol::ConfigValue> option(const std::string& name) const;

private:
    Result<std::monostate, Bridge::HostError> setOption(
        const std::string& name, const Protocol::ConfigValue& value);
    void setOutput(bool enabled);

    Publish publish_;
    std::vector<StenoDictionary> dictionaries_;

    mutable std::mutex mutex_;
    std::map<std::string, Protocol::ConfigValue> options_;

    std::atomic<bool> running_{ false };
    std::thread thread_;
};

} // namespace Host
} // namespace StenoBridge
