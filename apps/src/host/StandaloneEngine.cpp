#include "StandaloneEngine.h"
#include "core/LoggingChannels.h"
#include <algorithm>
#include <chrono>

namespace StenoBridge {
namespace Host {

namespace {

constexpr const char* kOutputEnabled = "output_enabled";
constexpr const char* kMachineType = "machine_type";

using HostResult = Result<std::monostate, Bridge::HostError>;

HostResult ok()
{
    return HostResult::okay(std::monostate{});
}

std::string stringOf(const Protocol::ConfigValue& value)
{
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return Protocol::describe(value);
}

} // namespace

StandaloneEngine::StandaloneEngine(Publish publish) : publish_(std::move(publish))
{
    options_ = {
        { "enable_stroke_logging", false },
        { "enable_translation_logging", false },
        { kMachineType, std::string("Keyboard") },
        { kOutputEnabled, true },
        { "space_placement", std::string("Before Output") },
        { "start_attached", false },
        { "start_capitalized", false },
        { "system_name", std::string("English Stenotype") },
        { "undo_levels", int64_t{ 100 } },
    };
}

StandaloneEngine::~StandaloneEngine()
{
    stop();
}

Result<std::monostate, std::string> StandaloneEngine::loadDictionaries(
    const std::vector<std::filesystem::path>& paths)
{
    for (const auto& path : paths) {
        auto dictionary = StenoDictionary::loadFile(path);
        if (dictionary.isError()) {
            return Result<std::monostate, std::string>::error(dictionary.errorValue());
        }
        addDictionary(std::move(dictionary.value()));
    }
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

void StandaloneEngine::addDictionary(StenoDictionary dictionary)
{
    dictionaries_.push_back(std::move(dictionary));
}

void StandaloneEngine::start(CallPump pump)
{
    if (running_.exchange(true)) {
        return;
    }

    thread_ = std::thread([this, pump = std::move(pump)]() {
        const auto machine = option(kMachineType);
        publish_(Protocol::Events::MachineStateChanged{
            .machine_type = machine.has_value() ? stringOf(machine.value()) : "Keyboard",
            .state = "connected" });

        if (!dictionaries_.empty()) {
            Protocol::Events::DictionariesLoaded loaded;
            for (const auto& dictionary : dictionaries_) {
                loaded.paths.push_back(dictionary.path().string());
            }
            publish_(std::move(loaded));
        }

        LOG_INFO(Host, "Standalone engine running");
        while (running_) {
            pump(*this);
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        LOG_INFO(Host, "Standalone engine stopped");
    });
}

void StandaloneEngine::stop()
{
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

HostResult StandaloneEngine::applyCommand(const Protocol::ClientCommand::Data& command)
{
    using namespace Protocol::Commands;

    if (const auto* set = std::get_if<SetConfigOption>(&command)) {
        return setOption(set->option, set->value);
    }
    if (const auto* toggle = std::get_if<ToggleOutput>(&command)) {
        setOutput(toggle->enabled.value_or(!outputEnabled()));
        return ok();
    }
    if (const auto* text = std::get_if<SendText>(&command)) {
        LOG_DEBUG(Host, "Typing {} bytes", text->text.size());
        publish_(Protocol::Events::SendString{ .text = text->text });
        return ok();
    }
    if (const auto* backspaces = std::get_if<SendBackspaces>(&command)) {
        publish_(Protocol::Events::SendBackspaces{ .count = backspaces->count });
        return ok();
    }
    if (const auto* combo = std::get_if<SendKeyCombination>(&command)) {
        publish_(Protocol::Events::SendKeyCombination{ .combination = combo->combination });
        return ok();
    }
    return HostResult::error(Bridge::HostError::rejected(
        std::string(Protocol::commandKindOf(command)) + " is not an engine command"));
}

std::vector<std::vector<std::string>> StandaloneEngine::reverseLookup(
    const std::string& translation) const
{
    std::vector<std::vector<std::string>> result;
    for (size_t i = 0; i < dictionaries_.size(); ++i) {
        for (auto& strokes : dictionaries_[i].reverseLookup(translation)) {
            // Skip entries shadowed by a higher priority dictionary.
            const auto steno = StenoDictionary::joinStrokes(strokes);
            const bool shadowed = std::any_of(
                dictionaries_.begin(), dictionaries_.begin() + static_cast<std::ptrdiff_t>(i),
                [&steno](const StenoDictionary& higher) { return higher.lookup(steno).has_value(); });
            if (shadowed || std::find(result.begin(), result.end(), strokes) != result.end()) {
                continue;
            }
            result.push_back(std::move(strokes));
        }
    }
    return result;
}

size_t StandaloneEngine::longestKey() const
{
    size_t longest = 0;
    for (const auto& dictionary : dictionaries_) {
        longest = std::max(longest, dictionary.longestKey());
    }
    return longest;
}

bool StandaloneEngine::outputEnabled() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = options_.find(kOutputEnabled);
    return it != options_.end() && std::get<bool>(it->second);
}

std::optional<Protocol::ConfigValue> StandaloneEngine::option(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = options_.find(name);
    if (it == options_.end()) {
        return std::nullopt;
    }
    return it->second;
}

HostResult StandaloneEngine::setOption(const std::string& name, const Protocol::ConfigValue& value)
{
    const auto expected = Protocol::findConfigOption(name);
    if (!expected.has_value() || expected.value() != Protocol::typeOf(value)) {
        return HostResult::error(Bridge::HostError::rejected("cannot set " + name));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& current = options_[name];
        if (current == value) {
            return ok();
        }
        current = value;
    }

    LOG_INFO(Host, "{} = {}", name, Protocol::describe(value));
    publish_(Protocol::Events::ConfigChanged{ .option = name, .value = value });
    if (name == kOutputEnabled) {
        publish_(Protocol::Events::OutputToggled{ .enabled = std::get<bool>(value) });
    }
    else if (name == kMachineType) {
        publish_(Protocol::Events::MachineStateChanged{ .machine_type = stringOf(value),
                                                        .state = "connected" });
    }
    return ok();
}

void StandaloneEngine::setOutput(bool enabled)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& current = options_[kOutputEnabled];
        if (current == Protocol::ConfigValue(enabled)) {
            return;
        }
        current = enabled;
    }
    LOG_INFO(Host, "Output {}", enabled ? "enabled" : "disabled");
    publish_(Protocol::Events::OutputToggled{ .enabled = enabled });
}

} // namespace Host
} // namespace StenoBridge
