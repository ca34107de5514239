#include "command_registry.hpp"

CommandRegistry& CommandRegistry::instance() {
    static CommandRegistry registry;
    return registry;
}

void CommandRegistry::add(const string& id, shared_ptr<const StageRunnerBase> runner) {
    unique_lock lk{lck};
    // same id means same instantiation, the first runner is as good as any
    runners.emplace(id, move(runner));
}

shared_ptr<const StageRunnerBase> CommandRegistry::get(const string& id) const {
    shared_lock lk{lck};
    auto it = runners.find(id);
    if (it == runners.end()) {
        throw EngineError{fmt::format("no stage function registered under '{}'", id)};
    }
    return it->second;
}

bool CommandRegistry::contains(const string& id) const {
    shared_lock lk{lck};
    return runners.count(id) != 0;
}

vector<char> runCommand(const Command& command, const vector<char>& input) {
    auto stages = command.stages();
    if (stages.empty()) {
        return input;
    }
    vector<shared_ptr<const StageRunnerBase>> runners;
    runners.reserve(stages.size());
    for (const auto& stage : stages) {
        runners.push_back(CommandRegistry::instance().get(stage.function));
    }
    auto iter = runners.front()->decode(command.deserializer, input);
    for (size_t i = 0; i < stages.size(); ++i) {
        iter = runners[i]->apply(move(iter), stages[i].args);
    }
    return runners.back()->encode(command.serializer, move(iter));
}
