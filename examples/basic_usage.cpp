/**
 * @file basic_usage.cpp
 * @brief Basic usage example for the Tessera execution engine
 */

#include <iostream>
#include <memory>

#include <tessera/tessera.hpp>

#include "execution/script_backend.hpp"
#include "storage/memory_state.hpp"

int main() {
    std::cout << "Tessera v" << tessera::version() << "\n\n";

    // State before the block
    tessera::MemoryState state{{"alice", "100"}, {"bob", "20"}, {"carol", "0"}};

    // alice pays bob, bob pays carol, carol reports her balance
    auto t0 = std::make_shared<tessera::ScriptTransaction>("alice->bob");
    t0->transfer("alice", "bob", 60);

    auto t1 = std::make_shared<tessera::ScriptTransaction>("bob->carol");
    t1->transfer("bob", "carol", 70);

    auto t2 = std::make_shared<tessera::ScriptTransaction>("carol balance");
    t2->load(0, "carol").emit(0);

    auto t3 = std::make_shared<tessera::ScriptTransaction>("alice overdraft");
    t3->transfer("alice", "carol", 1000);

    tessera::Block block;
    block.transactions = {t0, t1, t2, t3};
    for (const auto& txn : {t0, t1, t2, t3}) {
        block.hints.push_back(txn->declared_keys());
    }

    tessera::EngineOptions options;
    options.worker_count = 4;
    options.log_level = "warn";

    tessera::ScriptBackend backend;
    tessera::Engine engine(backend, state, options);

    tessera::BlockOutput output;
    auto status = engine.execute_block(block, &output);
    if (!status.ok()) {
        std::cerr << "Error: " << status.to_string() << "\n";
        return 1;
    }

    std::cout << "Outcomes:\n";
    for (size_t i = 0; i < output.outcomes.size(); ++i) {
        const auto& outcome = output.outcomes[i];
        std::cout << "  " << block.transactions[i]->describe() << ": "
                  << (outcome.success ? "ok" : "failed");
        if (!outcome.payload.empty()) {
            std::cout << " (" << outcome.payload << ")";
        }
        std::cout << "\n";
    }

    std::cout << "\nState delta:\n";
    for (const auto& [key, value] : output.state_delta) {
        std::cout << "  " << key << " = " << value << "\n";
    }

    std::cout << "\n" << output.metrics.executions << " executions, "
              << output.metrics.validation_aborts << " validation aborts, depth "
              << output.parallelism.depth << "\n";

    state.apply(output.state_delta);
    return 0;
}
