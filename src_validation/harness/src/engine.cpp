#include "jsonschema_conformance/engine.hpp"

#include "jsonschema_conformance/checks.hpp"

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <iterator>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

namespace {

using jsonschema::conformance::Backend;
using jsonschema::conformance::Collection;
using jsonschema::conformance::ResultLog;
using jsonschema::conformance::TestGroup;

struct WorkUnit {
    const Collection* collection;
    const TestGroup* group;
};

void run_group(const Backend& backend, const WorkUnit& unit, ResultLog& log) {
    jsonschema::conformance::check_schema(backend, *unit.collection, *unit.group, log);
    if (!unit.group->cases) {
        return;
    }
    for (const auto& test : *unit.group->cases) {
        jsonschema::conformance::check_data(backend, *unit.collection, *unit.group, test, log);
    }
}

std::vector<WorkUnit> collect_units(const std::vector<Collection>& collections) {
    std::vector<WorkUnit> units;
    for (const auto& collection : collections) {
        for (const auto& group : collection.groups) {
            units.push_back(WorkUnit{&collection, &group});
        }
    }
    return units;
}

void run_parallel(const Backend& backend, const std::vector<WorkUnit>& units,
                  std::size_t jobs, std::vector<ResultLog>& slots) {
    std::atomic<std::size_t> next{0};
    std::exception_ptr failure;
    std::mutex failure_mtx;

    auto worker = [&]() {
        for (;;) {
            const std::size_t index = next.fetch_add(1);
            if (index >= units.size()) {
                return;
            }
            try {
                run_group(backend, units[index], slots[index]);
            } catch (...) {
                std::lock_guard<std::mutex> lock(failure_mtx);
                if (!failure) {
                    failure = std::current_exception();
                }
                next.store(units.size());
                return;
            }
        }
    };

    std::vector<std::thread> workers;
    workers.reserve(jobs);
    for (std::size_t i = 0; i < jobs; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) {
        t.join();
    }

    if (failure) {
        std::rethrow_exception(failure);
    }
}

}  // namespace

namespace jsonschema::conformance {

Engine::Engine(const Backend& backend) : Engine(backend, Config{}) {}

Engine::Engine(const Backend& backend, Config config)
    : backend_{backend}, config_{std::move(config)} {}

void Engine::add_collection(const std::filesystem::path& directory,
                            const std::optional<std::string>& version) {
    CollectionLoader loader(config_.loader);
    auto loaded = loader.load_directory(directory, version);
    collections_.insert(collections_.end(),
                        std::make_move_iterator(loaded.begin()),
                        std::make_move_iterator(loaded.end()));
}

void Engine::ignore(std::string pattern) {
    ignores_.ignore(std::move(pattern));
}

void Engine::ignore_file(const std::filesystem::path& file) {
    ignores_.load_file(file);
}

RunResult Engine::run() const {
    const auto units = collect_units(collections_);
    const std::size_t jobs = std::min(std::max<std::size_t>(config_.jobs, 1), units.size());

    RunResult result;
    if (jobs <= 1) {
        for (const auto& unit : units) {
            run_group(backend_, unit, result.log);
        }
    } else {
        std::vector<ResultLog> slots(units.size());
        run_parallel(backend_, units, jobs, slots);
        for (auto& slot : slots) {
            result.log.splice(std::move(slot));
        }
    }

    result.report = build_report(result.log.records(), ignores_, config_.verbose);
    return result;
}

}  // namespace jsonschema::conformance
