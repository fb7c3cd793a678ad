#include "passk/result_collector.hpp"

#include "common/exceptions.hpp"

namespace passk {
using namespace std;

void result_collector::register_task(const string &task_id, size_t samples) {
    auto slot = make_unique<task_slot>();
    slot->results.resize(samples);
    slots[task_id] = move(slot);
}

void result_collector::record(const string &task_id, size_t candidate, bool passed) {
    auto it = slots.find(task_id);
    if (it == slots.end())
        BOOST_THROW_EXCEPTION(internal_error() << "task " << task_id << " is not registered");

    task_slot &slot = *it->second;
    scoped_lock guard(slot.mut);
    if (candidate >= slot.results.size())
        BOOST_THROW_EXCEPTION(internal_error() << "candidate " << candidate << " of task " << task_id
                                               << " out of range " << slot.results.size());
    slot.results[candidate] = passed;
}

task_result_map result_collector::snapshot() const {
    task_result_map results;
    for (auto &[task_id, slot] : slots) {
        scoped_lock guard(slot->mut);
        task_result_set &passes = results[task_id];
        for (auto &result : slot->results)
            if (result) passes.push_back(*result);
    }
    return results;
}

}  // namespace passk
