#include "passk/aggregator.hpp"

#include <fmt/core.h>

#include <algorithm>

#include "common/exceptions.hpp"

namespace passk {
using namespace std;
using namespace nlohmann;

double per_task_pass_at_k(size_t n, size_t c, size_t k) {
    if (c > n)
        BOOST_THROW_EXCEPTION(passk_exception() << "passed samples " << c << " exceed total samples " << n);
    if (k == 0)
        BOOST_THROW_EXCEPTION(passk_exception("k must be positive"));

    if (n - c < k) return 1.0;

    // C(n - c, k) / C(n, k) = prod_{i = n - c + 1}^{n} (1 - k / i)
    // 逐项相乘避免计算大组合数溢出。从 i = n 开始乘，c 增加时只是在相同的前缀上再乘一个 [0, 1) 内的数，
    // 因此浮点结果也随 c 单调
    double fail = 1.0;
    for (size_t i = n; i > n - c; --i)
        fail *= 1.0 - static_cast<double>(k) / static_cast<double>(i);
    return 1.0 - fail;
}

evaluation_metrics aggregate(const task_result_map &results, const set<int> &ks) {
    return aggregate({}, results, ks);
}

evaluation_metrics aggregate(const vector<string> &task_ids, const task_result_map &results, const set<int> &ks) {
    for (int k : ks)
        if (k <= 0)
            BOOST_THROW_EXCEPTION(passk_exception() << "k must be positive, got " << k);

    evaluation_metrics m;

    set<string> all_tasks(task_ids.begin(), task_ids.end());
    for (auto &[task_id, passes] : results) all_tasks.insert(task_id);
    m.total = all_tasks.size();

    size_t with_samples = 0, first_passed = 0;
    for (auto &[task_id, passes] : results) {
        if (passes.empty()) continue;
        ++with_samples;
        if (passes.front()) ++first_passed;
        if (any_of(passes.begin(), passes.end(), [](bool passed) { return passed; })) ++m.resolved;
    }
    m.pass_at_1 = with_samples ? static_cast<double>(first_passed) / static_cast<double>(with_samples) : 0.0;

    for (int k : ks) {
        if (k == 1) continue;

        double sum = 0;
        size_t count = 0;
        for (auto &[task_id, passes] : results) {
            size_t n = passes.size();
            if (n < static_cast<size_t>(k)) continue;
            size_t c = count_if(passes.begin(), passes.end(), [](bool passed) { return passed; });
            sum += per_task_pass_at_k(n, c, k);
            ++count;
        }
        m.pass_at_k[k] = count ? optional<double>(sum / static_cast<double>(count)) : nullopt;
    }
    return m;
}

void to_json(json &j, const evaluation_metrics &m) {
    j = {{"pass@1", m.pass_at_1},
         {"resolved", m.resolved},
         {"total", m.total}};
    for (auto &[k, value] : m.pass_at_k) {
        string key = fmt::format("pass@{}", k);
        if (value)
            j[key] = *value;
        else
            j[key] = nullptr;
    }
}

}  // namespace passk
