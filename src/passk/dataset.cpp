#include "passk/dataset.hpp"

#include <algorithm>
#include <optional>

#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "logging.hpp"

namespace passk {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

static string get_task_id(const json &j) {
    return first_nonempty(j, {"task_id", "name"});
}

map<string, task> load_dataset(const fs::path &path) {
    map<string, task> tasks;
    vector<string> lines = read_nonblank_lines(path);
    for (size_t i = 0; i < lines.size(); ++i) {
        try {
            task t = json::parse(lines[i]).get<task>();
            tasks[t.task_id] = move(t);
        } catch (json::exception &e) {
            LOG_WARN << "Skipping malformed task at " << path << " line " << i + 1 << ": " << e.what();
        }
    }
    LOG_INFO << "Loaded " << tasks.size() << " tasks from " << path;
    return tasks;
}

completion_map load_completions(const fs::path &path, size_t max_samples) {
    completion_map completions;
    vector<string> lines = read_nonblank_lines(path);
    for (size_t i = 0; i < lines.size(); ++i) {
        try {
            json j = json::parse(lines[i]);
            auto &samples = completions[get_task_id(j)];
            if (samples.size() < max_samples)
                samples.push_back(first_nonempty(j, {"solution", "completion", "canonical_solution"}));
        } catch (json::exception &e) {
            LOG_WARN << "Skipping malformed completion at " << path << " line " << i + 1 << ": " << e.what();
        }
    }
    return completions;
}

/**
 * @brief <task_id>.jsonl、<task_id>.json 以及它们 gzip 压缩后的 .gz 文件，返回 task_id
 * 其他文件返回空
 */
static optional<string> completion_file_task_id(const fs::path &file) {
    fs::path name = file.filename();
    if (name.extension() == ".gz") name = name.stem();
    if (name.extension() != ".jsonl" && name.extension() != ".json") return nullopt;
    return name.stem().string();
}

completion_map load_completions_dir(const fs::path &dir, size_t max_samples) {
    if (!fs::is_directory(dir))
        BOOST_THROW_EXCEPTION(passk_exception() << "completions directory " << dir << " does not exist");

    // 按文件名排序，保证每次加载的结果相同
    vector<pair<fs::path, string>> files;
    for (auto &entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        if (auto task_id = completion_file_task_id(entry.path()))
            files.emplace_back(entry.path(), *task_id);
    }
    sort(files.begin(), files.end());

    completion_map completions;
    for (auto &[file, task_id] : files) {
        auto &samples = completions[task_id];
        for (auto &line : read_nonblank_lines(file)) {
            if (samples.size() >= max_samples) break;
            try {
                samples.push_back(first_nonempty(json::parse(line), {"completion", "solution"}));
            } catch (json::exception &e) {
                LOG_WARN << "Skipping malformed completion in " << file << ": " << e.what();
            }
        }
    }
    return completions;
}

vector<attempt> make_attempts(const map<string, task> &tasks, const completion_map &completions) {
    vector<attempt> attempts;
    for (auto &[task_id, t] : tasks) {
        auto it = completions.find(task_id);
        if (it == completions.end()) continue;
        for (size_t i = 0; i < it->second.size(); ++i) {
            attempt request;
            request.task_id = task_id;
            request.prompt = t.prompt;
            request.solution = it->second[i];
            request.tests = t.tests;
            request.candidate = i;
            attempts.push_back(move(request));
        }
    }

    for (auto &[task_id, samples] : completions)
        if (!tasks.count(task_id))
            LOG_WARN << "Ignoring " << samples.size() << " completions of task " << task_id << " which is not in the dataset";
    return attempts;
}

}  // namespace passk
