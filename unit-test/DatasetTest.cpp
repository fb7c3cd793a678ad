#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <filesystem>
#include <fstream>

#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/scoped_directory.hpp"
#include "passk/dataset.hpp"

using namespace std;
using namespace passk;

class DatasetTest : public ::testing::Test {
protected:
    void write_gzip(const filesystem::path &path, const string &content) {
        ofstream fout(path, ios::out | ios::binary | ios::trunc);
        boost::iostreams::filtering_ostream out;
        out.push(boost::iostreams::gzip_compressor());
        out.push(fout);
        out << content;
    }

    scoped_directory dir;
};

TEST_F(DatasetTest, LoadDataset) {
    write_file_content(dir.path() / "problems.jsonl",
                       R"({"task_id": "HumanEval/0", "prompt": "int f() {", "tests": "int main() {}"})"
                       "\n\n   \n"
                       R"({"name": "HumanEval/1", "prompt": "int g() {", "tests": "int main() { return 1; }", "extra": 3})"
                       "\n"
                       R"({"task_id": "", "name": "HumanEval/2", "prompt": "int h() {", "tests": "int main() {}"})"
                       "\n"
                       "not json\n");

    auto tasks = load_dataset(dir.path() / "problems.jsonl");
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(tasks.at("HumanEval/0").prompt, "int f() {");
    EXPECT_EQ(tasks.at("HumanEval/0").tests, "int main() {}");
    EXPECT_EQ(tasks.at("HumanEval/1").task_id, "HumanEval/1");
    EXPECT_EQ(tasks.at("HumanEval/1").tests, "int main() { return 1; }");
    // 空的 task_id 使用 name
    EXPECT_EQ(tasks.at("HumanEval/2").prompt, "int h() {");
    EXPECT_EQ(tasks.count(""), 0u);
}

TEST_F(DatasetTest, MissingFiles) {
    EXPECT_THROW(load_dataset(dir.path() / "missing.jsonl"), passk_exception);
    EXPECT_THROW(load_completions(dir.path() / "missing.jsonl", 10), passk_exception);
    EXPECT_THROW(load_completions_dir(dir.path() / "missing", 10), passk_exception);
}

TEST_F(DatasetTest, LoadCompletions) {
    write_file_content(dir.path() / "completions.jsonl",
                       R"({"task_id": "a", "solution": "s0"})"
                       "\n"
                       R"({"task_id": "a", "completion": "s1"})"
                       "\n"
                       R"({"name": "b", "canonical_solution": "c0"})"
                       "\n"
                       R"({"task_id": "a", "solution": "", "completion": "s2"})"
                       "\n"
                       R"({"task_id": "a", "solution": "s3"})"
                       "\n");

    auto completions = load_completions(dir.path() / "completions.jsonl", 3);
    EXPECT_EQ(completions.at("a"), (vector<string>{"s0", "s1", "s2"}));
    EXPECT_EQ(completions.at("b"), vector<string>{"c0"});
}

TEST_F(DatasetTest, LoadCompletionsDir) {
    filesystem::create_directory(dir.path() / "samples");
    write_file_content(dir.path() / "samples" / "HumanEval_0.jsonl",
                       R"({"completion": "x0"})"
                       "\n"
                       "{broken\n"
                       R"({"solution": "x1"})"
                       "\n"
                       R"({"completion": "x2"})"
                       "\n");
    write_file_content(dir.path() / "samples" / "HumanEval_1.json", R"({"completion": "y0"})");
    write_file_content(dir.path() / "samples" / "notes.txt", "ignored");

    auto completions = load_completions_dir(dir.path() / "samples", 2);
    ASSERT_EQ(completions.size(), 2u);
    EXPECT_EQ(completions.at("HumanEval_0"), (vector<string>{"x0", "x1"}));
    EXPECT_EQ(completions.at("HumanEval_1"), vector<string>{"y0"});
}

TEST_F(DatasetTest, LoadCompressedCompletionsDir) {
    filesystem::create_directory(dir.path() / "samples");
    write_gzip(dir.path() / "samples" / "HumanEval_0.json.gz",
               R"({"completion": "x0"})"
               "\n"
               R"({"completion": "x1"})"
               "\n");
    write_gzip(dir.path() / "samples" / "HumanEval_1.jsonl.gz", R"({"solution": "y0"})");
    write_gzip(dir.path() / "samples" / "HumanEval_2.txt.gz", R"({"completion": "z0"})");

    auto completions = load_completions_dir(dir.path() / "samples", 10);
    ASSERT_EQ(completions.size(), 2u);
    EXPECT_EQ(completions.at("HumanEval_0"), (vector<string>{"x0", "x1"}));
    EXPECT_EQ(completions.at("HumanEval_1"), vector<string>{"y0"});
}

TEST_F(DatasetTest, CorruptCompressedCompletions) {
    filesystem::create_directory(dir.path() / "samples");
    write_file_content(dir.path() / "samples" / "HumanEval_0.json.gz", "not gzip at all");
    EXPECT_THROW(load_completions_dir(dir.path() / "samples", 10), passk_exception);
}

TEST_F(DatasetTest, MakeAttempts) {
    map<string, task> tasks;
    tasks["a"] = {"a", "int f() {", "int main() {}"};
    tasks["b"] = {"b", "int g() {", "int main() {}"};
    tasks["c"] = {"c", "int h() {", "int main() {}"};
    completion_map completions = {
        {"b", {"b0"}},
        {"a", {"a0", "a1"}},
        {"orphan", {"o0"}}};

    auto attempts = make_attempts(tasks, completions);
    ASSERT_EQ(attempts.size(), 3u);
    EXPECT_EQ(attempts[0].task_id, "a");
    EXPECT_EQ(attempts[0].candidate, 0u);
    EXPECT_EQ(attempts[0].solution, "a0");
    EXPECT_EQ(attempts[0].prompt, "int f() {");
    EXPECT_EQ(attempts[1].task_id, "a");
    EXPECT_EQ(attempts[1].candidate, 1u);
    EXPECT_EQ(attempts[2].task_id, "b");
    EXPECT_EQ(attempts[2].tests, "int main() {}");
}
