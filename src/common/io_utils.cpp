#include "common/io_utils.hpp"

#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>
#include <fstream>

#include "common/exceptions.hpp"

namespace passk {
using namespace std;
namespace fs = std::filesystem;

static const string TRUNCATED_MARK = "<...truncated>";

string read_file_content(const fs::path &path, long max_bytes) {
    ifstream fin(path, ios::in | ios::binary | ios::ate);
    if (!fin)
        BOOST_THROW_EXCEPTION(passk_exception() << "unable to open file " << path);

    auto file_size = fin.tellg();
    fin.seekg(0, ios::beg);

    auto read_size = max_bytes > 0 ? min(file_size, ifstream::pos_type(max_bytes)) : file_size;

    string result;
    result.resize(read_size);
    fin.read(&result[0], read_size);

    if (read_size < file_size) mark_truncated(result);
    return result;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::out | ios::binary | ios::trunc);
    if (!fout)
        BOOST_THROW_EXCEPTION(passk_exception() << "unable to create file " << path);
    fout << content;
    fout.flush();
    if (!fout)
        BOOST_THROW_EXCEPTION(passk_exception() << "unable to write file " << path);
}

static vector<string> read_nonblank_lines(istream &in) {
    vector<string> lines;
    for (string line; getline(in, line);) {
        if (boost::algorithm::trim_copy(line).empty()) continue;
        lines.push_back(move(line));
    }
    return lines;
}

vector<string> read_nonblank_lines(const fs::path &path) {
    ifstream fin(path, ios::in | ios::binary);
    if (!fin)
        BOOST_THROW_EXCEPTION(passk_exception() << "unable to open file " << path);

    if (path.extension() != ".gz") return read_nonblank_lines(fin);

    namespace io = boost::iostreams;
    io::filtering_istream in;
    in.push(io::gzip_decompressor());
    in.push(fin);
    // 解压失败时 istream 默认只设置 badbit，需要抛出异常才能和文件结束区分
    in.exceptions(ios::badbit);
    try {
        return read_nonblank_lines(in);
    } catch (ios_base::failure &ex) {
        BOOST_THROW_EXCEPTION(passk_exception() << "unable to decompress " << path << ": " << ex.what());
    }
}

void mark_truncated(string &text) {
    text += TRUNCATED_MARK;
}

}  // namespace passk
