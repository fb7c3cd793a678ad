#include "common/scoped_directory.hpp"

#include <boost/lexical_cast.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "common/exceptions.hpp"
#include "logging.hpp"

namespace passk {
using namespace std;
namespace fs = std::filesystem;

scoped_directory::scoped_directory(const fs::path &root, const string &prefix) {
    error_code ec;
    fs::path base = root.empty() ? fs::temp_directory_path(ec) : root;
    if (ec)
        BOOST_THROW_EXCEPTION(sandbox_unavailable() << "no temporary directory available: " << ec.message());

    // 子进程会 chdir 到工作文件夹，相对路径会被再解析一次
    base = fs::absolute(base, ec);
    if (ec)
        BOOST_THROW_EXCEPTION(sandbox_unavailable() << "unable to resolve work root " << root << ": " << ec.message());

    fs::create_directories(base, ec);
    if (ec)
        BOOST_THROW_EXCEPTION(sandbox_unavailable() << "unable to create work root " << base << ": " << ec.message());

    // random_generator 不是线程安全的，每个线程持有一个
    thread_local boost::uuids::random_generator generator;
    fs::path candidate = base / (prefix + boost::lexical_cast<string>(generator()));
    // create_directory 在文件夹已存在时返回 false，保证文件夹只属于当前评测
    if (!fs::create_directory(candidate, ec) || ec)
        BOOST_THROW_EXCEPTION(sandbox_unavailable() << "unable to create work directory " << candidate << ": " << (ec ? ec.message() : "already exists"));

    fs::permissions(candidate, fs::perms::owner_all, fs::perm_options::replace, ec);
    dir = candidate;
    LOG_DEBUG << "Created work directory " << dir;
}

scoped_directory::scoped_directory(scoped_directory &&other) noexcept : dir(move(other.dir)) {
    other.dir.clear();
}

scoped_directory &scoped_directory::operator=(scoped_directory &&other) noexcept {
    if (this != &other) {
        remove();
        dir = move(other.dir);
        other.dir.clear();
    }
    return *this;
}

scoped_directory::~scoped_directory() {
    remove();
}

const fs::path &scoped_directory::path() const {
    return dir;
}

void scoped_directory::remove() {
    if (dir.empty()) return;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec)
        LOG_ERROR << "Unable to delete work directory " << dir << ": " << ec.message();
    else
        LOG_DEBUG << "Deleted work directory " << dir;
    dir.clear();
}

}  // namespace passk
