#pragma once

#include <filesystem>
#include <string>

namespace passk {

/**
 * @brief 独占的临时工作文件夹
 * 构造时在 root 下创建一个名称唯一（uuid）的文件夹，权限为 0700，
 * 析构时递归删除，无论是正常返回、抛出异常还是超时。
 * 同一个文件夹不会被两次评测共享。
 */
struct scoped_directory {
    /**
     * @param root 在哪个文件夹下创建，为空时使用系统临时文件夹，相对路径按当前工作路径转换为绝对路径
     * @param prefix 文件夹名前缀，方便排查残留文件
     * @throw sandbox_unavailable 无法创建文件夹
     */
    explicit scoped_directory(const std::filesystem::path &root = {}, const std::string &prefix = "passk_");
    scoped_directory(scoped_directory &&other) noexcept;
    scoped_directory &operator=(scoped_directory &&other) noexcept;
    scoped_directory(const scoped_directory &) = delete;
    scoped_directory &operator=(const scoped_directory &) = delete;
    ~scoped_directory();

    const std::filesystem::path &path() const;

    /**
     * @brief 立即删除文件夹，之后 path() 为空
     */
    void remove();

private:
    std::filesystem::path dir;
};

}  // namespace passk
