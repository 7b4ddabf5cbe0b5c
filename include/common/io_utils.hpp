#pragma once

#include <filesystem>
#include <string>

namespace grader {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 写入文本文件，文件已存在时覆盖
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 统计 UTF-8 字符串的字符数（码点数）
 * 输出长度限制按字符数而不是字节数计算
 */
size_t utf8_length(const std::string &string);

/**
 * @brief 保留 UTF-8 字符串的前 count 个字符
 */
std::string utf8_truncate(const std::string &string, size_t count);

/**
 * @brief 断言 subpath 一定不会出现返回上一层目录的情况
 * 运行时包中的文件名会拼接到缓存目录下，如果文件名包含 "../"，
 * 安装时可能覆盖缓存目录之外的文件。
 * @param subpath 被检查的文件名
 */
std::string assert_safe_path(const std::string &subpath);

struct scoped_file_lock {
    scoped_file_lock();
    scoped_file_lock(const std::filesystem::path &path, bool shared);
    scoped_file_lock(scoped_file_lock &&);
    ~scoped_file_lock();

    scoped_file_lock &operator=(scoped_file_lock &&);

    void release();
private:
    int fd = -1;
    bool valid = false;
    std::filesystem::path lock_file;
};

/**
 * @brief 锁文件夹
 * 通过创建文件夹，并对文件夹根目录下的 .lock 文件加锁实现
 * @param dir 要被加锁的文件夹
 * @param shared 是否是共享锁，真为共享锁（读锁），假为独占锁（写锁）
 * @return 文件锁
 */
scoped_file_lock lock_directory(const std::filesystem::path &dir, bool shared);

}  // namespace grader
