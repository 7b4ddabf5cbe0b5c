#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

namespace grader {

/**
 * @class asset
 * @brief 运行时包中的一个文件，比如标准库的预导入脚本
 */
struct asset {
    /**
     * @brief 复制的进度回调，参数为本次写入的字节数
     * 回调可以通过抛出异常中断复制
     */
    typedef std::function<void(uint64_t)> chunk_callback;

    /**
     * @brief 该文件在运行时目录中的相对路径
     * @note 不能包含 ".."，安装前由 assert_safe_path 检查
     */
    std::string name;

    explicit asset(const std::string &name);
    virtual ~asset() = default;

    /**
     * @brief 文件的字节数，用于计算下载进度
     */
    virtual uint64_t size() const = 0;

    /**
     * @brief 将文件写入 dir / name
     * @param dir 要写入的目录
     * @param on_chunk 每写入一块数据调用一次
     * @note 该函数在复制过程中将阻塞，调用方需要持有目录锁
     * @note 该函数会抛出异常
     */
    virtual void fetch(const std::filesystem::path &dir, const chunk_callback &on_chunk) const = 0;
};

/**
 * @brief 表示一个已经在本地的资源文件
 */
struct local_asset : public asset {
    std::filesystem::path path;

    local_asset(const std::string &name, const std::filesystem::path &path);

    uint64_t size() const override;
    void fetch(const std::filesystem::path &dir, const chunk_callback &on_chunk) const override;
};

/**
 * @brief 表示已经知道内容的文本资源
 */
struct text_asset : public asset {
    std::string text;

    text_asset(const std::string &name, const std::string &text);

    uint64_t size() const override;
    void fetch(const std::filesystem::path &dir, const chunk_callback &on_chunk) const override;
};

typedef std::shared_ptr<asset> asset_ptr;

}  // namespace grader
