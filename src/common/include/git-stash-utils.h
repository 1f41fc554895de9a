#pragma once

#include "git-command-executor.h"

#include <QString>

/**
 * @brief Git Stash工具类
 *
 * 通过stash的reflog（<git-dir>/logs/refs/stash）统计stash数量，
 * 不需要额外启动 git stash list。
 */
class GitStashUtils
{
public:
    /**
     * @brief 获取stash数量
     * @param executor 命令执行器，用于查询git目录
     * @param repositoryPath 仓库工作目录
     * @param count 输出stash数量，日志文件不可读时为0
     * @return 只有git无法启动时返回ProcessError
     */
    static GitCommandExecutor::Result getStashCount(GitCommandExecutor *executor,
                                                    const QString &repositoryPath,
                                                    int &count);

    /**
     * @brief 计算stash日志文件路径
     * @param gitDir rev-parse --git-dir 的输出，可以是相对路径
     * @param repositoryPath 相对路径的基准目录
     */
    static QString stashLogPath(const QString &gitDir, const QString &repositoryPath);

    /**
     * @brief 统计文件行数，最后一行没有换行符也计入
     * @return 文件无法打开时返回0
     */
    static int countLogLines(const QString &filePath);

private:
    // 私有构造函数，这是一个工具类
    GitStashUtils() = default;
};
