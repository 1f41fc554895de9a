#pragma once

#include "git-command-executor.h"

#include <QString>

/**
 * @brief 游离HEAD的显示名称解析器
 *
 * 优先使用指向HEAD的标签名（按版本号降序取第一个，存在第二个标签时追加"+"），
 * 否则退回到HEAD的短哈希。
 */
class GitRefResolver
{
public:
    /**
     * @param executor 命令执行器（不获取所有权）
     * @param repositoryPath 执行查询的工作目录
     */
    GitRefResolver(GitCommandExecutor *executor, const QString &repositoryPath);

    /**
     * @brief 解析HEAD的显示名称
     * @param label 输出名称，无法解析时为空
     * @return 仅在git进程无法启动时返回ProcessError，其余情况返回Success
     */
    GitCommandExecutor::Result resolveLabel(QString &label);

    /**
     * @brief 根据for-each-ref输出生成标签名称
     * @param forEachRefOutput 每行一个标签名
     * @return 标签名称，没有标签时为空
     */
    static QString labelFromTags(const QString &forEachRefOutput);

private:
    GitCommandExecutor::Result query(const QString &name, const QStringList &arguments, QString &output);

    GitCommandExecutor *m_executor;
    QString m_repositoryPath;
};
