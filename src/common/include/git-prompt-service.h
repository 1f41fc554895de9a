#pragma once

#include "git-types.h"
#include "git-command-executor.h"

#include <QString>

/**
 * @brief 提示符数据收集服务
 *
 * 依次执行状态查询、行解析（游离HEAD时解析标签或哈希）和stash统计，
 * 生成一次提示符所需的全部数据。所有查询同步顺序执行。
 */
class GitPromptService
{
public:
    /**
     * @brief 收集结果
     */
    enum class Outcome {
        Ready,          ///< 汇总数据可用
        NotRepository,  ///< 当前目录不是Git仓库，不输出任何内容
        Failed          ///< git进程无法启动
    };

    /**
     * @param executor 命令执行器（不获取所有权）
     * @param workingDirectory 查询的工作目录
     */
    GitPromptService(GitCommandExecutor *executor, const QString &workingDirectory);

    Outcome collect(GitPromptSummary &summary);

private:
    GitCommandExecutor *m_executor;
    QString m_workingDirectory;
};
