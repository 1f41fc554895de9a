#pragma once

#include "git-types.h"

#include <QString>

/**
 * @brief 提示符输出格式化
 *
 * 输出格式（空格分隔，无换行）：
 * <branch> <ahead> <behind> <staged> <conflicts> <changed> <untracked> <stash> <clean> <deleted>
 */
class GitPromptFormatter
{
public:
    /**
     * @brief 由解析结果和stash数量组装汇总
     */
    static GitPromptSummary summarize(const GitStatusSnapshot &snapshot, int stashCount);

    /**
     * @brief 格式化为单行文本，分支名缺失时第一个字段为空
     */
    static QString format(const GitPromptSummary &summary);

private:
    GitPromptFormatter() = default;
};
