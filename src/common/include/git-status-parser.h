#pragma once

#include "git-types.h"
#include "git-command-executor.h"

#include <QString>
#include <QRegularExpression>

class GitRefResolver;

/**
 * @brief Git状态解析器
 *
 * 解析 git status --porcelain --branch 的输出：逐行分类状态条目，
 * 并解释"##"分支头部（分支名、ahead/behind、游离HEAD）。
 */
class GitStatusParser
{
public:
    // === 状态行分类 ===

    /**
     * @brief 拆分并分类单个状态行
     * @param statusLine 已去除行尾空白的状态行
     * @param entry 拆分出的状态条目（Dropped时内容无意义）
     * @return 分类结果
     *
     * 优先级（先匹配者生效）："##"头部、"??"未跟踪、工作区M、工作区D、
     * 索引U、索引非空格、其余丢弃。工作区状态优先于索引状态。
     */
    static GitStatusCategory classifyLine(const QString &statusLine, GitStatusEntry &entry);

    /**
     * @brief 只根据两个状态字符分类
     */
    static GitStatusCategory classifyStatusChars(char indexStatus, char workingStatus);

    // === 分支头部解析 ===

    /**
     * @brief 解释分支头部
     * @param headerPayload "##"之后的文本
     * @param resolver 游离HEAD时使用的解析器，可以为空（此时分支名为空）
     * @param branch 输出分支信息
     * @return 解析器的执行结果；只有git无法启动时返回ProcessError
     */
    static GitCommandExecutor::Result parseBranchHeader(const QString &headerPayload,
                                                        GitRefResolver *resolver,
                                                        GitBranchInfo &branch);

    /**
     * @brief 解析"[ahead N, behind M]"形式的分歧标注
     */
    static void parseDivergence(const QString &annotation, int &ahead, int &behind);

    // === 整体解析 ===

    /**
     * @brief 解析完整的porcelain输出
     * @param gitStatusOutput git status --porcelain --branch 的输出
     * @param resolver 游离HEAD时使用的解析器，可以为空
     * @param snapshot 输出的分支信息与分类集合
     * @return 只有游离HEAD解析时git无法启动才返回ProcessError
     */
    static GitCommandExecutor::Result parseGitStatus(const QString &gitStatusOutput,
                                                     GitRefResolver *resolver,
                                                     GitStatusSnapshot &snapshot);

private:
    GitStatusParser() = default;

    static int parseCount(const QString &segment, const QString &keyword);

    // 这些短语来自git的英文输出，执行器通过LC_ALL=C保证其稳定
    static const QRegularExpression s_initialCommitPattern;
    static const QRegularExpression s_noBranchPattern;
    static const QRegularExpression s_whitespacePattern;
};
