#pragma once

#include <QString>
#include <QList>

// Git状态行分类 - 顺序与分类优先级无关
enum class GitStatusCategory {
    /** The line is the "##" branch summary header. */
    Header,
    /** Both columns are '?': the path is not under version control. */
    Untracked,
    /** The working tree column is 'M'. */
    Changed,
    /** The working tree column is 'D'. */
    Deleted,
    /** The index column is 'U': the path has unresolved merge conflicts. */
    Conflicted,
    /** The index column carries any other change. */
    Staged,
    /** The line is malformed or matches no rule. */
    Dropped
};

// 单行porcelain状态记录
struct GitStatusEntry {
    char indexStatus;
    char workingStatus;
    QString payload;    // 路径或头部文本

    GitStatusEntry() : indexStatus(' '), workingStatus(' ') {}
    GitStatusEntry(char index, char working, const QString &text)
        : indexStatus(index), workingStatus(working), payload(text) {}

    bool operator==(const GitStatusEntry &other) const
    {
        return indexStatus == other.indexStatus
                && workingStatus == other.workingStatus
                && payload == other.payload;
    }
};

using GitStatusEntryList = QList<GitStatusEntry>;

// 分支信息结构
struct GitBranchInfo {
    QString name;       // 为空表示无法确定分支
    int ahead;
    int behind;
    bool detached;

    GitBranchInfo() : ahead(0), behind(0), detached(false) {}
};

// 五类状态条目集合，保持输入顺序
struct GitStatusBuckets {
    GitStatusEntryList untracked;
    GitStatusEntryList staged;
    GitStatusEntryList changed;
    GitStatusEntryList deleted;
    GitStatusEntryList conflicted;

    bool isClean() const
    {
        return untracked.isEmpty() && staged.isEmpty() && changed.isEmpty()
                && deleted.isEmpty() && conflicted.isEmpty();
    }
};

// 一次git status查询的解析结果
struct GitStatusSnapshot {
    GitBranchInfo branch;
    GitStatusBuckets buckets;
};

// 提示符输出的汇总数据
struct GitPromptSummary {
    QString branch;
    int ahead;
    int behind;
    int stagedCount;
    int conflictCount;
    int changedCount;
    int untrackedCount;
    int stashCount;
    bool clean;
    int deletedCount;

    GitPromptSummary()
        : ahead(0), behind(0), stagedCount(0), conflictCount(0), changedCount(0),
          untrackedCount(0), stashCount(0), clean(true), deletedCount(0) {}
};
