#include "git-prompt-formatter.h"

#include <QStringList>

GitPromptSummary GitPromptFormatter::summarize(const GitStatusSnapshot &snapshot, int stashCount)
{
    GitPromptSummary summary;
    summary.branch = snapshot.branch.name;
    summary.ahead = snapshot.branch.ahead;
    summary.behind = snapshot.branch.behind;
    summary.stagedCount = snapshot.buckets.staged.size();
    summary.conflictCount = snapshot.buckets.conflicted.size();
    summary.changedCount = snapshot.buckets.changed.size();
    summary.untrackedCount = snapshot.buckets.untracked.size();
    summary.stashCount = stashCount;
    summary.clean = snapshot.buckets.isClean();
    summary.deletedCount = snapshot.buckets.deleted.size();
    return summary;
}

QString GitPromptFormatter::format(const GitPromptSummary &summary)
{
    const QStringList fields {
        summary.branch,
        QString::number(summary.ahead),
        QString::number(summary.behind),
        QString::number(summary.stagedCount),
        QString::number(summary.conflictCount),
        QString::number(summary.changedCount),
        QString::number(summary.untrackedCount),
        QString::number(summary.stashCount),
        QString::number(summary.clean ? 1 : 0),
        QString::number(summary.deletedCount)
    };
    return fields.join(' ');
}
