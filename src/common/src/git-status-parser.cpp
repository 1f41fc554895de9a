#include "git-status-parser.h"
#include "git-ref-resolver.h"

#include <QDebug>
#include <QStringList>

#include <limits>

// 静态成员初始化
const QRegularExpression GitStatusParser::s_initialCommitPattern("Initial commit on|No commits yet on");
const QRegularExpression GitStatusParser::s_noBranchPattern("no branch");
const QRegularExpression GitStatusParser::s_whitespacePattern("\\s+");

namespace {
const QString kUpstreamSeparator = QStringLiteral("...");
const QString kAheadKeyword = QStringLiteral("ahead");
const QString kBehindKeyword = QStringLiteral("behind");
}

GitStatusCategory GitStatusParser::classifyLine(const QString &statusLine, GitStatusEntry &entry)
{
    // 行首空格是索引列，只能去掉行尾空白
    QString line = statusLine;
    while (!line.isEmpty() && line.at(line.size() - 1).isSpace()) {
        line.chop(1);
    }

    if (line.size() < 3) {
        return GitStatusCategory::Dropped;
    }

    entry = GitStatusEntry(line.at(0).toLatin1(), line.at(1).toLatin1(), line.mid(2).trimmed());
    return classifyStatusChars(entry.indexStatus, entry.workingStatus);
}

GitStatusCategory GitStatusParser::classifyStatusChars(char indexStatus, char workingStatus)
{
    if (indexStatus == '#' && workingStatus == '#') {
        return GitStatusCategory::Header;
    }
    if (indexStatus == '?' && workingStatus == '?') {
        return GitStatusCategory::Untracked;
    }

    // 工作区状态优先于索引状态："MM"算作已修改，"AD"算作已删除
    if (workingStatus == 'M') {
        return GitStatusCategory::Changed;
    }
    if (workingStatus == 'D') {
        return GitStatusCategory::Deleted;
    }

    if (indexStatus == 'U') {
        return GitStatusCategory::Conflicted;
    }
    if (indexStatus != ' ') {
        return GitStatusCategory::Staged;
    }

    return GitStatusCategory::Dropped;
}

GitCommandExecutor::Result GitStatusParser::parseBranchHeader(const QString &headerPayload,
                                                              GitRefResolver *resolver,
                                                              GitBranchInfo &branch)
{
    branch = GitBranchInfo();
    const QString payload = headerPayload.trimmed();

    // "## No commits yet on main" / "## Initial commit on main"
    if (s_initialCommitPattern.match(payload).hasMatch()) {
        const QStringList tokens = payload.split(s_whitespacePattern, Qt::SkipEmptyParts);
        branch.name = tokens.isEmpty() ? QString() : tokens.last();
        return GitCommandExecutor::Result::Success;
    }

    // "## HEAD (no branch)"
    if (s_noBranchPattern.match(payload).hasMatch()) {
        branch.detached = true;
        if (!resolver) {
            return GitCommandExecutor::Result::Success;
        }
        return resolver->resolveLabel(branch.name);
    }

    const int separator = payload.indexOf(kUpstreamSeparator);
    if (separator < 0) {
        // 没有配置上游分支
        branch.name = payload;
        return GitCommandExecutor::Result::Success;
    }

    branch.name = payload.left(separator);

    const QString upstream = payload.mid(separator + kUpstreamSeparator.size());
    const QStringList tokens = upstream.split(s_whitespacePattern, Qt::SkipEmptyParts);
    if (tokens.size() > 1) {
        parseDivergence(tokens.mid(1).join(' '), branch.ahead, branch.behind);
    }

    return GitCommandExecutor::Result::Success;
}

void GitStatusParser::parseDivergence(const QString &annotation, int &ahead, int &behind)
{
    QString text = annotation;
    while (text.startsWith('[')) {
        text.remove(0, 1);
    }
    while (text.endsWith(']')) {
        text.chop(1);
    }

    const QStringList segments = text.split(QStringLiteral(", "));
    for (const QString &segment : segments) {
        if (segment.startsWith(kAheadKeyword)) {
            ahead = parseCount(segment, kAheadKeyword);
        } else if (segment.startsWith(kBehindKeyword)) {
            behind = parseCount(segment, kBehindKeyword);
        }
        // "gone" 等其他标注忽略
    }
}

int GitStatusParser::parseCount(const QString &segment, const QString &keyword)
{
    bool ok = false;
    const uint value = segment.mid(keyword.size()).trimmed().toUInt(&ok);
    if (!ok) {
        qInfo() << "INFO: [GitStatusParser::parseCount] Unparseable divergence segment:" << segment;
        return 0;
    }
    return value > static_cast<uint>(std::numeric_limits<int>::max())
            ? std::numeric_limits<int>::max()
            : static_cast<int>(value);
}

GitCommandExecutor::Result GitStatusParser::parseGitStatus(const QString &gitStatusOutput,
                                                           GitRefResolver *resolver,
                                                           GitStatusSnapshot &snapshot)
{
    snapshot = GitStatusSnapshot();

    const QStringList lines = gitStatusOutput.split('\n');
    for (const QString &line : lines) {
        GitStatusEntry entry;
        const GitStatusCategory category = classifyLine(line, entry);

        switch (category) {
        case GitStatusCategory::Header: {
            const auto result = parseBranchHeader(entry.payload, resolver, snapshot.branch);
            if (result == GitCommandExecutor::Result::ProcessError) {
                return result;
            }
            break;
        }
        case GitStatusCategory::Untracked:
            snapshot.buckets.untracked.append(entry);
            break;
        case GitStatusCategory::Changed:
            snapshot.buckets.changed.append(entry);
            break;
        case GitStatusCategory::Deleted:
            snapshot.buckets.deleted.append(entry);
            break;
        case GitStatusCategory::Conflicted:
            snapshot.buckets.conflicted.append(entry);
            break;
        case GitStatusCategory::Staged:
            snapshot.buckets.staged.append(entry);
            break;
        case GitStatusCategory::Dropped:
            break;
        }
    }

    qDebug() << "DEBUG: [GitStatusParser::parseGitStatus] Branch:" << snapshot.branch.name
             << "untracked:" << snapshot.buckets.untracked.size()
             << "staged:" << snapshot.buckets.staged.size()
             << "changed:" << snapshot.buckets.changed.size()
             << "deleted:" << snapshot.buckets.deleted.size()
             << "conflicted:" << snapshot.buckets.conflicted.size();

    return GitCommandExecutor::Result::Success;
}
