#include "git-ref-resolver.h"

#include <QDebug>
#include <QRegularExpression>

namespace {
// for-each-ref最多返回两个标签，只需区分"一个"与"多个"
constexpr int kMaxTagCount = 2;
}

GitRefResolver::GitRefResolver(GitCommandExecutor *executor, const QString &repositoryPath)
    : m_executor(executor)
    , m_repositoryPath(repositoryPath)
{
}

GitCommandExecutor::Result GitRefResolver::resolveLabel(QString &label)
{
    label.clear();

    QString output;
    auto result = query("for-each-ref",
                        { "for-each-ref",
                          "--points-at=HEAD",
                          QStringLiteral("--count=%1").arg(kMaxTagCount),
                          "--sort=-version:refname",
                          "--format=%(refname:short)",
                          "refs/tags" },
                        output);
    if (result == GitCommandExecutor::Result::ProcessError) {
        return result;
    }

    label = labelFromTags(output);
    if (!label.isEmpty()) {
        qDebug() << "DEBUG: [GitRefResolver::resolveLabel] Detached HEAD resolved to tag:" << label;
        return GitCommandExecutor::Result::Success;
    }

    // 没有标签时使用短哈希
    result = query("rev-parse", { "rev-parse", "--short", "HEAD" }, output);
    if (result == GitCommandExecutor::Result::ProcessError) {
        return result;
    }

    label = output.trimmed();
    if (label.isEmpty()) {
        qInfo() << "INFO: [GitRefResolver::resolveLabel] No tag or hash available for HEAD in" << m_repositoryPath;
    }
    return GitCommandExecutor::Result::Success;
}

QString GitRefResolver::labelFromTags(const QString &forEachRefOutput)
{
    static const QRegularExpression whitespace("\\s+");
    const QStringList tags = forEachRefOutput.split(whitespace, Qt::SkipEmptyParts);
    if (tags.isEmpty()) {
        return QString();
    }

    return tags.size() > 1 ? tags.first() + QLatin1Char('+') : tags.first();
}

GitCommandExecutor::Result GitRefResolver::query(const QString &name, const QStringList &arguments, QString &output)
{
    GitCommandExecutor::GitCommand cmd;
    cmd.command = name;
    cmd.arguments = arguments;
    cmd.workingDirectory = m_repositoryPath;

    QString error;
    const auto result = m_executor->executeCommand(cmd, output, error);

    // 非零退出码不是致命错误，仍然使用已有的标准输出
    if (result != GitCommandExecutor::Result::Success && result != GitCommandExecutor::Result::ProcessError) {
        qInfo() << "INFO: [GitRefResolver::query]" << name << "returned"
                << GitCommandExecutor::resultName(result) << error.trimmed();
    }
    return result;
}
