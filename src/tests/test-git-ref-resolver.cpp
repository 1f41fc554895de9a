#include <QtTest/QtTest>
#include <QObject>
#include <QDebug>
#include "utils/fake-git-command-executor.h"
#include "git-ref-resolver.h"

/**
 * @brief GitRefResolver单元测试类
 */
class TestGitRefResolver : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testSingleTag();
    void testTwoTagsMarkedAmbiguous();
    void testNoTagsFallsBackToHash();
    void testNothingResolvable();
    void testTagQueryFailureFallsBackToHash();
    void testSpawnFailureOnTagQuery();
    void testSpawnFailureOnHashQuery();
    void testLabelFromTags();
};

void TestGitRefResolver::testSingleTag()
{
    FakeGitCommandExecutor executor;
    executor.setReply(FakeGitCommands::tags(), GitCommandExecutor::Result::Success, "v1.0\n");
    GitRefResolver resolver(&executor, "/tmp/repo");

    QString label;
    QCOMPARE(resolver.resolveLabel(label), GitCommandExecutor::Result::Success);
    QCOMPARE(label, QString("v1.0"));

    // 找到标签后不再查询哈希
    QCOMPARE(executor.calls().size(), 1);
    QCOMPARE(executor.directories().first(), QString("/tmp/repo"));
}

void TestGitRefResolver::testTwoTagsMarkedAmbiguous()
{
    FakeGitCommandExecutor executor;
    executor.setReply(FakeGitCommands::tags(), GitCommandExecutor::Result::Success, "v2.0\nv1.0\n");
    GitRefResolver resolver(&executor, "/tmp/repo");

    QString label;
    QCOMPARE(resolver.resolveLabel(label), GitCommandExecutor::Result::Success);
    QCOMPARE(label, QString("v2.0+"));
}

void TestGitRefResolver::testNoTagsFallsBackToHash()
{
    FakeGitCommandExecutor executor;
    executor.setReply(FakeGitCommands::tags(), GitCommandExecutor::Result::Success, "");
    executor.setReply(FakeGitCommands::shortHash(), GitCommandExecutor::Result::Success, "abc1234\n");
    GitRefResolver resolver(&executor, "/tmp/repo");

    QString label;
    QCOMPARE(resolver.resolveLabel(label), GitCommandExecutor::Result::Success);
    QCOMPARE(label, QString("abc1234"));
    QCOMPARE(executor.calls(), QStringList({ FakeGitCommands::tags().join(' '),
                                             FakeGitCommands::shortHash().join(' ') }));
}

void TestGitRefResolver::testNothingResolvable()
{
    FakeGitCommandExecutor executor;
    executor.setReply(FakeGitCommands::tags(), GitCommandExecutor::Result::Success, "");
    executor.setReply(FakeGitCommands::shortHash(), GitCommandExecutor::Result::CommandError, "");
    GitRefResolver resolver(&executor, "/tmp/repo");

    QString label = "stale";
    QCOMPARE(resolver.resolveLabel(label), GitCommandExecutor::Result::Success);
    QVERIFY(label.isEmpty());
}

void TestGitRefResolver::testTagQueryFailureFallsBackToHash()
{
    // 非零退出码不是致命错误
    FakeGitCommandExecutor executor;
    executor.setReply(FakeGitCommands::tags(), GitCommandExecutor::Result::CommandError);
    executor.setReply(FakeGitCommands::shortHash(), GitCommandExecutor::Result::Success, "0f1e2d3");
    GitRefResolver resolver(&executor, "/tmp/repo");

    QString label;
    QCOMPARE(resolver.resolveLabel(label), GitCommandExecutor::Result::Success);
    QCOMPARE(label, QString("0f1e2d3"));
}

void TestGitRefResolver::testSpawnFailureOnTagQuery()
{
    FakeGitCommandExecutor executor;
    executor.setReply(FakeGitCommands::tags(), GitCommandExecutor::Result::ProcessError);
    GitRefResolver resolver(&executor, "/tmp/repo");

    QString label;
    QCOMPARE(resolver.resolveLabel(label), GitCommandExecutor::Result::ProcessError);
    QCOMPARE(executor.calls().size(), 1);
}

void TestGitRefResolver::testSpawnFailureOnHashQuery()
{
    FakeGitCommandExecutor executor;
    executor.setReply(FakeGitCommands::tags(), GitCommandExecutor::Result::Success, "");
    executor.setReply(FakeGitCommands::shortHash(), GitCommandExecutor::Result::ProcessError);
    GitRefResolver resolver(&executor, "/tmp/repo");

    QString label;
    QCOMPARE(resolver.resolveLabel(label), GitCommandExecutor::Result::ProcessError);
}

void TestGitRefResolver::testLabelFromTags()
{
    QCOMPARE(GitRefResolver::labelFromTags(""), QString());
    QCOMPARE(GitRefResolver::labelFromTags("\n\n"), QString());
    QCOMPARE(GitRefResolver::labelFromTags("release-1\n"), QString("release-1"));
    QCOMPARE(GitRefResolver::labelFromTags("  v3  \n v2 \n"), QString("v3+"));
}

QTEST_MAIN(TestGitRefResolver)
#include "test-git-ref-resolver.moc"
