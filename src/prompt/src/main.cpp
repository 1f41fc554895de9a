#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QLoggingCategory>
#include <QTextStream>
#include <QDebug>

#include "git-command-executor.h"
#include "git-prompt-service.h"
#include "git-prompt-formatter.h"

#include <cstdio>

int main(int argc, char *argv[])
{
    // 提示符每次渲染都会调用，默认只输出警告及以上级别；QT_LOGGING_RULES可覆盖
    QLoggingCategory::setFilterRules(QStringLiteral("*.debug=false\n*.info=false"));

    QCoreApplication app(argc, argv);
    app.setApplicationName("dde-git-prompt");
    app.setApplicationVersion(DDE_GIT_PROMPT_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Print a one-line git working tree summary for shell prompts");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("directory", "Working directory to inspect (default: current directory)", "[directory]");

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    const QString directory = positional.isEmpty() ? QDir::currentPath()
                                                   : QDir(positional.first()).absolutePath();

    qDebug() << "Git prompt directory:" << directory;

    GitCommandExecutor executor;
    GitPromptService service(&executor, directory);

    GitPromptSummary summary;
    switch (service.collect(summary)) {
    case GitPromptService::Outcome::Ready:
        break;
    case GitPromptService::Outcome::NotRepository:
        return 0;
    case GitPromptService::Outcome::Failed:
        return 1;
    }

    QTextStream out(stdout);
    out << GitPromptFormatter::format(summary);
    out.flush();

    return 0;
}
