#pragma once

#include <QProcess>
#include <QString>
#include <QStringList>

/**
 * @brief Git命令执行器 - 统一Git命令执行和结果映射
 *
 * 同步执行git子进程，收集标准输出和错误输出，并将进程状态映射为结果码。
 * executeCommand为虚函数，测试中可以用脚本化的实现替换真实进程。
 */
class GitCommandExecutor
{
public:
    /**
     * @brief Git命令执行结果
     */
    enum class Result {
        Success,        ///< 命令执行成功（退出码为0）
        CommandError,   ///< Git命令返回非零退出码或异常退出
        ParseError,     ///< 命令参数无效
        PathError,      ///< 工作目录不存在
        ProcessError    ///< 进程无法启动
    };

    /**
     * @brief Git命令结构体
     */
    struct GitCommand {
        QString command;           ///< 命令名称（用于日志）
        QStringList arguments;     ///< Git命令参数
        QString workingDirectory;  ///< 工作目录
    };

    GitCommandExecutor() = default;
    virtual ~GitCommandExecutor() = default;

    /**
     * @brief 执行Git命令并等待其结束
     * @param cmd Git命令结构
     * @param output 标准输出（无论退出码如何都会填充）
     * @param error 错误输出
     * @return 执行结果
     */
    virtual Result executeCommand(const GitCommand &cmd, QString &output, QString &error);

    /**
     * @brief 结果码的可读名称，用于日志
     */
    static QString resultName(Result result);

private:
    void setupProcessEnvironment(QProcess *process);
    Result processToResult(int exitCode, QProcess::ExitStatus exitStatus);
};
