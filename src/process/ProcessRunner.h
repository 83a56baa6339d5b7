#pragma once
#include <chrono>
#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

struct ProcessResult {
    std::string stdoutText;
    std::string stderrText;
    int exitCode = -1;
};

/**
 * @brief 命令执行接口
 *
 * workingDirectory 必须是 PathResolver 已校验过的目录; 执行器本身不做沙箱检查。
 */
class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    /**
     * @brief 执行 command args..., 等待结束或超时
     * @return 标准输出、标准错误与退出码 (非零退出码不视为异常)
     * @throws ExecutionFailure 进程无法启动
     * @throws TimeoutError 超时; 子进程已被终止, 异常中带有已收集的输出
     */
    virtual ProcessResult run(const std::string& command,
                              const std::vector<std::string>& args,
                              const fs::path& workingDirectory,
                              std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief POSIX 实现: fork + execvp, stdout/stderr 分别走管道
 *
 * 子进程在独立进程组中运行, 超时先对整个进程组发 SIGTERM,
 * 宽限期后仍未退出则 SIGKILL。
 */
class ProcessRunner : public IProcessRunner {
public:
    /// 超时上限 (24 小时); 更大的值在 run() 中按此截断
    static constexpr std::chrono::milliseconds kMaxTimeout{24LL * 60 * 60 * 1000};

    explicit ProcessRunner(std::chrono::milliseconds killGrace = std::chrono::milliseconds(2000));

    ProcessResult run(const std::string& command,
                      const std::vector<std::string>& args,
                      const fs::path& workingDirectory,
                      std::chrono::milliseconds timeout) override;

private:
    std::chrono::milliseconds killGrace;

    int terminate(int pid);
};

/**
 * @brief 非零退出码 → ExecutionFailure (消息中带 stderr, 没有则带 stdout)
 */
void requireSuccess(const ProcessResult& result, const std::string& what);
