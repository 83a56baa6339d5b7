#pragma once
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Warden 错误分类
 *
 * 所有沙箱、编辑、进程执行相关的失败都以 WardenError 子类抛出,
 * 由 ToolRegistry 统一转换为结构化的工具结果。
 * 只有启动阶段的 ConfigError 会终止进程。
 */
class WardenError : public std::runtime_error {
public:
    explicit WardenError(const std::string& message) : std::runtime_error(message) {}

    /**
     * @brief 稳定的错误类型标识 (写入结果的 error_type 字段)
     */
    virtual const char* kind() const noexcept = 0;
};

// 配置的边界目录不存在或不是目录, 配置文件无法解析
class ConfigError : public WardenError {
public:
    using WardenError::WardenError;
    const char* kind() const noexcept override { return "config_error"; }
};

// 请求路径 (或其 realpath / 父目录 realpath) 不在任何边界目录内
class AccessDenied : public WardenError {
public:
    using WardenError::WardenError;
    const char* kind() const noexcept override { return "access_denied"; }
};

class NotFound : public WardenError {
public:
    using WardenError::WardenError;
    const char* kind() const noexcept override { return "not_found"; }
};

class InvalidArguments : public WardenError {
public:
    using WardenError::WardenError;
    const char* kind() const noexcept override { return "invalid_arguments"; }
};

/**
 * @brief 编辑的 oldText 既无法精确匹配, 也无法按行窗口匹配
 */
class EditConflict : public WardenError {
public:
    EditConflict(const std::string& message, std::string oldText)
        : WardenError(message), unmatched(std::move(oldText)) {}

    const char* kind() const noexcept override { return "edit_conflict"; }
    const std::string& oldText() const { return unmatched; }

private:
    std::string unmatched;
};

/**
 * @brief 命令无法启动, 或以非零退出码结束
 */
class ExecutionFailure : public WardenError {
public:
    ExecutionFailure(const std::string& message, std::string out = "", std::string err = "", int code = -1)
        : WardenError(message), stdoutText(std::move(out)), stderrText(std::move(err)), exitCode(code) {}

    const char* kind() const noexcept override { return "execution_failure"; }
    const std::string& output() const { return stdoutText; }
    const std::string& errorOutput() const { return stderrText; }
    int code() const { return exitCode; }

private:
    std::string stdoutText;
    std::string stderrText;
    int exitCode;
};

/**
 * @brief 命令超时。子进程已被强制终止, 已收集到的输出随异常一起返回。
 */
class TimeoutError : public WardenError {
public:
    TimeoutError(const std::string& message, std::string partialOut, std::string partialErr)
        : WardenError(message), stdoutText(std::move(partialOut)), stderrText(std::move(partialErr)) {}

    const char* kind() const noexcept override { return "timeout"; }
    const std::string& partialOutput() const { return stdoutText; }
    const std::string& partialErrorOutput() const { return stderrText; }

private:
    std::string stdoutText;
    std::string stderrText;
};
