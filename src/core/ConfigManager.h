#pragma once
#include <string>
#include <vector>
#include <fstream>
#include <iterator>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/Errors.h"
#include "process/ProcessRunner.h"
#include "sandbox/BoundarySet.h"

struct Config {
    struct Boundary {
        // 为空时使用工作目录模式 (启动时的当前目录为唯一边界)
        std::vector<std::string> directories;
    } boundary;

    struct Process {
        long long defaultTimeoutMs = 30000;
        long long killGraceMs = 2000;
    } process;

    struct Search {
        int grepMaxResults = 100;
        int codebaseMaxResults = 50;
    } search;

    struct Logging {
        std::string file = "warden.log";  // 空字符串: 不写日志文件
        bool debug = false;
    } logging;

    BoundarySet::Source boundarySource() const {
        if (boundary.directories.empty()) {
            return BoundarySet::WorkingDirectory{""};
        }
        return BoundarySet::ExplicitRoots{boundary.directories};
    }

    static Config load(const std::string& pathStr) {
        std::filesystem::path path = std::filesystem::u8path(pathStr);
        std::ifstream f(path);
        if (!f.is_open()) {
            throw ConfigError("Could not open config file: " + pathStr);
        }

        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        f.close();

        nlohmann::json j;
        try {
            j = nlohmann::json::parse(content);
        } catch (const nlohmann::json::parse_error& e) {
            throw ConfigError("JSON Parse Error in " + path.string() + ": " + e.what());
        }
        return fromJson(j, path.string());
    }

    static Config fromJson(const nlohmann::json& j, const std::string& source = "<config>") {
        if (!j.is_object()) {
            throw ConfigError("Config root must be a JSON object: " + source);
        }

        Config cfg;
        try {
            if (j.contains("boundary")) {
                const auto& b = j.at("boundary");
                cfg.boundary.directories = b.value("directories", std::vector<std::string>{});
            }
            if (j.contains("process")) {
                const auto& p = j.at("process");
                cfg.process.defaultTimeoutMs = p.value("default_timeout_ms", cfg.process.defaultTimeoutMs);
                cfg.process.killGraceMs = p.value("kill_grace_ms", cfg.process.killGraceMs);
            }
            if (j.contains("search")) {
                const auto& s = j.at("search");
                cfg.search.grepMaxResults = s.value("grep_max_results", cfg.search.grepMaxResults);
                cfg.search.codebaseMaxResults = s.value("codebase_max_results", cfg.search.codebaseMaxResults);
            }
            if (j.contains("logging")) {
                const auto& l = j.at("logging");
                cfg.logging.file = l.value("file", cfg.logging.file);
                cfg.logging.debug = l.value("debug", cfg.logging.debug);
            }
        } catch (const nlohmann::json::exception& e) {
            throw ConfigError("Invalid config in " + source + ": " + e.what());
        }

        if (cfg.process.defaultTimeoutMs <= 0) {
            throw ConfigError("process.default_timeout_ms must be positive");
        }
        if (cfg.process.defaultTimeoutMs > ProcessRunner::kMaxTimeout.count()) {
            throw ConfigError("process.default_timeout_ms must not exceed " +
                              std::to_string(ProcessRunner::kMaxTimeout.count()));
        }
        if (cfg.process.killGraceMs < 0 || cfg.process.killGraceMs > ProcessRunner::kMaxTimeout.count()) {
            throw ConfigError("process.kill_grace_ms must be between 0 and " +
                              std::to_string(ProcessRunner::kMaxTimeout.count()));
        }
        if (cfg.search.grepMaxResults <= 0 || cfg.search.codebaseMaxResults <= 0) {
            throw ConfigError("search limits must be positive");
        }
        return cfg;
    }
};
