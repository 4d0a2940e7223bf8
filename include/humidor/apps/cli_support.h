#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_map>

#include "humidor/core/numeric_input.h"

namespace humidor::apps {

using ArgMap = std::unordered_map<std::string, std::string>;

struct CommandLine {
    std::string command;
    ArgMap args;
};

// `prog <command> --key value --flag --key=value`. The first bare token is the
// command; a flag with no value is stored as "true".
inline CommandLine ParseCommandLine(int argc, char** argv) {
    CommandLine parsed;
    for (int i = 1; i < argc; ++i) {
        std::string token = argv[i];
        if (token.rfind("--", 0) != 0) {
            if (parsed.command.empty()) {
                parsed.command = token;
            }
            continue;
        }
        token = token.substr(2);
        const auto eq_pos = token.find('=');
        if (eq_pos != std::string::npos) {
            parsed.args[token.substr(0, eq_pos)] = token.substr(eq_pos + 1);
            continue;
        }
        if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
            parsed.args[token] = argv[++i];
            continue;
        }
        parsed.args[token] = "true";
    }
    return parsed;
}

inline std::string GetArg(const ArgMap& args,
                          const std::string& key,
                          const std::string& fallback = "") {
    const auto it = args.find(key);
    return it == args.end() ? fallback : it->second;
}

inline bool HasArg(const ArgMap& args, const std::string& key) {
    return args.find(key) != args.end();
}

inline bool GetCountArg(const ArgMap& args,
                        const std::string& key,
                        std::int32_t* out,
                        std::string* error) {
    const auto it = args.find(key);
    if (it == args.end()) {
        if (error != nullptr) {
            *error = "missing --" + key;
        }
        return false;
    }
    std::string parse_error;
    if (!ParseCountText(it->second, out, &parse_error)) {
        if (error != nullptr) {
            *error = "--" + key + ": " + parse_error;
        }
        return false;
    }
    return true;
}

inline bool GetDecimalArg(const ArgMap& args,
                          const std::string& key,
                          double fallback,
                          double* out,
                          std::string* error) {
    const auto it = args.find(key);
    if (it == args.end()) {
        *out = fallback;
        return true;
    }
    std::string parse_error;
    if (!ParseDecimalText(it->second, out, &parse_error)) {
        if (error != nullptr) {
            *error = "--" + key + ": " + parse_error;
        }
        return false;
    }
    return true;
}

inline bool WriteTextFile(const std::string& path, const std::string& content, std::string* error) {
    if (path.empty()) {
        return true;
    }
    try {
        const std::filesystem::path file_path(path);
        if (!file_path.parent_path().empty()) {
            std::filesystem::create_directories(file_path.parent_path());
        }
        std::ofstream out(path, std::ios::out | std::ios::trunc);
        if (!out.is_open()) {
            if (error != nullptr) {
                *error = "unable to open output file: " + path;
            }
            return false;
        }
        out << content;
        return true;
    } catch (const std::exception& ex) {
        if (error != nullptr) {
            *error = ex.what();
        }
        return false;
    }
}

}  // namespace humidor::apps
