/**
 * @file ConfigLoader.cpp
 * @brief JSON engine configuration loading
 * @author Vigil Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Vigil Security. All rights reserved.
 */

#include <Vigil/Core/Config.hpp>
#include <nlohmann/json.hpp>

#include <unistd.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <stdlib.h>

namespace Vigil::Config {

using json = nlohmann::json;

namespace {

// ============================================================================
// Field Readers
// ============================================================================

VoidResult readBool(const json& object, const char* key, bool& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return VoidResult::Success();
    }
    if (!it->is_boolean()) {
        return ErrorCode::InvalidFieldType;
    }
    out = it->get<bool>();
    return VoidResult::Success();
}

VoidResult readString(const json& object, const char* key, std::string& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return VoidResult::Success();
    }
    if (!it->is_string()) {
        return ErrorCode::InvalidFieldType;
    }
    out = it->get<std::string>();
    return VoidResult::Success();
}

VoidResult readUnsigned(const json& object, const char* key, uint64_t& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return VoidResult::Success();
    }
    if (!it->is_number_integer()) {
        return ErrorCode::InvalidFieldType;
    }
    if (it->is_number_unsigned()) {
        out = it->get<uint64_t>();
        return VoidResult::Success();
    }
    if (it->get<int64_t>() < 0) {
        return ErrorCode::InvalidFieldValue;
    }
    out = static_cast<uint64_t>(it->get<int64_t>());
    return VoidResult::Success();
}

VoidResult readPositive(const json& object, const char* key, size_t& out) {
    uint64_t value = out;
    VIGIL_TRY(readUnsigned(object, key, value));
    if (value == 0) {
        return ErrorCode::InvalidFieldValue;
    }
    out = static_cast<size_t>(value);
    return VoidResult::Success();
}

/// Null when absent, InvalidFieldType when present but not an object
Result<const json*> section(const json& root, const char* key) {
    auto it = root.find(key);
    if (it == root.end()) {
        return static_cast<const json*>(nullptr);
    }
    if (!it->is_object()) {
        return ErrorCode::InvalidFieldType;
    }
    return &*it;
}

// ============================================================================
// Sections
// ============================================================================

VoidResult parseLogging(const json& object, LoggingConfig& config) {
    std::string level;
    VIGIL_TRY(readString(object, "level", level));
    if (!level.empty() && !Core::ParseLogLevel(level, config.level)) {
        return ErrorCode::InvalidFieldValue;
    }

    VIGIL_TRY(readBool(object, "console", config.console));
    VIGIL_TRY(readString(object, "file", config.file));
    VIGIL_TRY(readPositive(object, "max_file_size_mb", config.maxFileSizeMB));
    return VoidResult::Success();
}

VoidResult parseOracleFlags(const json& object, OracleConfig& config) {
    VIGIL_TRY(readBool(object, "bool_judgement", config.boolJudgement));
    VIGIL_TRY(readBool(object, "infinite_loop", config.infiniteLoop));
    VIGIL_TRY(readBool(object, "precision_loss", config.precisionLoss));
    VIGIL_TRY(readBool(object, "type_conversion", config.typeConversion));
    VIGIL_TRY(readBool(object, "overflow", config.overflow));
    VIGIL_TRY(readBool(object, "typed_bug", config.typedBug));
    return VoidResult::Success();
}

VoidResult parseTypedBug(const json& object, OracleConfig& config) {
    std::string mode;
    VIGIL_TRY(readString(object, "mode", mode));
    if (mode == "abort_code") {
        config.typedBugMode = TypedBugMode::AbortCode;
    } else if (mode == "event") {
        config.typedBugMode = TypedBugMode::Event;
    } else if (!mode.empty()) {
        return ErrorCode::InvalidFieldValue;
    }

    VIGIL_TRY(readUnsigned(object, "sentinel_abort_code", config.sentinelAbortCode));
    VIGIL_TRY(readString(object, "marker_module", config.markerModule));
    VIGIL_TRY(readString(object, "marker_event", config.markerEvent));
    if (config.markerModule.empty() || config.markerEvent.empty()) {
        return ErrorCode::InvalidFieldValue;
    }
    return VoidResult::Success();
}

Result<EngineConfig> parseEngineConfig(const json& root) {
    if (!root.is_object()) {
        return ErrorCode::InvalidFieldType;
    }

    EngineConfig config;

    const json* logging = nullptr;
    VIGIL_TRY_ASSIGN(logging, section(root, "logging"));
    if (logging) {
        VIGIL_TRY(parseLogging(*logging, config.logging));
    }

    const json* oracles = nullptr;
    VIGIL_TRY_ASSIGN(oracles, section(root, "oracles"));
    if (oracles) {
        VIGIL_TRY(parseOracleFlags(*oracles, config.oracles));
    }

    VIGIL_TRY(readBool(root, "disable_defects", config.oracles.disableDefects));
    VIGIL_TRY(readPositive(root, "loop_threshold", config.oracles.loopThreshold));
    VIGIL_TRY(readPositive(root, "formula_node_cap", config.oracles.formulaNodeCap));

    const json* typedBug = nullptr;
    VIGIL_TRY_ASSIGN(typedBug, section(root, "typed_bug"));
    if (typedBug) {
        VIGIL_TRY(parseTypedBug(*typedBug, config.oracles));
    }

    return config;
}

} // namespace

// ============================================================================
// Loader
// ============================================================================

class ConfigLoader::Impl {
public:
    Options options;

    explicit Impl(const Options& opts) : options(opts) {}

    Result<std::string> canonicalizePath(const std::string& path) {
        char* resolved = realpath(path.c_str(), nullptr);
        if (!resolved) {
            return ErrorCode::InvalidPath;
        }
        std::string result(resolved);
        free(resolved);
        return result;
    }

    Result<bool> isPathAllowed(const std::string& canonicalPath) {
        if (options.allowed_directory.empty()) {
            return true;
        }

        auto allowedResult = canonicalizePath(options.allowed_directory);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }

        std::string allowed = allowedResult.value();
        if (allowed.back() != '/') {
            allowed.push_back('/');
        }
        return canonicalPath.compare(0, allowed.length(), allowed) == 0;
    }

    Result<std::string> readFileSecurely(const std::string& path) {
        auto canonResult = canonicalizePath(path);
        if (canonResult.isFailure()) {
            return canonResult.error() == ErrorCode::InvalidPath && access(path.c_str(), F_OK) != 0
                ? ErrorCode::FileNotFound
                : canonResult.error();
        }
        const std::string& canonPath = canonResult.value();

        auto allowedResult = isPathAllowed(canonPath);
        if (allowedResult.isFailure()) {
            return allowedResult.error();
        }
        if (!allowedResult.value()) {
            return ErrorCode::AccessDenied;
        }

        int fd = open(canonPath.c_str(), O_RDONLY | O_NOFOLLOW);
        if (fd < 0) {
            return ErrorCode::FileNotFound;
        }

        // Size from the open descriptor, not the path
        struct stat st;
        if (fstat(fd, &st) < 0) {
            close(fd);
            return ErrorCode::IOError;
        }

        if (static_cast<size_t>(st.st_size) > options.max_file_size) {
            close(fd);
            return ErrorCode::FileTooLarge;
        }

        std::string data(static_cast<size_t>(st.st_size), '\0');
        ssize_t bytesRead = read(fd, data.data(), data.size());
        close(fd);

        if (bytesRead != static_cast<ssize_t>(data.size())) {
            return ErrorCode::IOError;
        }
        return data;
    }
};

ConfigLoader::ConfigLoader()
    : m_impl(std::make_unique<Impl>(Options{})) {}

ConfigLoader::ConfigLoader(const Options& options)
    : m_impl(std::make_unique<Impl>(options)) {}

ConfigLoader::~ConfigLoader() = default;

Result<EngineConfig> ConfigLoader::load(const std::string& path) {
    auto dataResult = m_impl->readFileSecurely(path);
    if (dataResult.isFailure()) {
        VIGIL_LOG_WARNING_F("Cannot read config %s: %s", path.c_str(),
                            getErrorMessage(dataResult.error()).data());
        return dataResult.error();
    }
    return loadFromString(dataResult.value());
}

Result<EngineConfig> ConfigLoader::loadFromString(const std::string& text) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::exception& e) {
        VIGIL_LOG_WARNING_F("Config parse failed: %s", e.what());
        return ErrorCode::JsonParseFailed;
    }

    auto config = parseEngineConfig(root);
    if (config.isFailure()) {
        VIGIL_LOG_WARNING_F("Config rejected: %s", getErrorMessage(config.error()).data());
    }
    return config;
}

// ============================================================================
// Logging
// ============================================================================

VoidResult applyLoggingConfig(const LoggingConfig& config) {
    Core::LogOutput outputs = Core::LogOutput::None;
    if (config.console) {
        outputs = outputs | Core::LogOutput::Console;
    }
    if (!config.file.empty()) {
        outputs = outputs | Core::LogOutput::File;
    }

    // Replaces any earlier configuration
    Core::Logger::Instance().Shutdown();
    if (!Core::Logger::Instance().Initialize(config.level, outputs, config.file,
                                             config.maxFileSizeMB)) {
        return ErrorCode::ConfigInvalid;
    }
    return VoidResult::Success();
}

} // namespace Vigil::Config
