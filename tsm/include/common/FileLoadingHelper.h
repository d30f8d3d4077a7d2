#pragma once

#include "common/Logger.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace TSM {

/**
 * @brief File I/O shared by the compiler front end, the emitters and the table runtime
 */
class FileLoadingHelper {
public:
    /**
     * @brief Normalize file path by removing a "file:" URI prefix
     */
    static std::string normalizePath(const std::string &srcPath) {
        if (srcPath.find("file://") == 0) {
            return srcPath.substr(7);
        } else if (srcPath.find("file:") == 0) {
            return srcPath.substr(5);
        }
        return srcPath;
    }

    /**
     * @brief Load file content from disk
     *
     * Content is returned verbatim; diagnostics refer to line and column
     * positions in the original text.
     *
     * @param filePath Path to file
     * @param content Output parameter for file content
     * @return true if file loaded successfully, false on error
     */
    static bool loadFileContent(const std::string &filePath, std::string &content) {
        std::ifstream file(normalizePath(filePath), std::ios::binary);
        if (!file.is_open()) {
            LOG_ERROR("FileLoadingHelper: Failed to open file: {}", filePath);
            return false;
        }

        std::stringstream buffer;
        buffer << file.rdbuf();
        content = buffer.str();
        return true;
    }

    /**
     * @brief Write content to a file, creating parent directories as needed
     */
    static bool writeFileContent(const std::string &filePath, const std::string &content) {
        std::filesystem::path path(filePath);
        std::error_code ec;
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                LOG_ERROR("FileLoadingHelper: Cannot create directory '{}': {}", path.parent_path().string(),
                          ec.message());
                return false;
            }
        }

        std::ofstream file(filePath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("FileLoadingHelper: Failed to open file for writing: {}", filePath);
            return false;
        }

        file << content;
        file.close();
        if (!file) {
            LOG_ERROR("FileLoadingHelper: Failed to write file: {}", filePath);
            return false;
        }

        LOG_DEBUG("FileLoadingHelper: Wrote {} bytes to {}", content.size(), filePath);
        return true;
    }
};

}  // namespace TSM
